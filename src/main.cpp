#include "config.h"
#include "terminal_detector.h"
#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    try {
        TerminalDetector detector(config);

        if (!detector.initialize()) {
            std::cerr << "Failed to initialize detector" << std::endl;
            return 1;
        }

        return detector.run() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "Error: unknown exception" << std::endl;
        return 1;
    }
}
