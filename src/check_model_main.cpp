#include "logger.h"
#include "model.h"
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    std::string modelPath = argc > 1 ? argv[1] : "models/weights/best.tflite";
    std::string labelsPath = argc > 2 ? argv[2] : "models/weights/labels.txt";

    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [model] [labels]" << std::endl;
        return 1;
    }

    auto logger = std::make_shared<Logger>(Logger::Level::Warning);

    try {
        Model model(modelPath, labelsPath, false, logger);

        std::cout << "Model: " << model.getModelPath() << std::endl;
        std::cout << "Classes:" << std::endl;
        for (const auto& entry : model.getLabels()) {
            std::cout << "  " << entry.first << ": " << entry.second << std::endl;
        }
        std::cout << "Input: " << model.getInputWidth() << "x" << model.getInputHeight()
                  << "x" << model.getInputChannels() << std::endl;
        std::cout << "Accelerator: " << (model.isUsingTPU() ? "Edge TPU" : "CPU") << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
