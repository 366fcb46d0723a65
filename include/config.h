#ifndef CONFIG_H
#define CONFIG_H

#include <cstddef>
#include <string>

/**
 * @brief Application settings
 */
struct AppConfig {
    std::string source = "0";
    std::string modelPath = "models/weights/best.tflite";
    std::string labelsPath = "models/weights/labels.txt";
    float confidence = 0.90f;
    double cooldownSeconds = 5.0;
    std::string alertDir = "alerts";
    std::string soundFile = "assets/alert.wav";
    std::string playerCommand = "aplay -q";
    bool noSound = false;
    bool bell = false;
    bool noDisplay = false;
    bool forceCPU = false;
    std::string logDir;
    std::string logLevel = "info";
    size_t queueSize = 4;
    int fpsInterval = 30;
    int maxSourceErrors = 30;
    bool showHelp = false;
};

/**
 * @brief Apply SENTINEL_* environment variables on top of cfg
 * @throws std::invalid_argument for malformed numeric values
 */
void applyEnvironment(AppConfig& cfg);

/**
 * @brief Parse command line arguments
 *
 * Defaults come from AppConfig, then the environment, then the command line.
 * @throws std::invalid_argument for unknown options or invalid values
 */
AppConfig parseArgs(int argc, char* argv[]);

/**
 * @brief Print the command line help
 */
void printUsage(const char* programName);

#endif // CONFIG_H
