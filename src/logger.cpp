#include "logger.h"
#include "utils.h"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

Logger::Logger(Level minLevel, const std::string& logDir)
    : minLevel(minLevel) {
    if (logDir.empty()) {
        return;
    }

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
        std::cerr << "Failed to create log directory " << logDir << ": " << ec.message() << std::endl;
        return;
    }

    logFile = (fs::path(logDir) / ("detection_log_" +
               formatTimestamp(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S") + ".log")).string();
    logStream.open(logFile, std::ios::out | std::ios::app);
    if (!logStream.is_open()) {
        std::cerr << "Could not open log file: " << logFile << std::endl;
        logFile.clear();
    }
}

Logger::~Logger() {
    if (logStream.is_open()) {
        logStream.close();
    }
}

void Logger::log(Level level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::string logEntry = formatTimestamp(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S") +
                           " - " + levelName(level) + " - " + message;

    std::lock_guard<std::mutex> lock(logMutex);
    if (level >= Level::Warning) {
        std::cerr << logEntry << std::endl;
    } else {
        std::cout << logEntry << std::endl;
    }

    if (logStream.is_open()) {
        logStream << logEntry << std::endl;
    }
}

void Logger::logDetection(const std::string& label, float score, const std::string& imagePath) {
    std::ostringstream ss;
    ss << "Detected: " << label << " (Confidence: " << std::fixed << std::setprecision(2)
       << score * 100.0f << "%)";
    if (!imagePath.empty()) {
        ss << " - Image saved: " << imagePath;
    }
    log(Level::Info, ss.str());
}

void Logger::logPerformance(double fps, double processingTime) {
    std::ostringstream ss;
    ss << "Performance: FPS: " << std::fixed << std::setprecision(1) << fps
       << ", Processing time: " << std::setprecision(3) << processingTime << "s";
    log(Level::Debug, ss.str());
}

Logger::Level Logger::parseLevel(const std::string& name) {
    std::string lower = toLower(name);

    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warning" || lower == "warn") return Level::Warning;
    if (lower == "error") return Level::Error;
    throw std::invalid_argument("Unknown log level: " + name);
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}
