#include "screenshot_writer.h"
#include "utils.h"

#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

ImageScreenshotWriter::ImageScreenshotWriter(const std::string& outputDir,
                                             const std::string& extension,
                                             std::shared_ptr<Logger> logger)
    : outputDir(outputDir.empty() ? "." : outputDir),
      extension(extension.empty() ? "jpg" : extension),
      logger(logger ? logger : std::make_shared<Logger>()),
      dirReady(false) {
    // Accept ".png" as well as "png"
    if (this->extension.front() == '.') {
        this->extension.erase(0, 1);
    }
}

std::string ImageScreenshotWriter::fileNameFor(std::chrono::system_clock::time_point timestamp) const {
    return "alert_" + formatTimestamp(timestamp, "%Y%m%d_%H%M%S") + "." + extension;
}

bool ImageScreenshotWriter::ensureOutputDir() {
    if (dirReady) {
        return true;
    }

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec || !fs::is_directory(outputDir, ec)) {
        logger->error("Failed to create alert folder " + outputDir +
                      (ec ? ": " + ec.message() : std::string()));
        return false;
    }

    logger->info("Alert folder: " + fs::absolute(outputDir, ec).string());
    dirReady = true;
    return true;
}

std::string ImageScreenshotWriter::uniquePath(std::chrono::system_clock::time_point timestamp) const {
    fs::path dir(outputDir);
    fs::path candidate = dir / fileNameFor(timestamp);

    // Sub-second cooldowns can produce two alerts in the same second
    std::string stem = candidate.stem().string();
    std::error_code ec;
    for (int suffix = 1; fs::exists(candidate, ec) && suffix < 1000; ++suffix) {
        candidate = dir / (stem + "_" + std::to_string(suffix) + "." + extension);
    }
    return candidate.string();
}

std::optional<std::string> ImageScreenshotWriter::save(const cv::Mat& frame,
                                                       std::chrono::system_clock::time_point timestamp) {
    if (frame.empty()) {
        logger->error("Refusing to save an empty frame");
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(writeMutex);
    if (!ensureOutputDir()) {
        return std::nullopt;
    }

    std::string path = uniquePath(timestamp);
    try {
        if (!cv::imwrite(path, frame)) {
            logger->error("Failed to save screenshot to " + path);
            return std::nullopt;
        }
    } catch (const cv::Exception& e) {
        logger->error("Error saving screenshot: " + std::string(e.what()));
        return std::nullopt;
    }

    logger->info("Screenshot saved: " + path);
    return path;
}
