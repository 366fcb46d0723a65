#ifndef SCREENSHOT_WRITER_H
#define SCREENSHOT_WRITER_H

#include <opencv2/core.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "logger.h"

/**
 * @brief Persists alert frames to durable storage
 */
class ScreenshotWriter {
public:
    virtual ~ScreenshotWriter() = default;

    /**
     * @brief Save a frame
     * @param frame Frame to save
     * @param timestamp Alert acceptance time, used to name the file
     * @return Path of the written file, or empty on failure
     */
    virtual std::optional<std::string> save(const cv::Mat& frame,
                                            std::chrono::system_clock::time_point timestamp) = 0;
};

/**
 * @brief Writer used when screenshots are disabled; every save fails
 */
class NullScreenshotWriter : public ScreenshotWriter {
public:
    std::optional<std::string> save(const cv::Mat&, std::chrono::system_clock::time_point) override {
        return std::nullopt;
    }
};

/**
 * @brief Writes alert_<YYYYMMDD_HHMMSS>.<ext> image files with OpenCV
 *
 * The output directory is created on first use.
 */
class ImageScreenshotWriter : public ScreenshotWriter {
public:
    /**
     * @brief Constructor
     * @param outputDir Directory for screenshots
     * @param extension Image format extension understood by cv::imwrite
     * @param logger Logger for write failures
     */
    ImageScreenshotWriter(const std::string& outputDir,
                          const std::string& extension = "jpg",
                          std::shared_ptr<Logger> logger = nullptr);

    std::optional<std::string> save(const cv::Mat& frame,
                                    std::chrono::system_clock::time_point timestamp) override;

    const std::string& getOutputDir() const { return outputDir; }

    /**
     * @brief File name for a timestamp, without collision handling
     */
    std::string fileNameFor(std::chrono::system_clock::time_point timestamp) const;

private:
    bool ensureOutputDir();
    std::string uniquePath(std::chrono::system_clock::time_point timestamp) const;

    std::string outputDir;
    std::string extension;
    std::shared_ptr<Logger> logger;
    bool dirReady;
    std::mutex writeMutex;
};

#endif // SCREENSHOT_WRITER_H
