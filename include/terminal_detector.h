#ifndef TERMINAL_DETECTOR_H
#define TERMINAL_DETECTOR_H

#include <opencv2/opencv.hpp>
#include <chrono>
#include <memory>
#include <string>
#include "alert_manager.h"
#include "config.h"
#include "logger.h"
#include "pipeline.h"
#include "weapon_detector.h"

/**
 * @brief Console front end for the weapon detection pipeline
 *
 * Prints detections, accepted alerts and throughput to the terminal and
 * optionally shows the annotated stream in an OpenCV window.
 */
class TerminalDetector {
public:
    explicit TerminalDetector(const AppConfig& config);
    ~TerminalDetector();

    /**
     * @brief Build the detector, alert manager and pipeline
     * @return False if the frame source cannot be opened
     */
    bool initialize();

    /**
     * @brief Run until the stream ends, the user quits or Ctrl+C is pressed
     * @return False if a camera or stream failed while running
     */
    bool run();

private:
    class Reporter;

    void printBanner() const;
    void printSummary() const;
    bool handleKey(int key, const cv::Mat& frame);
    void saveManualScreenshot(const cv::Mat& frame);
    bool checkDisplayAvailability();

    AppConfig config;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<WeaponDetector> detector;
    std::shared_ptr<AlertManager> alertManager;
    std::unique_ptr<Pipeline> pipeline;
    std::shared_ptr<Reporter> reporter;
    bool displayAvailable;
    bool liveSource;
    std::chrono::steady_clock::time_point startTime;
};

#endif // TERMINAL_DETECTOR_H
