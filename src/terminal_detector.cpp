#include "terminal_detector.h"
#include "frame_source.h"
#include "notifier.h"
#include "screenshot_writer.h"
#include "utils.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

// Global flag for signal handling
static std::atomic<bool> g_running(true);

static void signalHandler(int) {
    g_running = false;
}

namespace {

const char* kWindowName = "SentinelShield - Weapon Detection";

std::mutex g_consoleMutex;

void printLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_consoleMutex);
    std::cout << line << std::endl;
}

}  // namespace

/**
 * @brief Prints pipeline events (alerts, throughput, termination)
 */
class TerminalDetector::Reporter : public PipelineObserver {
public:
    void attach(const Pipeline* pipeline) { this->pipeline = pipeline; }

    void onDetection(const FrameUpdate& update) override {
        std::ostringstream ss;
        ss << "[" << formatTimestamp(std::chrono::system_clock::now(), "%H:%M:%S") << "] WEAPON DETECTED!";
        for (size_t i = 0; i < update.detections.size(); ++i) {
            float score = i < update.scores.size() ? update.scores[i] : 0.0f;
            ss << std::endl << "  - " << toUpper(update.detections[i]) << ": " << formatPercent(score);
        }
        printLine(ss.str());
    }

    void onAlert(const AlertRecord& alert) override {
        ++alertsRaised;
        if (alert.screenshotPath) {
            printLine("Screenshot saved: " + *alert.screenshotPath);
        } else {
            printLine("Alert raised at " + alert.formattedTime() + " (no screenshot)");
        }
    }

    void onThroughput(double fps) override {
        if (!pipeline) {
            return;
        }
        PipelineStats stats = pipeline->getStats();
        std::ostringstream ss;
        ss << "[FPS: " << std::fixed << std::setprecision(1) << fps << "] Frames: "
           << stats.framesProcessed << " | Detections: " << stats.totalDetections;
        printLine(ss.str());
    }

    void onFinished(const std::string& error) override {
        if (!error.empty()) {
            printLine("Detection ended: " + error);
        }
    }

    uint64_t getAlertsRaised() const { return alertsRaised.load(); }
    void resetAlertsRaised() { alertsRaised = 0; }

private:
    const Pipeline* pipeline = nullptr;
    std::atomic<uint64_t> alertsRaised{0};
};

TerminalDetector::TerminalDetector(const AppConfig& config)
    : config(config), displayAvailable(false), liveSource(false) {
    logger = std::make_shared<Logger>(Logger::parseLevel(config.logLevel), config.logDir);

    // Register signal handler
    g_running = true;
    std::signal(SIGINT, signalHandler);
}

TerminalDetector::~TerminalDetector() {
    if (pipeline) {
        pipeline->stop();
    }
}

bool TerminalDetector::initialize() {
    displayAvailable = !config.noDisplay && checkDisplayAvailability();
    if (!config.noDisplay && !displayAvailable) {
        logger->warning("Display requested but not available. Running without display.");
    }

    detector = std::make_shared<WeaponDetector>(config.modelPath, config.labelsPath,
                                                config.confidence, config.forceCPU, logger);

    std::shared_ptr<Notifier> notifier;
    if (config.noSound) {
        notifier = std::make_shared<NullNotifier>();
    } else if (config.bell) {
        notifier = std::make_shared<BellNotifier>();
    } else {
        notifier = std::make_shared<SoundNotifier>(config.soundFile, config.playerCommand, logger);
    }

    auto writer = std::make_shared<ImageScreenshotWriter>(config.alertDir, "jpg", logger);
    alertManager = std::make_shared<AlertManager>(config.cooldownSeconds, writer, notifier, logger);

    PipelineOptions options;
    options.resultQueueSize = config.queueSize;
    options.throughputInterval = config.fpsInterval;
    options.maxConsecutiveSourceErrors = config.maxSourceErrors;

    liveSource = VideoCaptureSource::isCameraIndex(config.source) ||
                 VideoCaptureSource::isStreamUrl(config.source);
    pipeline = std::make_unique<Pipeline>(std::make_unique<VideoCaptureSource>(config.source, logger),
                                          detector, alertManager, options, logger);

    reporter = std::make_shared<Reporter>();
    reporter->attach(pipeline.get());
    pipeline->setObserver(reporter);

    printBanner();

    if (!pipeline->start()) {
        return false;
    }
    startTime = std::chrono::steady_clock::now();
    return true;
}

bool TerminalDetector::run() {
    if (!pipeline) {
        logger->error("Detector not initialized");
        return false;
    }

    printLine("Press 'q' to quit, 's' to save a screenshot, 'r' to reset statistics");

    FPSCounter displayFps;
    bool running = true;

    while (running && g_running) {
        FrameUpdate update;
        if (!pipeline->pollResult(update, std::chrono::milliseconds(50))) {
            // Queue drained and the loop has ended
            if (!pipeline->isRunning()) {
                break;
            }
            continue;
        }

        if (displayAvailable) {
            displayFps.update();
            displayFps.drawFPS(update.frame);
            cv::putText(update.frame, detector->getDevice(), cv::Point(update.frame.cols - 100, 30),
                        cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 255, 0), 2);
            try {
                cv::imshow(kWindowName, update.frame);
                int key = cv::waitKey(1);
                if (!handleKey(key, update.frame)) {
                    running = false;
                }
            } catch (const cv::Exception& e) {
                logger->error("Display error: " + std::string(e.what()));
                displayAvailable = false;
            }
        }
    }

    if (!g_running) {
        printLine("Stopping detection...");
    }

    pipeline->stop();

    if (displayAvailable) {
        cv::destroyAllWindows();
    }

    printSummary();
    // The end of a video file is a normal way to finish
    return pipeline->lastError().empty() || !liveSource;
}

void TerminalDetector::printBanner() const {
    std::ostringstream ss;
    ss << "==================================================" << std::endl;
    ss << "Weapon Detection System Running" << std::endl;
    ss << "Source: " << pipeline->sourceName() << std::endl;
    ss << "Confidence: " << std::fixed << std::setprecision(2) << detector->getConfidenceThreshold() << std::endl;
    ss << "Device: " << detector->getDevice() << std::endl;
    ss << "Alert cooldown: " << std::setprecision(1) << alertManager->cooldownSeconds() << "s" << std::endl;
    ss << "Alert folder: " << config.alertDir << std::endl;
    ss << "Sound: " << (alertManager->hasSound() ? "enabled" : "disabled") << std::endl;
    if (!detector->isModelLoaded()) {
        ss << "WARNING: model not loaded, frames pass through without detection" << std::endl;
    }
    ss << "==================================================";
    printLine(ss.str());
}

void TerminalDetector::printSummary() const {
    double runtime = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    PipelineStats stats = pipeline->getStats();

    std::ostringstream ss;
    ss << "==================================================" << std::endl;
    ss << "Session Summary" << std::endl;
    ss << "Total frames: " << stats.framesProcessed << std::endl;
    ss << "Total detections: " << stats.totalDetections << std::endl;
    ss << "Alerts raised: " << reporter->getAlertsRaised() << std::endl;
    ss << "Errors: " << stats.errorCount << std::endl;
    ss << "Runtime: " << std::fixed << std::setprecision(1) << runtime << "s" << std::endl;
    if (runtime > 0.0 && stats.framesProcessed > 0) {
        ss << "Average FPS: " << std::setprecision(2) << stats.framesProcessed / runtime << std::endl;
    }
    ss << "==================================================";
    printLine(ss.str());

    logger->info("Session ended after " + std::to_string(stats.framesProcessed) + " frames");
}

bool TerminalDetector::handleKey(int key, const cv::Mat& frame) {
    if (key < 0) {
        return true;
    }
    key &= 0xFF;
    if (key == 'q' || key == 27) {  // 'q' or ESC
        return false;
    }
    if (key == 's') {
        saveManualScreenshot(frame);
    } else if (key == 'r') {
        pipeline->resetStats();
        reporter->resetAlertsRaised();
        startTime = std::chrono::steady_clock::now();
        printLine("Statistics reset");
    }
    return true;
}

void TerminalDetector::saveManualScreenshot(const cv::Mat& frame) {
    std::error_code ec;
    fs::create_directories(config.alertDir, ec);
    if (ec) {
        logger->error("Cannot create " + config.alertDir + ": " + ec.message());
        return;
    }

    std::string fileName = "manual_save_" +
                           formatTimestamp(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S") + ".jpg";
    std::string path = (fs::path(config.alertDir) / fileName).string();
    try {
        if (cv::imwrite(path, frame)) {
            printLine("Manual screenshot saved: " + path);
        } else {
            logger->error("Failed to save manual screenshot: " + path);
        }
    } catch (const cv::Exception& e) {
        logger->error("Failed to save manual screenshot: " + std::string(e.what()));
    }
}

bool TerminalDetector::checkDisplayAvailability() {
    if (!std::getenv("DISPLAY") && !std::getenv("WAYLAND_DISPLAY")) {
        return false;
    }

    try {
        cv::namedWindow(kWindowName, cv::WINDOW_NORMAL);
        return true;
    } catch (const cv::Exception& e) {
        logger->warning("Display backend failed: " + std::string(e.what()));
        return false;
    }
}
