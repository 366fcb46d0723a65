#ifndef PIPELINE_H
#define PIPELINE_H

#include <opencv2/core.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "alert_manager.h"
#include "detector.h"
#include "frame_source.h"
#include "logger.h"
#include "result_queue.h"

enum class PipelineState {
    Idle,
    Running,
    Stopping
};

const char* pipelineStateName(PipelineState state);

/**
 * @brief Counters maintained by the detection loop
 */
struct PipelineStats {
    uint64_t framesProcessed = 0;
    uint64_t totalDetections = 0;
    uint64_t errorCount = 0;
    uint64_t droppedFrames = 0;
};

/**
 * @brief One processed frame, as handed to the presentation layer
 */
struct FrameUpdate {
    uint64_t frameIndex = 0;
    cv::Mat frame;
    std::vector<std::string> detections;
    std::vector<float> scores;
    bool hasDetection = false;
    std::optional<AlertRecord> alert;
};

/**
 * @brief Callbacks from the detection loop
 *
 * Invoked on the pipeline thread; implementations must return quickly and
 * must not call Pipeline::start or Pipeline::stop.
 */
class PipelineObserver {
public:
    virtual ~PipelineObserver() = default;

    /**
     * @brief A frame with detections, reported even if the result queue drops it
     */
    virtual void onDetection(const FrameUpdate&) {}
    virtual void onAlert(const AlertRecord&) {}
    virtual void onThroughput(double) {}

    /**
     * @brief The loop has ended
     * @param error Terminal error, empty when stopped on request
     */
    virtual void onFinished(const std::string&) {}
};

struct PipelineOptions {
    size_t resultQueueSize = 4;
    // Frames between throughput samples
    int throughputInterval = 30;
    // Consecutive transient read failures tolerated before giving up
    int maxConsecutiveSourceErrors = 30;
    std::chrono::milliseconds retryDelay{100};
};

/**
 * @brief Detection loop: reads frames, runs the detector and raises alerts
 *
 * Runs on its own thread. Results are published to a bounded queue that
 * drops the oldest update when the consumer falls behind, so the loop never
 * waits for the presentation layer.
 */
class Pipeline {
public:
    Pipeline(std::unique_ptr<FrameSource> source,
             std::shared_ptr<Detector> detector,
             std::shared_ptr<AlertManager> alertManager,
             PipelineOptions options = {},
             std::shared_ptr<Logger> logger = nullptr);

    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /**
     * @brief Open the frame source and start the loop thread
     * @return False if already running or the source cannot be opened
     */
    bool start();

    /**
     * @brief Ask the loop to stop and wait for the current iteration to finish
     */
    void stop();

    PipelineState getState() const { return state.load(); }
    bool isRunning() const { return state.load() == PipelineState::Running; }

    /**
     * @brief Take the next processed frame, waiting up to timeout
     */
    bool pollResult(FrameUpdate& update, std::chrono::milliseconds timeout);

    void setObserver(std::shared_ptr<PipelineObserver> observer);

    PipelineStats getStats() const;

    /**
     * @brief Zero the counters; frame indices restart at 1
     */
    void resetStats();

    /**
     * @brief Most recent throughput sample in frames per second
     */
    double getThroughput() const { return throughput.load(); }

    /**
     * @brief Terminal error of the last run, empty if it was stopped on request
     */
    std::string lastError() const;

    const std::string& sourceName() const { return sourceDescription; }

private:
    void run();
    bool readFrame(cv::Mat& frame, int& consecutiveErrors, std::string& error);
    DetectionResult runDetector(const cv::Mat& frame);
    void publish(FrameUpdate update);
    // Return to Idle after a failed start, keeping the reason as the last error
    void abortStart(const std::string& error);
    void sleepUnlessStopping(std::chrono::milliseconds delay);
    std::shared_ptr<PipelineObserver> currentObserver() const;

    std::unique_ptr<FrameSource> source;
    std::shared_ptr<Detector> detector;
    std::shared_ptr<AlertManager> alertManager;
    PipelineOptions options;
    std::shared_ptr<Logger> logger;
    std::string sourceDescription;

    std::atomic<PipelineState> state;
    std::thread worker;
    std::mutex controlMutex;

    ResultQueue<FrameUpdate> results;

    std::shared_ptr<PipelineObserver> observer;
    mutable std::mutex observerMutex;

    std::string terminalError;
    mutable std::mutex errorMutex;

    std::atomic<uint64_t> framesProcessed;
    std::atomic<uint64_t> totalDetections;
    std::atomic<uint64_t> errorCount;
    std::atomic<uint64_t> droppedFrames;
    std::atomic<double> throughput;
};

#endif // PIPELINE_H
