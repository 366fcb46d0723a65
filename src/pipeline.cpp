#include "pipeline.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

const char* pipelineStateName(PipelineState state) {
    switch (state) {
        case PipelineState::Idle: return "Idle";
        case PipelineState::Running: return "Running";
        case PipelineState::Stopping: return "Stopping";
    }
    return "Idle";
}

Pipeline::Pipeline(std::unique_ptr<FrameSource> source,
                   std::shared_ptr<Detector> detector,
                   std::shared_ptr<AlertManager> alertManager,
                   PipelineOptions options,
                   std::shared_ptr<Logger> logger)
    : source(std::move(source)),
      detector(std::move(detector)),
      alertManager(std::move(alertManager)),
      options(options),
      logger(logger ? std::move(logger) : std::make_shared<Logger>()),
      state(PipelineState::Idle),
      results(options.resultQueueSize),
      framesProcessed(0),
      totalDetections(0),
      errorCount(0),
      droppedFrames(0),
      throughput(0.0) {
    if (!this->source || !this->detector || !this->alertManager) {
        throw std::invalid_argument("Pipeline requires a frame source, a detector and an alert manager");
    }
    if (this->options.throughputInterval <= 0) {
        this->options.throughputInterval = 30;
    }
    if (this->options.maxConsecutiveSourceErrors <= 0) {
        this->options.maxConsecutiveSourceErrors = 1;
    }
    sourceDescription = this->source->describe();
}

Pipeline::~Pipeline() {
    stop();
}

bool Pipeline::start() {
    std::lock_guard<std::mutex> lock(controlMutex);
    PipelineState current = state.load();
    if (current != PipelineState::Idle) {
        logger->warning(std::string("Cannot start, pipeline is ") + pipelineStateName(current));
        return false;
    }

    // Reap the thread of a run that ended on its own
    if (worker.joinable()) {
        worker.join();
    }

    if (!source->open()) {
        abortStart("Cannot open video source: " + sourceDescription);
        return false;
    }

    {
        std::lock_guard<std::mutex> errorLock(errorMutex);
        terminalError.clear();
    }
    results.clear();
    throughput = 0.0;
    state = PipelineState::Running;
    try {
        worker = std::thread(&Pipeline::run, this);
    } catch (const std::system_error& e) {
        abortStart("Cannot start detection thread: " + std::string(e.what()));
        return false;
    }
    logger->info("Detection started on " + sourceDescription);
    return true;
}

void Pipeline::abortStart(const std::string& error) {
    state = PipelineState::Idle;
    source->release();
    logger->error(error);
    std::lock_guard<std::mutex> errorLock(errorMutex);
    terminalError = error;
}

void Pipeline::stop() {
    std::lock_guard<std::mutex> lock(controlMutex);

    PipelineState expected = PipelineState::Running;
    if (state.compare_exchange_strong(expected, PipelineState::Stopping)) {
        logger->info("Stopping detection...");
    }

    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    }
}

bool Pipeline::pollResult(FrameUpdate& update, std::chrono::milliseconds timeout) {
    return results.pop(update, timeout);
}

void Pipeline::setObserver(std::shared_ptr<PipelineObserver> observer) {
    std::lock_guard<std::mutex> lock(observerMutex);
    this->observer = std::move(observer);
}

std::shared_ptr<PipelineObserver> Pipeline::currentObserver() const {
    std::lock_guard<std::mutex> lock(observerMutex);
    return observer;
}

PipelineStats Pipeline::getStats() const {
    PipelineStats stats;
    stats.framesProcessed = framesProcessed.load();
    stats.totalDetections = totalDetections.load();
    stats.errorCount = errorCount.load();
    stats.droppedFrames = droppedFrames.load();
    return stats;
}

void Pipeline::resetStats() {
    framesProcessed = 0;
    totalDetections = 0;
    errorCount = 0;
    droppedFrames = 0;
}

std::string Pipeline::lastError() const {
    std::lock_guard<std::mutex> lock(errorMutex);
    return terminalError;
}

void Pipeline::run() {
    int consecutiveErrors = 0;
    std::string error;

    int windowFrames = 0;
    double windowProcessing = 0.0;
    auto windowStart = std::chrono::steady_clock::now();

    while (state.load() == PipelineState::Running) {
        cv::Mat frame;
        if (!readFrame(frame, consecutiveErrors, error)) {
            if (!error.empty()) {
                break;
            }
            continue;
        }

        auto detectStart = std::chrono::steady_clock::now();
        DetectionResult result = runDetector(frame);
        windowProcessing += std::chrono::duration<double>(std::chrono::steady_clock::now() - detectStart).count();

        FrameUpdate update;
        update.frameIndex = ++framesProcessed;
        update.hasDetection = result.hasDetection;
        totalDetections += result.labels.size();

        if (result.hasDetection && !result.labels.empty()) {
            update.alert = alertManager->trigger(result.annotatedFrame, result.labels, result.scores);
        }

        update.frame = std::move(result.annotatedFrame);
        update.detections = std::move(result.labels);
        update.scores = std::move(result.scores);

        // Reported before publishing, the queue may drop this update
        if (auto obs = currentObserver()) {
            if (update.hasDetection) {
                obs->onDetection(update);
            }
            if (update.alert) {
                obs->onAlert(*update.alert);
            }
        }
        publish(std::move(update));

        if (++windowFrames >= options.throughputInterval) {
            auto now = std::chrono::steady_clock::now();
            double elapsed = std::chrono::duration<double>(now - windowStart).count();
            if (elapsed > 0.0) {
                double fps = windowFrames / elapsed;
                throughput = fps;
                logger->logPerformance(fps, windowProcessing / windowFrames);
                if (auto obs = currentObserver()) {
                    obs->onThroughput(fps);
                }
            }
            windowFrames = 0;
            windowProcessing = 0.0;
            windowStart = now;
        }
    }

    source->release();

    if (!error.empty()) {
        logger->error(error);
    } else {
        logger->info("Detection stopped");
    }
    {
        std::lock_guard<std::mutex> lock(errorMutex);
        terminalError = error;
    }

    state = PipelineState::Idle;

    if (auto obs = currentObserver()) {
        obs->onFinished(error);
    }
}

bool Pipeline::readFrame(cv::Mat& frame, int& consecutiveErrors, std::string& error) {
    FrameStatus status = source->read(frame);

    if (status == FrameStatus::Ok) {
        consecutiveErrors = 0;
        return true;
    }

    ++errorCount;
    if (status == FrameStatus::EndOfStream) {
        error = "Video source ended: " + sourceDescription;
        return false;
    }

    if (++consecutiveErrors >= options.maxConsecutiveSourceErrors) {
        std::ostringstream ss;
        ss << "Video source unavailable after " << consecutiveErrors << " failed reads: " << sourceDescription;
        error = ss.str();
        return false;
    }

    logger->warning("Cannot read frame, retrying");
    sleepUnlessStopping(options.retryDelay);
    return false;
}

DetectionResult Pipeline::runDetector(const cv::Mat& frame) {
    DetectionResult result;
    try {
        result = detector->detect(frame);
    } catch (const std::exception& e) {
        ++errorCount;
        logger->error("Detection error: " + std::string(e.what()));
        result = DetectionResult{};
    }

    if (result.annotatedFrame.empty()) {
        result.annotatedFrame = frame;
    }
    return result;
}

void Pipeline::publish(FrameUpdate update) {
    droppedFrames += results.push(std::move(update));
}

void Pipeline::sleepUnlessStopping(std::chrono::milliseconds delay) {
    const auto slice = std::chrono::milliseconds(10);
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (state.load() == PipelineState::Running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            slice, deadline - std::chrono::steady_clock::now()));
    }
}
