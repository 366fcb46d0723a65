#include "alert_manager.h"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

AlertManager::AlertManager(double cooldownSeconds,
                           std::shared_ptr<ScreenshotWriter> screenshotWriter,
                           std::shared_ptr<Notifier> notifier,
                           std::shared_ptr<Logger> logger,
                           AlertGate::ClockFunction clock,
                           size_t ledgerCapacity)
    : alertGate(cooldownSeconds, std::move(clock)),
      ledger(ledgerCapacity),
      screenshotWriter(screenshotWriter ? std::move(screenshotWriter)
                                        : std::make_shared<NullScreenshotWriter>()),
      notifier(notifier ? std::move(notifier) : std::make_shared<NullNotifier>()),
      logger(logger ? std::move(logger) : std::make_shared<Logger>()) {
    if (alertGate.wasClamped()) {
        std::ostringstream ss;
        ss << "Invalid cooldown " << cooldownSeconds << ", using "
           << AlertGate::kDefaultCooldownSeconds << " seconds";
        this->logger->warning(ss.str());
    }
}

std::optional<AlertRecord> AlertManager::trigger(const cv::Mat& frame,
                                                 const std::vector<std::string>& detections,
                                                 const std::vector<float>& confidenceScores) {
    if (frame.empty()) {
        logger->debug("Alert rejected: empty frame");
        return std::nullopt;
    }

    if (detections.empty()) {
        logger->debug("Alert rejected: no detections");
        return std::nullopt;
    }

    AlertRecord record;
    if (!alertGate.tryAcquire(&record.acceptedAt)) {
        logger->debug("Alert suppressed: cooldown active");
        return std::nullopt;
    }
    record.timestamp = std::chrono::system_clock::now();
    record.detections = pairDetections(detections, confidenceScores);

    // Runs outside the gate and ledger locks
    record.screenshotPath = screenshotWriter->save(frame, record.timestamp);
    if (!record.screenshotPath) {
        logger->warning("Alert recorded without screenshot");
    }

    notifier->playAsync();

    ledger.append(record);

    for (const auto& detection : record.detections) {
        logger->logDetection(detection.label, detection.confidence,
                             record.screenshotPath.value_or(""));
    }
    return record;
}

void AlertManager::clearAlerts() {
    ledger.clear();
    logger->info("Alert log cleared");
}

std::vector<DetectedObject> AlertManager::pairDetections(const std::vector<std::string>& detections,
                                                         const std::vector<float>& confidenceScores) {
    std::vector<DetectedObject> paired;
    paired.reserve(detections.size());
    for (size_t i = 0; i < detections.size(); ++i) {
        float score = i < confidenceScores.size() ? confidenceScores[i] : 0.0f;
        if (!(score >= 0.0f)) {
            score = 0.0f;
        }
        paired.push_back(DetectedObject{detections[i], std::min(score, 1.0f)});
    }
    return paired;
}
