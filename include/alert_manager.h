#ifndef ALERT_MANAGER_H
#define ALERT_MANAGER_H

#include <opencv2/core.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "alert_gate.h"
#include "alert_ledger.h"
#include "alert_record.h"
#include "logger.h"
#include "notifier.h"
#include "screenshot_writer.h"

/**
 * @brief Turns positive detections into rate-limited alerts
 *
 * Owns the cooldown gate and the alert ledger. An accepted alert saves a
 * screenshot, starts the alert sound and is appended to the ledger; only the
 * cooldown and the ledger append are guaranteed, the other side effects are
 * best effort.
 */
class AlertManager {
public:
    /**
     * @brief Constructor
     * @param cooldownSeconds Minimum seconds between alerts (negative values use 5)
     * @param screenshotWriter Screenshot persistence, NullScreenshotWriter if null
     * @param notifier Alert sound, NullNotifier if null
     * @param logger Logger, console logger if null
     * @param clock Time source for the cooldown gate
     * @param ledgerCapacity Maximum number of alerts kept in memory
     */
    AlertManager(double cooldownSeconds,
                 std::shared_ptr<ScreenshotWriter> screenshotWriter,
                 std::shared_ptr<Notifier> notifier,
                 std::shared_ptr<Logger> logger = nullptr,
                 AlertGate::ClockFunction clock = nullptr,
                 size_t ledgerCapacity = AlertLedger::kDefaultCapacity);

    /**
     * @brief Raise an alert for a frame if the cooldown allows it
     * @param frame Frame to persist (usually the annotated frame)
     * @param detections Detected labels, must not be empty
     * @param confidenceScores Scores matching detections
     * @return The accepted alert, or empty if rejected or still cooling down
     */
    std::optional<AlertRecord> trigger(const cv::Mat& frame,
                                       const std::vector<std::string>& detections,
                                       const std::vector<float>& confidenceScores);

    std::vector<AlertRecord> recentAlerts(size_t count = 10) const { return ledger.recent(count); }

    void clearAlerts();

    size_t alertCount() const { return ledger.size(); }

    const AlertGate& gate() const { return alertGate; }

    double cooldownSeconds() const { return alertGate.cooldownSeconds(); }

    bool hasSound() const { return notifier->available(); }

private:
    static std::vector<DetectedObject> pairDetections(const std::vector<std::string>& detections,
                                                      const std::vector<float>& confidenceScores);

    AlertGate alertGate;
    AlertLedger ledger;
    std::shared_ptr<ScreenshotWriter> screenshotWriter;
    std::shared_ptr<Notifier> notifier;
    std::shared_ptr<Logger> logger;
};

#endif // ALERT_MANAGER_H
