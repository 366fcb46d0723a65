#ifndef ALERT_RECORD_H
#define ALERT_RECORD_H

#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief A single labelled detection carried by an alert
 */
struct DetectedObject {
    std::string label;
    float confidence = 0.0f;
};

/**
 * @brief An accepted alert
 *
 * Created once per accepted trigger and never modified afterwards; readers
 * of the ledger always receive copies.
 */
struct AlertRecord {
    // Wall-clock acceptance time
    std::chrono::system_clock::time_point timestamp;
    // Monotonic acceptance time from the AlertGate, used for ordering
    std::chrono::steady_clock::time_point acceptedAt;
    std::vector<DetectedObject> detections;
    std::optional<std::string> screenshotPath;

    /**
     * @brief Acceptance time formatted as "YYYY-MM-DD HH:MM:SS"
     */
    std::string formattedTime() const;

    /**
     * @brief Comma separated labels, e.g. "pistol, knife"
     */
    std::string labels() const;
};

#endif // ALERT_RECORD_H
