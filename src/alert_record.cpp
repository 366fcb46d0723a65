#include "alert_record.h"
#include "utils.h"

std::string AlertRecord::formattedTime() const {
    return formatTimestamp(timestamp, "%Y-%m-%d %H:%M:%S");
}

std::string AlertRecord::labels() const {
    std::string joined;
    for (const auto& detection : detections) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += detection.label;
    }
    return joined;
}
