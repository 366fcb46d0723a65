#ifndef UTILS_H
#define UTILS_H

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <chrono>
#include <cctype>
#include <ctime>
#include <deque>
#include <iomanip>
#include <sstream>
#include <string>

/**
 * @brief FPS counter class to measure frames per second over a sliding window
 */
class FPSCounter {
public:
    explicit FPSCounter(size_t avgFrames = 30) : avgFrames(std::max<size_t>(avgFrames, 2)) {}

    /**
     * @brief Update the FPS calculation with a new frame
     */
    void update() {
        frameTimes.push_back(std::chrono::steady_clock::now());

        // Keep only the last avgFrames times
        while (frameTimes.size() > avgFrames) {
            frameTimes.pop_front();
        }
    }

    /**
     * @brief Get the current FPS
     * @return Current FPS value, 0 until two frames have been seen
     */
    double getFPS() const {
        if (frameTimes.size() <= 1) {
            return 0.0;
        }

        double timeDiff = std::chrono::duration<double>(frameTimes.back() - frameTimes.front()).count();
        if (timeDiff <= 0.0) {
            return 0.0;
        }

        // FPS = (number of frames - 1) / time difference
        return (frameTimes.size() - 1) / timeDiff;
    }

    void reset() { frameTimes.clear(); }

    /**
     * @brief Draw FPS on frame
     * @param frame Frame to draw on
     */
    void drawFPS(cv::Mat& frame) const {
        std::ostringstream ss;
        ss << "FPS: " << std::fixed << std::setprecision(1) << getFPS();
        cv::putText(frame, ss.str(), cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 1.0,
                    cv::Scalar(0, 255, 0), 2);
    }

private:
    size_t avgFrames;
    std::deque<std::chrono::steady_clock::time_point> frameTimes;
};

/**
 * @brief Format a wall-clock instant in local time
 * @param time Instant to format
 * @param format strftime-style format string
 */
inline std::string formatTimestamp(std::chrono::system_clock::time_point time, const char* format) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, format);
    return ss.str();
}

inline std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

inline std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/**
 * @brief Format a confidence in [0,1] as a percentage, e.g. "95.00%"
 */
inline std::string formatPercent(float confidence) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << confidence * 100.0f << "%";
    return ss.str();
}

/**
 * @brief Draw a detection bounding box with a filled caption on a frame
 * @param frame Frame to draw on
 * @param box Box in pixel coordinates, clipped to the frame
 * @param label Label text
 * @param score Confidence score
 * @param color Box and caption background colour (BGR)
 */
inline void drawDetectionBox(cv::Mat& frame, const cv::Rect& box, const std::string& label,
                             float score, const cv::Scalar& color) {
    cv::rectangle(frame, box, color, 3);

    std::string labelText = toUpper(label) + ": " + formatPercent(score);

    int fontFace = cv::FONT_HERSHEY_SIMPLEX;
    double fontScale = 0.8;
    int thickness = 2;
    int baseline = 0;
    cv::Size textSize = cv::getTextSize(labelText, fontFace, fontScale, thickness, &baseline);

    // Keep the caption inside the frame
    int labelY = std::max(textSize.height + 10, box.y);
    cv::rectangle(frame,
                  cv::Point(box.x, labelY - textSize.height - 10),
                  cv::Point(std::min(box.x + textSize.width, frame.cols), labelY),
                  color,
                  cv::FILLED);

    cv::putText(frame, labelText, cv::Point(box.x, labelY - 5), fontFace, fontScale,
                cv::Scalar(255, 255, 255), thickness);
}

#endif // UTILS_H
