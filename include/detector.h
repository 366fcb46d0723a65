#ifndef DETECTOR_H
#define DETECTOR_H

#include <opencv2/core.hpp>
#include <string>
#include <vector>

/**
 * @brief Output of a detector for one frame
 */
struct DetectionResult {
    cv::Mat annotatedFrame;
    std::vector<std::string> labels;
    std::vector<float> scores;
    bool hasDetection = false;
};

/**
 * @brief Inference step run by the pipeline on every frame
 *
 * Implementations should not throw for per-frame problems; on failure they
 * return the original frame with no detections.
 */
class Detector {
public:
    virtual ~Detector() = default;

    virtual DetectionResult detect(const cv::Mat& frame) = 0;
};

#endif // DETECTOR_H
