#ifndef WEAPON_DETECTOR_H
#define WEAPON_DETECTOR_H

#include <opencv2/opencv.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "detector.h"
#include "logger.h"
#include "model.h"

/**
 * @brief Detection counters kept by the weapon detector
 */
struct DetectorStats {
    uint64_t framesProcessed = 0;
    uint64_t totalDetections = 0;
    uint64_t errorCount = 0;
};

/**
 * @brief Weapon detector running a TFLite model on each frame
 *
 * If the model cannot be loaded the detector stays usable and passes frames
 * through without detections.
 */
class WeaponDetector : public Detector {
public:
    /**
     * @brief Constructor
     * @param modelPath Path to the TFLite model
     * @param labelsPath Path to the labels file
     * @param confidenceThreshold Minimum score, values outside [0,1] use 0.5
     * @param forceCPU Force CPU mode (no TPU)
     * @param logger Logger
     */
    WeaponDetector(const std::string& modelPath,
                   const std::string& labelsPath,
                   float confidenceThreshold = 0.5f,
                   bool forceCPU = false,
                   std::shared_ptr<Logger> logger = nullptr);

    DetectionResult detect(const cv::Mat& frame) override;

    bool isModelLoaded() const { return interpreter != nullptr; }

    /**
     * @brief "TPU" or "CPU"
     */
    std::string getDevice() const;

    float getConfidenceThreshold() const { return threshold; }

    DetectorStats getStats() const;
    void resetStats();

    /**
     * @brief Box colour for a class (BGR): pistol red, knife orange, others yellow
     */
    static cv::Scalar colorFor(const std::string& label);

    /**
     * @brief Draw boxes, captions and the alert border onto a frame
     */
    static void annotate(cv::Mat& frame,
                         const std::vector<cv::Rect>& boxes,
                         const std::vector<std::string>& labels,
                         const std::vector<float>& scores);

private:
    /**
     * @brief Perform inference on a frame using the local interpreter
     * @throws std::runtime_error if the interpreter fails
     */
    std::vector<Detection> performInference(const cv::Mat& frame);

    std::shared_ptr<Logger> logger;
    std::shared_ptr<Model> model;
    std::unique_ptr<tflite::Interpreter> interpreter;
    std::mutex interpreterMutex;
    float threshold;

    std::atomic<uint64_t> frameCount;
    std::atomic<uint64_t> totalDetections;
    std::atomic<uint64_t> errorCount;
};

#endif // WEAPON_DETECTOR_H
