#ifndef MODEL_H
#define MODEL_H

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <opencv2/opencv.hpp>

#include <tensorflow/lite/interpreter.h>
#include <tensorflow/lite/model.h>
#include <edgetpu.h>

#include "logger.h"

/**
 * @brief Bounding box in normalized [0,1] coordinates
 */
class BBox {
public:
    BBox(float ymin, float xmin, float ymax, float xmax)
        : ymin(ymin), xmin(xmin), ymax(ymax), xmax(xmax) {}

    /**
     * @brief Convert to a pixel rectangle clipped to a frame of the given size
     */
    cv::Rect toRect(int frameWidth, int frameHeight) const;

    float ymin;
    float xmin;
    float ymax;
    float xmax;
};

/**
 * @brief Raw detection produced by the model
 */
class Detection {
public:
    Detection(const BBox& bbox, int id, float score)
        : bbox(bbox), id(id), score(score) {}

    BBox bbox;
    int id;
    float score;
};

/**
 * @brief TFLite SSD detection model with optional Edge TPU acceleration
 */
class Model {
public:
    /**
     * @brief Constructor
     * @param modelPath Path to the TFLite model
     * @param labelsPath Path to the labels file
     * @param forceCPU Force CPU mode (no TPU)
     * @param logger Logger
     * @throws std::runtime_error if the model cannot be loaded
     */
    Model(const std::string& modelPath, const std::string& labelsPath, bool forceCPU = false,
          std::shared_ptr<Logger> logger = nullptr);

    ~Model();

    /**
     * @brief Create a new TFLite interpreter instance based on the loaded model.
     * Each thread should create its own interpreter.
     * @return A unique pointer to the created interpreter
     * @throws std::runtime_error on failure
     */
    std::unique_ptr<tflite::Interpreter> createInterpreter();

    /**
     * @brief Load labels from a file, one label per line
     * @param path Path to the labels file
     * @return True if successful, false otherwise (default labels are used)
     */
    bool loadLabels(const std::string& path);

    /**
     * @brief Get the label for a class ID
     * @param id Class ID
     * @return Label string, "Object_<id>" for unknown IDs
     */
    std::string getLabel(int id) const;

    const std::map<int, std::string>& getLabels() const { return labels; }

    /**
     * @brief Check if the model runs on the Edge TPU
     */
    bool isUsingTPU() const { return useTPU; }

    int getInputHeight() const { return inputHeight; }
    int getInputWidth() const { return inputWidth; }
    int getInputChannels() const { return inputChannels; }

    const std::string& getModelPath() const { return modelPath; }

private:
    std::string modelPath;
    std::shared_ptr<Logger> logger;

    // Labels map
    std::map<int, std::string> labels;

    bool useTPU;

    // Input tensor dimensions
    int inputHeight;
    int inputWidth;
    int inputChannels;

    // TFLite model data (shared across interpreters)
    std::unique_ptr<tflite::FlatBufferModel> model;

    // Hold the Edge TPU context if initialized successfully
    std::shared_ptr<edgetpu::EdgeTpuContext> edgetpuContext;
};

#endif // MODEL_H
