#include "weapon_detector.h"
#include "utils.h"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>

WeaponDetector::WeaponDetector(const std::string& modelPath,
                               const std::string& labelsPath,
                               float confidenceThreshold,
                               bool forceCPU,
                               std::shared_ptr<Logger> logger)
    : logger(logger ? logger : std::make_shared<Logger>()),
      threshold(confidenceThreshold),
      frameCount(0), totalDetections(0), errorCount(0) {
    if (!(confidenceThreshold >= 0.0f && confidenceThreshold <= 1.0f)) {
        std::ostringstream ss;
        ss << "Invalid confidence threshold " << confidenceThreshold << ", using 0.5";
        this->logger->warning(ss.str());
        threshold = 0.5f;
    }

    try {
        model = std::make_shared<Model>(modelPath, labelsPath, forceCPU, this->logger);
        interpreter = model->createInterpreter();
    } catch (const std::exception& e) {
        this->logger->error("CRITICAL: Failed to load model: " + std::string(e.what()));
        this->logger->error("Detection will not work without a model!");
        model.reset();
        interpreter.reset();
    }
}

std::string WeaponDetector::getDevice() const {
    return model && model->isUsingTPU() ? "TPU" : "CPU";
}

DetectorStats WeaponDetector::getStats() const {
    DetectorStats stats;
    stats.framesProcessed = frameCount.load();
    stats.totalDetections = totalDetections.load();
    stats.errorCount = errorCount.load();
    return stats;
}

void WeaponDetector::resetStats() {
    frameCount = 0;
    totalDetections = 0;
    errorCount = 0;
}

cv::Scalar WeaponDetector::colorFor(const std::string& label) {
    std::string lower = toLower(label);
    if (lower == "pistol") {
        return cv::Scalar(0, 0, 255);      // Red
    }
    if (lower == "knife") {
        return cv::Scalar(0, 165, 255);    // Orange
    }
    return cv::Scalar(0, 255, 255);        // Yellow
}

void WeaponDetector::annotate(cv::Mat& frame,
                              const std::vector<cv::Rect>& boxes,
                              const std::vector<std::string>& labels,
                              const std::vector<float>& scores) {
    size_t n = std::min({boxes.size(), labels.size(), scores.size()});
    for (size_t i = 0; i < n; ++i) {
        drawDetectionBox(frame, boxes[i], labels[i], scores[i], colorFor(labels[i]));
    }

    if (n > 0) {
        cv::rectangle(frame, cv::Point(0, 0), cv::Point(frame.cols - 1, frame.rows - 1),
                      cv::Scalar(0, 0, 255), 10);
    }
}

DetectionResult WeaponDetector::detect(const cv::Mat& frame) {
    DetectionResult result;

    if (frame.empty()) {
        logger->error("Received empty frame");
        result.annotatedFrame = cv::Mat::zeros(480, 640, CV_8UC3);
        return result;
    }

    if (!isModelLoaded()) {
        logger->debug("Model not loaded, returning original frame");
        result.annotatedFrame = frame.clone();
        return result;
    }

    ++frameCount;

    std::vector<Detection> detections;
    try {
        detections = performInference(frame);
    } catch (const std::exception& e) {
        ++errorCount;
        logger->error("Detection error: " + std::string(e.what()));
        result.annotatedFrame = frame.clone();
        return result;
    }

    std::vector<cv::Rect> boxes;
    for (const auto& detection : detections) {
        boxes.push_back(detection.bbox.toRect(frame.cols, frame.rows));
        result.labels.push_back(model->getLabel(detection.id));
        result.scores.push_back(detection.score);
    }
    totalDetections += detections.size();
    result.hasDetection = !detections.empty();

    result.annotatedFrame = frame.clone();
    annotate(result.annotatedFrame, boxes, result.labels, result.scores);
    return result;
}

std::vector<Detection> WeaponDetector::performInference(const cv::Mat& frame) {
    std::lock_guard<std::mutex> lock(interpreterMutex);

    int inputWidth = model->getInputWidth();
    int inputHeight = model->getInputHeight();
    int inputChannels = model->getInputChannels();

    // Resize and preprocess the image
    cv::Mat resizedFrame;
    cv::resize(frame, resizedFrame, cv::Size(inputWidth, inputHeight));

    cv::Mat rgbFrame;
    if (resizedFrame.channels() == 3 && inputChannels == 3) {
        cv::cvtColor(resizedFrame, rgbFrame, cv::COLOR_BGR2RGB);
    } else if (resizedFrame.channels() == 1 && inputChannels == 1) {
        rgbFrame = resizedFrame;
    } else {
        throw std::runtime_error("Channel mismatch between input frame and model");
    }

    const TfLiteTensor* inputTensor = interpreter->input_tensor(0);
    if (!inputTensor) {
        throw std::runtime_error("Failed to get input tensor");
    }

    size_t pixelCount = static_cast<size_t>(inputWidth) * inputHeight * inputChannels;
    if (inputTensor->type == kTfLiteUInt8) {
        uint8_t* inputData = interpreter->typed_input_tensor<uint8_t>(0);
        std::memcpy(inputData, rgbFrame.data, pixelCount);
    } else if (inputTensor->type == kTfLiteFloat32) {
        cv::Mat floatFrame;
        rgbFrame.convertTo(floatFrame, CV_32F, 1.0 / 255.0);
        float* inputData = interpreter->typed_input_tensor<float>(0);
        std::memcpy(inputData, floatFrame.data, pixelCount * sizeof(float));
    } else {
        throw std::runtime_error("Unsupported input tensor type");
    }

    if (interpreter->Invoke() != kTfLiteOk) {
        throw std::runtime_error("Failed to invoke interpreter");
    }

    // SSD post-processing outputs: boxes, classes, scores, count
    const float* outputLocations = interpreter->typed_output_tensor<float>(0);
    const float* outputClasses = interpreter->typed_output_tensor<float>(1);
    const float* outputScores = interpreter->typed_output_tensor<float>(2);
    const float* numDetections = interpreter->typed_output_tensor<float>(3);

    if (!outputLocations || !outputClasses || !outputScores || !numDetections) {
        throw std::runtime_error("Failed to get output tensors");
    }

    const TfLiteTensor* scoresTensor = interpreter->output_tensor(2);
    int maxDetections = scoresTensor && scoresTensor->dims && scoresTensor->dims->size >= 2
                            ? scoresTensor->dims->data[1] : 0;
    int numDetected = std::clamp(static_cast<int>(*numDetections), 0, maxDetections);
    std::vector<Detection> detections;

    for (int i = 0; i < numDetected; i++) {
        float score = outputScores[i];
        if (score < threshold) {
            continue;
        }

        // [ymin, xmin, ymax, xmax], clamped to [0.0, 1.0]
        float ymin = std::max(0.0f, outputLocations[i * 4 + 0]);
        float xmin = std::max(0.0f, outputLocations[i * 4 + 1]);
        float ymax = std::min(1.0f, outputLocations[i * 4 + 2]);
        float xmax = std::min(1.0f, outputLocations[i * 4 + 3]);

        detections.emplace_back(BBox(ymin, xmin, ymax, xmax), static_cast<int>(outputClasses[i]), score);
    }

    return detections;
}
