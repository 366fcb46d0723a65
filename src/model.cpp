#include "model.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <tensorflow/lite/kernels/register.h>

namespace {

const std::vector<std::string> kDefaultLabels = {"pistol", "knife"};

}  // namespace

cv::Rect BBox::toRect(int frameWidth, int frameHeight) const {
    int x1 = std::clamp(static_cast<int>(xmin * frameWidth), 0, frameWidth);
    int y1 = std::clamp(static_cast<int>(ymin * frameHeight), 0, frameHeight);
    int x2 = std::clamp(static_cast<int>(xmax * frameWidth), 0, frameWidth);
    int y2 = std::clamp(static_cast<int>(ymax * frameHeight), 0, frameHeight);
    return cv::Rect(cv::Point(x1, y1), cv::Point(std::max(x1, x2), std::max(y1, y2)));
}

Model::Model(const std::string& modelPath, const std::string& labelsPath, bool forceCPU,
             std::shared_ptr<Logger> logger)
    : modelPath(modelPath), logger(logger ? logger : std::make_shared<Logger>()),
      useTPU(false), inputHeight(300), inputWidth(300), inputChannels(3) {

    this->logger->info("Loading weapon detection model from " + modelPath);

    // Load the model
    model = tflite::FlatBufferModel::BuildFromFile(modelPath.c_str());
    if (!model) {
        throw std::runtime_error("Failed to load model: " + modelPath);
    }

    // Try to use Edge TPU if not forced to CPU
    if (!forceCPU && modelPath.find("edgetpu") != std::string::npos) {
        this->logger->info("Attempting to use Edge TPU");
        edgetpuContext = edgetpu::EdgeTpuManager::GetSingleton()->OpenDevice();
        if (edgetpuContext) {
            useTPU = true;
            this->logger->info("Edge TPU device opened");
        } else {
            this->logger->warning("Edge TPU not available, falling back to CPU");
        }
    } else {
        this->logger->info("Running in CPU-only mode");
    }

    // A temporary interpreter reads the input dimensions; each detector
    // creates its own interpreter afterwards.
    std::unique_ptr<tflite::Interpreter> tempInterpreter = createInterpreter();
    auto* inputTensor = tempInterpreter->input_tensor(0);
    if (inputTensor && inputTensor->dims && inputTensor->dims->size == 4) {
        inputHeight = inputTensor->dims->data[1];
        inputWidth = inputTensor->dims->data[2];
        inputChannels = inputTensor->dims->data[3];
    }

    std::ostringstream ss;
    ss << "Model input dimensions: " << inputWidth << "x" << inputHeight << "x" << inputChannels;
    this->logger->info(ss.str());

    if (!loadLabels(labelsPath)) {
        this->logger->warning("Failed to load labels from " + labelsPath + ", using default classes");
    }

    this->logger->info(std::string("Weapon detection model loaded successfully. Using ") +
                       (useTPU ? "Edge TPU" : "CPU"));
}

Model::~Model() {
    // Edge TPU context will be automatically released by shared_ptr
}

bool Model::loadLabels(const std::string& path) {
    labels.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        for (size_t i = 0; i < kDefaultLabels.size(); ++i) {
            labels[static_cast<int>(i)] = kDefaultLabels[i];
        }
        return false;
    }

    std::string line;
    int lineNum = 0;
    while (std::getline(file, line)) {
        // Remove trailing whitespace
        line.erase(line.find_last_not_of(" \n\r\t") + 1);

        labels[lineNum] = line;
        lineNum++;
    }

    // If no labels were loaded, fall back to the default classes
    if (labels.empty()) {
        for (size_t i = 0; i < kDefaultLabels.size(); ++i) {
            labels[static_cast<int>(i)] = kDefaultLabels[i];
        }
        return false;
    }

    logger->info("Model classes: " + std::to_string(labels.size()));
    return true;
}

std::string Model::getLabel(int id) const {
    auto it = labels.find(id);
    if (it != labels.end() && !it->second.empty()) {
        return it->second;
    }
    return "Object_" + std::to_string(id);
}

std::unique_ptr<tflite::Interpreter> Model::createInterpreter() {
    if (!model) {
        throw std::runtime_error("Model not loaded, cannot create interpreter");
    }

    tflite::ops::builtin::BuiltinOpResolver resolver;
    if (useTPU) {
        resolver.AddCustom(edgetpu::kCustomOp, edgetpu::RegisterCustomOp());
    }

    std::unique_ptr<tflite::Interpreter> newInterpreter;
    tflite::InterpreterBuilder builder(*model, resolver);
    if (builder(&newInterpreter) != kTfLiteOk || !newInterpreter) {
        throw std::runtime_error("Failed to build interpreter");
    }

    // Apply Edge TPU context if it was initialized and is being used
    if (useTPU && edgetpuContext) {
        newInterpreter->SetExternalContext(kTfLiteEdgeTpuContext, edgetpuContext.get());
        newInterpreter->SetNumThreads(1); // Edge TPU benefits from single thread
    }

    if (newInterpreter->AllocateTensors() != kTfLiteOk) {
        throw std::runtime_error("Failed to allocate tensors for interpreter");
    }

    return newInterpreter;
}
