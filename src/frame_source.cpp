#include "frame_source.h"
#include "utils.h"

#include <algorithm>
#include <cctype>
#include <sstream>

VideoCaptureSource::VideoCaptureSource(const std::string& source, std::shared_ptr<Logger> logger)
    : source(source), logger(logger ? logger : std::make_shared<Logger>()),
      camera(isCameraIndex(source)), stream(isStreamUrl(source)),
      frameWidth(0), frameHeight(0), fps(0) {
}

VideoCaptureSource::~VideoCaptureSource() {
    release();
}

bool VideoCaptureSource::isCameraIndex(const std::string& source) {
    return !source.empty() && std::all_of(source.begin(), source.end(),
                                          [](unsigned char c) { return std::isdigit(c); });
}

bool VideoCaptureSource::isStreamUrl(const std::string& source) {
    std::string lower = toLower(source);
    return lower.rfind("rtsp://", 0) == 0 || lower.rfind("http://", 0) == 0 ||
           lower.rfind("https://", 0) == 0;
}

bool VideoCaptureSource::open() {
    try {
        if (camera) {
            logger->info("Opening webcam " + source + "...");
            cap.open(std::stoi(source));
        } else {
            logger->info("Opening video source: " + source);
            cap.open(source);
        }

        if (!cap.isOpened()) {
            logger->error("Cannot open video source: " + source);
            return false;
        }

        // Keep latency low on network streams
        if (toLower(source).rfind("rtsp://", 0) == 0) {
            cap.set(cv::CAP_PROP_BUFFERSIZE, 1);
        }

        frameWidth = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH));
        frameHeight = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT));
        fps = cap.get(cv::CAP_PROP_FPS);

        // If FPS is not available, use default
        if (fps <= 0) {
            fps = 30.0;
        }

        std::ostringstream ss;
        ss << "Video source opened: " << frameWidth << "x" << frameHeight << " @ " << fps << " FPS";
        logger->info(ss.str());
        return true;
    } catch (const std::exception& e) {
        logger->error("Error opening video source " + source + ": " + e.what());
        return false;
    }
}

FrameStatus VideoCaptureSource::read(cv::Mat& frame) {
    if (!cap.isOpened()) {
        return FrameStatus::EndOfStream;
    }

    bool ok = false;
    try {
        ok = cap.read(frame);
    } catch (const cv::Exception& e) {
        logger->error("Error reading frame: " + std::string(e.what()));
        return isLive() ? FrameStatus::TransientError : FrameStatus::EndOfStream;
    }

    if (ok && !frame.empty()) {
        return FrameStatus::Ok;
    }
    return isLive() ? FrameStatus::TransientError : FrameStatus::EndOfStream;
}

void VideoCaptureSource::release() {
    if (cap.isOpened()) {
        cap.release();
    }
}

std::string VideoCaptureSource::describe() const {
    if (camera) {
        return "webcam " + source;
    }
    return (stream ? "stream " : "file ") + source;
}
