#ifndef FRAME_SOURCE_H
#define FRAME_SOURCE_H

#include <opencv2/opencv.hpp>
#include <memory>
#include <string>
#include "logger.h"

/**
 * @brief Outcome of reading one frame
 */
enum class FrameStatus {
    Ok,
    EndOfStream,     // source exhausted or closed for good
    TransientError   // no frame this time, a retry may succeed
};

/**
 * @brief Source of video frames for the pipeline
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool open() = 0;
    virtual FrameStatus read(cv::Mat& frame) = 0;
    virtual void release() = 0;
    virtual std::string describe() const = 0;
};

/**
 * @brief Frame source backed by cv::VideoCapture (webcam index, file or stream URL)
 */
class VideoCaptureSource : public FrameSource {
public:
    /**
     * @brief Constructor
     * @param source Camera index ("0", "1", ...), video file path or stream URL
     * @param logger Logger
     */
    explicit VideoCaptureSource(const std::string& source, std::shared_ptr<Logger> logger = nullptr);
    ~VideoCaptureSource() override;

    bool open() override;
    FrameStatus read(cv::Mat& frame) override;
    void release() override;
    std::string describe() const override;

    /**
     * @brief Cameras and network streams report read failures as transient
     */
    bool isLive() const { return camera || stream; }

    int getFrameWidth() const { return frameWidth; }
    int getFrameHeight() const { return frameHeight; }
    double getFPS() const { return fps; }

    static bool isCameraIndex(const std::string& source);
    static bool isStreamUrl(const std::string& source);

private:
    std::string source;
    std::shared_ptr<Logger> logger;
    cv::VideoCapture cap;
    bool camera;
    bool stream;
    int frameWidth;
    int frameHeight;
    double fps;
};

#endif // FRAME_SOURCE_H
