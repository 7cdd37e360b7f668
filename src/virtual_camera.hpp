// virtual_camera.hpp
#pragma once

#include "output_sink.hpp"

#include <opencv2/videoio.hpp>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace vcamstudio {

// Virtual camera output: tries the preferred backend, then v4l2loopback, then gstreamer.
class VirtualCameraOutput : public OutputSink {
public:
    VirtualCameraOutput(int width, int height, int fps,
                        std::string device = "/dev/video10");
    ~VirtualCameraOutput() override;

    bool start(const std::string& preferred_backend = "") override;
    bool sendFrame(const cv::Mat& frame) override;
    void stop() override;
    bool isRunning() const override { return running_; }

    int getWidth() const override { return width_; }
    int getHeight() const override { return height_; }
    std::string getLastError() const override;
    std::string getBackendName() const override;

    // Custom GStreamer pipeline, must start with appsrc
    void setPipeline(const std::string& pipeline) { pipeline_ = pipeline; }
    const std::string& getDevice() const { return device_; }

    static std::vector<std::string> backendOrder(const std::string& preferred);

private:
    int width_;
    int height_;
    int fps_;
    std::string device_;
    std::string pipeline_;

    mutable std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::string backend_name_;
    std::string last_error_;

    int fd_{-1};
    cv::VideoWriter writer_;
    std::vector<unsigned char> i420_;

    void openBackend(const std::string& backend);
    void openV4l2Loopback();
    void openGStreamer();
    void writeV4l2(const cv::Mat& bgr);
    void closeAll();
};

} // namespace vcamstudio
