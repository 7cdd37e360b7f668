// capture.hpp
#pragma once

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "frame_slot.hpp"

namespace vcamstudio {

// Anything the pacing loop can pull the most recent source frame from.
class FrameProvider {
public:
    virtual ~FrameProvider() = default;

    // Copy of the latest frame, or an empty Mat if none has arrived yet.
    virtual cv::Mat getFrame() const = 0;
};

// Thin seam over cv::VideoCapture so the acquisition loop can be driven by fakes.
class CaptureDevice {
public:
    virtual ~CaptureDevice() = default;

    virtual bool open(int index, int api_preference) = 0;
    virtual bool openPipeline(const std::string& pipeline) = 0;
    virtual bool isOpened() const = 0;
    virtual bool set(int prop, double value) = 0;
    virtual double get(int prop) const = 0;
    virtual bool read(cv::Mat& frame) = 0;
    virtual void release() = 0;
};

class OpenCvCaptureDevice : public CaptureDevice {
public:
    bool open(int index, int api_preference) override;
    bool openPipeline(const std::string& pipeline) override;
    bool isOpened() const override;
    bool set(int prop, double value) override;
    double get(int prop) const override;
    bool read(cv::Mat& frame) override;
    void release() override;

private:
    cv::VideoCapture cap_;
};

struct CameraInfo {
    int index;
    std::string name;
    int width;
    int height;
};

class FrameSource : public FrameProvider {
public:
    FrameSource(int device_index, int width, int height, int fps);
    FrameSource(int device_index, int width, int height, int fps,
                std::unique_ptr<CaptureDevice> device);
    ~FrameSource() override;

    FrameSource(const FrameSource&) = delete;
    FrameSource& operator=(const FrameSource&) = delete;

    // Throws CaptureUnavailable when no backend opens. No-op while running.
    void start();
    // Waits up to the join timeout. A reader stuck in the device is abandoned
    // and releases the device itself once read() returns.
    void stop();
    bool isRunning() const;

    cv::Mat getFrame() const override;

    void setPipeline(const std::string& pipeline) { pipeline_ = pipeline; }
    void setDeviceIndex(int index) { device_index_ = index; }
    void setJoinTimeoutMs(int ms) { join_timeout_ms_ = ms; }

    // Negotiated values, valid after start()
    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    int getFps() const { return fps_; }
    const std::string& getBackendName() const { return backend_name_; }

    uint64_t getFramesCaptured() const;
    uint64_t getReadFailures() const;
    uint64_t getFramesDropped() const;

    static std::vector<CameraInfo> listCameras(int max_devices = 10);

private:
    int device_index_;
    int width_;
    int height_;
    int fps_;
    std::string pipeline_;
    std::string backend_name_;
    int join_timeout_ms_{2000};

    // Shared with the capture thread so it can outlive this object
    struct Counters;
    struct Run;

    std::shared_ptr<CaptureDevice> device_;
    std::shared_ptr<Counters> counters_;
    std::shared_ptr<Run> run_;
    std::weak_ptr<Run> abandoned_;
    std::thread thread_;

    bool openDevice();
    void configureCameraSettings();
    bool waitForExit(Run& run, bool release_if_stuck);
    static void captureLoop(std::shared_ptr<Run> run);
};

} // namespace vcamstudio
