// capture.cpp
#include "capture.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <utility>

namespace vcamstudio {

namespace {

struct BackendCandidate {
    int api;
    const char* name;
};

// Platform-preferred first, generic last.
const BackendCandidate kBackendCandidates[] = {
    {cv::CAP_V4L2, "v4l2"},
    {cv::CAP_GSTREAMER, "gstreamer"},
    {cv::CAP_ANY, "any"},
};

const auto kReadRetryDelay = std::chrono::milliseconds(10);

} // namespace

bool OpenCvCaptureDevice::open(int index, int api_preference) {
    try {
        return cap_.open(index, api_preference);
    } catch (const cv::Exception& e) {
        Logger::log(Logger::DEBUG, std::string("VideoCapture open failed: ") + e.what());
        return false;
    }
}

bool OpenCvCaptureDevice::openPipeline(const std::string& pipeline) {
    try {
        return cap_.open(pipeline, cv::CAP_GSTREAMER);
    } catch (const cv::Exception& e) {
        Logger::log(Logger::DEBUG, std::string("GStreamer open failed: ") + e.what());
        return false;
    }
}

bool OpenCvCaptureDevice::isOpened() const {
    return cap_.isOpened();
}

bool OpenCvCaptureDevice::set(int prop, double value) {
    return cap_.set(prop, value);
}

double OpenCvCaptureDevice::get(int prop) const {
    return cap_.get(prop);
}

bool OpenCvCaptureDevice::read(cv::Mat& frame) {
    return cap_.read(frame);
}

void OpenCvCaptureDevice::release() {
    if (cap_.isOpened()) {
        cap_.release();
    }
}

struct FrameSource::Counters {
    LatestSlot<cv::Mat> latest;
    std::atomic<uint64_t> frames_captured{0};
    std::atomic<uint64_t> read_failures{0};
};

// One start()/stop() cycle. A later start() gets a fresh flag, so a reader
// abandoned by stop() never sees it flip back to true.
struct FrameSource::Run {
    std::shared_ptr<CaptureDevice> device;
    std::shared_ptr<Counters> counters;
    std::atomic<bool> running{true};

    std::mutex exit_mutex;
    std::condition_variable exit_cv;
    bool exited{false};
    bool release_on_exit{false};
};

FrameSource::FrameSource(int device_index, int width, int height, int fps)
    : FrameSource(device_index, width, height, fps,
                  std::unique_ptr<CaptureDevice>(new OpenCvCaptureDevice())) {}

FrameSource::FrameSource(int device_index, int width, int height, int fps,
                         std::unique_ptr<CaptureDevice> device)
    : device_index_(device_index), width_(width), height_(height), fps_(fps),
      device_(std::move(device)), counters_(std::make_shared<Counters>()) {}

FrameSource::~FrameSource() {
    stop();
}

bool FrameSource::isRunning() const {
    return run_ && run_->running;
}

uint64_t FrameSource::getFramesCaptured() const {
    return counters_->frames_captured;
}

uint64_t FrameSource::getReadFailures() const {
    return counters_->read_failures;
}

uint64_t FrameSource::getFramesDropped() const {
    return counters_->latest.overwritten();
}

void FrameSource::start() {
    if (isRunning()) {
        return;
    }

    // The device is still held by a reader stop() gave up on
    if (std::shared_ptr<Run> old = abandoned_.lock()) {
        if (!waitForExit(*old, false)) {
            std::ostringstream ss;
            ss << "Camera " << device_index_ << " is still held by a capture thread that did not exit";
            throw CaptureUnavailable(ss.str());
        }
    }
    abandoned_.reset();

    if (!openDevice()) {
        std::ostringstream ss;
        ss << "Could not open camera " << device_index_
           << ". Check that it is connected and not used by another program.";
        throw CaptureUnavailable(ss.str());
    }

    configureCameraSettings();

    run_ = std::make_shared<Run>();
    run_->device = device_;
    run_->counters = counters_;
    thread_ = std::thread(&FrameSource::captureLoop, run_);

    std::ostringstream ss;
    ss << "Camera started: device=" << device_index_ << " backend=" << backend_name_
       << " resolution=" << width_ << "x" << height_ << " @ " << fps_ << " FPS";
    Logger::log(Logger::INFO, ss.str());
}

bool FrameSource::openDevice() {
    if (!pipeline_.empty()) {
        Logger::log(Logger::INFO, "GStreamer pipeline: " + pipeline_);
        if (device_->openPipeline(pipeline_) && device_->isOpened()) {
            backend_name_ = "gstreamer-pipeline";
            return true;
        }
        Logger::log(Logger::WARNING, "Failed to open GStreamer pipeline, trying devices");
    }

    for (const auto& candidate : kBackendCandidates) {
        if (device_->open(device_index_, candidate.api) && device_->isOpened()) {
            backend_name_ = candidate.name;
            return true;
        }
        device_->release();
        Logger::log(Logger::DEBUG, std::string("Capture backend '") + candidate.name +
                    "' could not open device " + std::to_string(device_index_));
    }
    return false;
}

void FrameSource::configureCameraSettings() {
    device_->set(cv::CAP_PROP_FRAME_WIDTH, width_);
    device_->set(cv::CAP_PROP_FRAME_HEIGHT, height_);
    device_->set(cv::CAP_PROP_FPS, fps_);

    // Keep the driver queue short, we only want the newest frame
    device_->set(cv::CAP_PROP_BUFFERSIZE, 1);

    // The device may not honour the request
    int actual_w = static_cast<int>(device_->get(cv::CAP_PROP_FRAME_WIDTH));
    int actual_h = static_cast<int>(device_->get(cv::CAP_PROP_FRAME_HEIGHT));
    int actual_fps = static_cast<int>(device_->get(cv::CAP_PROP_FPS));
    if (actual_w > 0) width_ = actual_w;
    if (actual_h > 0) height_ = actual_h;
    if (actual_fps > 0) fps_ = actual_fps;
}

void FrameSource::captureLoop(std::shared_ptr<Run> run) {
    while (run->running) {
        cv::Mat frame;
        bool ok = false;
        try {
            ok = run->device->read(frame) && !frame.empty();
        } catch (const cv::Exception& e) {
            Logger::log(Logger::DEBUG, std::string("Capture read error: ") + e.what());
        }

        if (!run->running) {
            break;
        }
        if (ok) {
            run->counters->latest.put(std::move(frame));
            run->counters->frames_captured++;
        } else {
            run->counters->read_failures++;
            std::this_thread::sleep_for(kReadRetryDelay);
        }
    }

    // Released under the lock so a waiting start() never reopens it mid-release
    std::lock_guard<std::mutex> lock(run->exit_mutex);
    if (run->release_on_exit) {
        run->device->release();
        Logger::log(Logger::INFO, "Abandoned capture thread exited, device released");
    }
    run->exited = true;
    run->exit_cv.notify_all();
}

bool FrameSource::waitForExit(Run& run, bool release_if_stuck) {
    std::unique_lock<std::mutex> lock(run.exit_mutex);
    bool exited = run.exit_cv.wait_for(lock, std::chrono::milliseconds(join_timeout_ms_),
                                       [&run] { return run.exited; });
    if (!exited && release_if_stuck) {
        run.release_on_exit = true;
    }
    return exited;
}

cv::Mat FrameSource::getFrame() const {
    cv::Mat frame;
    if (!counters_->latest.get(frame)) {
        return cv::Mat();
    }
    return frame;
}

void FrameSource::stop() {
    std::shared_ptr<Run> run = std::move(run_);
    if (!run) {
        return;
    }
    run->running = false;

    if (waitForExit(*run, true)) {
        if (thread_.joinable()) {
            thread_.join();
        }
        device_->release();
    } else {
        // The thread owns everything it touches, only the device is shared
        Logger::log(Logger::WARNING, "Capture thread did not exit in time, abandoning it");
        if (thread_.joinable()) {
            thread_.detach();
        }
        abandoned_ = run;
    }
    counters_->latest.clear();

    Logger::log(Logger::INFO, "Camera stopped");
}

std::vector<CameraInfo> FrameSource::listCameras(int max_devices) {
    std::vector<CameraInfo> cameras;
    for (int i = 0; i < max_devices; i++) {
        OpenCvCaptureDevice probe;
        if (probe.open(i, cv::CAP_V4L2) && probe.isOpened()) {
            CameraInfo info;
            info.index = i;
            info.name = "Camera " + std::to_string(i);
            info.width = static_cast<int>(probe.get(cv::CAP_PROP_FRAME_WIDTH));
            info.height = static_cast<int>(probe.get(cv::CAP_PROP_FRAME_HEIGHT));
            cameras.push_back(info);
        }
        probe.release();
    }
    return cameras;
}

} // namespace vcamstudio
