// virtual_camera.cpp
#include "virtual_camera.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <opencv2/imgproc.hpp>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <linux/videodev2.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

namespace vcamstudio {

namespace {

int xioctl(int fd, unsigned long req, void* arg) {
    int r;
    do {
        r = ::ioctl(fd, req, arg);
    } while (r == -1 && errno == EINTR);
    return r;
}

std::string errnoString(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

VirtualCameraOutput::VirtualCameraOutput(int width, int height, int fps, std::string device)
    : width_(width), height_(height), fps_(fps), device_(std::move(device)) {}

VirtualCameraOutput::~VirtualCameraOutput() {
    stop();
}

std::vector<std::string> VirtualCameraOutput::backendOrder(const std::string& preferred) {
    std::vector<std::string> order;
    if (!preferred.empty()) {
        order.push_back(preferred);
    }
    for (const char* name : {"v4l2loopback", "gstreamer"}) {
        if (preferred != name) {
            order.push_back(name);
        }
    }
    return order;
}

bool VirtualCameraOutput::start(const std::string& preferred_backend) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return true;
    }

    for (const auto& backend : backendOrder(preferred_backend)) {
        try {
            openBackend(backend);
            backend_name_ = backend;
            last_error_.clear();
            running_ = true;

            std::ostringstream ss;
            ss << "Virtual camera started: " << device_ << " (" << width_ << "x" << height_
               << "@" << fps_ << "fps, backend=" << backend << ")";
            Logger::log(Logger::INFO, ss.str());
            return true;
        } catch (const SinkUnavailable& e) {
            closeAll();
            Logger::log(Logger::WARNING, "Backend '" + backend + "' failed: " + e.what());
        }
    }

    last_error_ = "No virtual camera backend available. Load v4l2loopback "
                  "(modprobe v4l2loopback devices=1 video_nr=10 exclusive_caps=1) "
                  "or install the GStreamer v4l2 plugins.";
    Logger::log(Logger::ERROR, last_error_);
    return false;
}

void VirtualCameraOutput::openBackend(const std::string& backend) {
    if (backend == "v4l2loopback") {
        openV4l2Loopback();
    } else if (backend == "gstreamer") {
        openGStreamer();
    } else {
        throw SinkUnavailable("unknown backend");
    }
}

void VirtualCameraOutput::openV4l2Loopback() {
    if (width_ % 2 != 0 || height_ % 2 != 0) {
        throw SinkUnavailable("I420 output needs even dimensions");
    }

    fd_ = ::open(device_.c_str(), O_RDWR | O_CLOEXEC);
    if (fd_ < 0) {
        throw SinkUnavailable(errnoString("open " + device_));
    }

    v4l2_capability caps{};
    if (xioctl(fd_, VIDIOC_QUERYCAP, &caps) < 0) {
        throw SinkUnavailable(errnoString("VIDIOC_QUERYCAP"));
    }
    uint32_t dev_caps = (caps.capabilities & V4L2_CAP_DEVICE_CAPS) ? caps.device_caps
                                                                   : caps.capabilities;
    if (!(dev_caps & V4L2_CAP_VIDEO_OUTPUT)) {
        throw SinkUnavailable(device_ + " is not a video output device");
    }

    v4l2_format fmt{};
    fmt.type = V4L2_BUF_TYPE_VIDEO_OUTPUT;
    fmt.fmt.pix.width = width_;
    fmt.fmt.pix.height = height_;
    fmt.fmt.pix.pixelformat = V4L2_PIX_FMT_YUV420;
    fmt.fmt.pix.field = V4L2_FIELD_NONE;
    fmt.fmt.pix.bytesperline = width_;
    fmt.fmt.pix.sizeimage = width_ * height_ * 3 / 2;
    fmt.fmt.pix.colorspace = V4L2_COLORSPACE_SRGB;
    if (xioctl(fd_, VIDIOC_S_FMT, &fmt) < 0) {
        throw SinkUnavailable(errnoString("VIDIOC_S_FMT"));
    }

    // Use what the driver actually gave us
    if (static_cast<int>(fmt.fmt.pix.width) != width_ ||
        static_cast<int>(fmt.fmt.pix.height) != height_) {
        std::ostringstream ss;
        ss << "driver forced " << fmt.fmt.pix.width << "x" << fmt.fmt.pix.height;
        throw SinkUnavailable(ss.str());
    }

    i420_.resize(static_cast<size_t>(width_) * height_ * 3 / 2);
}

void VirtualCameraOutput::openGStreamer() {
    std::string pipeline = pipeline_;
    if (pipeline.empty()) {
        std::stringstream ss;
        ss << "appsrc "
           << "! videoconvert "
           << "! video/x-raw,format=YUY2,width=" << width_
           << ",height=" << height_
           << ",framerate=" << fps_ << "/1 "
           << "! v4l2sink device=" << device_ << " sync=false";
        pipeline = ss.str();
    }

    Logger::log(Logger::DEBUG, "GStreamer output pipeline: " + pipeline);
    try {
        writer_.open(pipeline, cv::CAP_GSTREAMER, 0, fps_, cv::Size(width_, height_), true);
    } catch (const cv::Exception& e) {
        throw SinkUnavailable(std::string("VideoWriter: ") + e.what());
    }
    if (!writer_.isOpened()) {
        throw SinkUnavailable("failed to open GStreamer pipeline");
    }
}

void VirtualCameraOutput::writeV4l2(const cv::Mat& bgr) {
    cv::Mat yuv(height_ * 3 / 2, width_, CV_8UC1, i420_.data());
    cv::cvtColor(bgr, yuv, cv::COLOR_BGR2YUV_I420);

    const size_t size = i420_.size();
    ssize_t written = ::write(fd_, i420_.data(), size);
    if (written < 0) {
        throw TransientIOError(errnoString("write " + device_));
    }
    if (static_cast<size_t>(written) != size) {
        throw TransientIOError("short write to " + device_);
    }
}

bool VirtualCameraOutput::sendFrame(const cv::Mat& frame) {
    if (!running_ || frame.empty()) {
        return false;
    }

    cv::Mat bgr = frame.channels() == 3 ? frame : cv::Mat();
    if (frame.channels() == 4) {
        cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
    } else if (frame.channels() == 1) {
        cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
    }
    if (bgr.cols != width_ || bgr.rows != height_) {
        cv::resize(bgr, bgr, cv::Size(width_, height_));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return false;
    }
    try {
        if (fd_ >= 0) {
            writeV4l2(bgr);
        } else {
            writer_.write(bgr);
        }
        return true;
    } catch (const TransientIOError& e) {
        last_error_ = e.what();
        Logger::log(Logger::DEBUG, std::string("Error sending frame: ") + e.what());
    } catch (const cv::Exception& e) {
        last_error_ = e.what();
        Logger::log(Logger::DEBUG, std::string("Error sending frame: ") + e.what());
    }
    return false;
}

void VirtualCameraOutput::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool was_running = running_.exchange(false);
    closeAll();
    if (was_running) {
        Logger::log(Logger::INFO, "Virtual camera stopped");
    }
}

void VirtualCameraOutput::closeAll() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (writer_.isOpened()) {
        writer_.release();
    }
}

std::string VirtualCameraOutput::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::string VirtualCameraOutput::getBackendName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_name_;
}

} // namespace vcamstudio
