/**
 * @file test_capture.cpp
 * @brief Unit tests for FrameSource with a scripted capture device
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <vector>
#include "capture.hpp"
#include "errors.hpp"

using namespace vcamstudio;

namespace {

struct DeviceScript {
    std::vector<int> working_apis;       // backends that open
    bool pipeline_works = false;
    double reported_width = 0;
    double reported_height = 0;
    double reported_fps = 0;
    bool deliver_frames = true;
    std::atomic<bool> hold_reads{false};  // read() blocks while set

    std::vector<int> attempted_apis;
    std::vector<std::string> attempted_pipelines;
    std::atomic<int> reads{0};
    std::atomic<int> releases{0};
};

// Stands in for a camera; frames carry an increasing pixel value.
class FakeCaptureDevice : public CaptureDevice {
public:
    explicit FakeCaptureDevice(DeviceScript* script) : script_(script) {}

    bool open(int, int api) override {
        script_->attempted_apis.push_back(api);
        for (int ok : script_->working_apis) {
            if (ok == api) opened_ = true;
        }
        return opened_;
    }
    bool openPipeline(const std::string& pipeline) override {
        script_->attempted_pipelines.push_back(pipeline);
        opened_ = script_->pipeline_works;
        return opened_;
    }
    bool isOpened() const override { return opened_; }
    bool set(int, double) override { return true; }
    double get(int prop) const override {
        if (prop == cv::CAP_PROP_FRAME_WIDTH) return script_->reported_width;
        if (prop == cv::CAP_PROP_FRAME_HEIGHT) return script_->reported_height;
        if (prop == cv::CAP_PROP_FPS) return script_->reported_fps;
        return 0;
    }
    bool read(cv::Mat& frame) override {
        int n = ++script_->reads;
        while (script_->hold_reads) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (!script_->deliver_frames) {
            return false;
        }
        frame = cv::Mat(4, 4, CV_8UC1, cv::Scalar(n % 256));
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return true;
    }
    void release() override {
        opened_ = false;
        script_->releases++;
    }

private:
    DeviceScript* script_;
    bool opened_ = false;
};

std::unique_ptr<FrameSource> makeSource(DeviceScript* script) {
    return std::unique_ptr<FrameSource>(new FrameSource(
        0, 1280, 720, 30, std::unique_ptr<CaptureDevice>(new FakeCaptureDevice(script))));
}

bool waitFor(const std::function<bool()>& cond) {
    for (int i = 0; i < 300; i++) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return cond();
}

} // namespace

TEST(FrameSourceTest, NoBackendThrowsCaptureUnavailable) {
    DeviceScript script;
    auto source = makeSource(&script);

    EXPECT_THROW(source->start(), CaptureUnavailable);
    EXPECT_FALSE(source->isRunning());
    EXPECT_EQ(script.attempted_apis.size(), 3u);
}

TEST(FrameSourceTest, FallsBackToNextBackend) {
    DeviceScript script;
    script.working_apis = {cv::CAP_ANY};
    auto source = makeSource(&script);

    source->start();

    EXPECT_TRUE(source->isRunning());
    EXPECT_EQ(source->getBackendName(), "any");
    ASSERT_EQ(script.attempted_apis.size(), 3u);
    EXPECT_EQ(script.attempted_apis[0], cv::CAP_V4L2);
    EXPECT_EQ(script.attempted_apis[1], cv::CAP_GSTREAMER);
    source->stop();
}

TEST(FrameSourceTest, CustomPipelineTriedFirst) {
    DeviceScript script;
    script.pipeline_works = true;
    auto source = makeSource(&script);
    source->setPipeline("v4l2src ! videoconvert ! appsink");

    source->start();

    EXPECT_EQ(source->getBackendName(), "gstreamer-pipeline");
    EXPECT_TRUE(script.attempted_apis.empty());
    source->stop();
}

TEST(FrameSourceTest, NegotiatedSettingsReadBack) {
    DeviceScript script;
    script.working_apis = {cv::CAP_V4L2};
    script.reported_width = 640;
    script.reported_height = 480;
    script.reported_fps = 15;
    auto source = makeSource(&script);

    source->start();

    EXPECT_EQ(source->getWidth(), 640);
    EXPECT_EQ(source->getHeight(), 480);
    EXPECT_EQ(source->getFps(), 15);
    source->stop();
}

TEST(FrameSourceTest, NoFrameBeforeFirstRead) {
    DeviceScript script;
    auto source = makeSource(&script);

    EXPECT_TRUE(source->getFrame().empty());
}

TEST(FrameSourceTest, LatestFrameWins) {
    DeviceScript script;
    script.working_apis = {cv::CAP_V4L2};
    auto source = makeSource(&script);
    source->start();

    ASSERT_TRUE(waitFor([&] { return source->getFramesCaptured() >= 10; }));
    cv::Mat first = source->getFrame();
    ASSERT_FALSE(first.empty());

    uint64_t captured = source->getFramesCaptured();
    ASSERT_TRUE(waitFor([&] { return source->getFramesCaptured() >= captured + 5; }));
    cv::Mat later = source->getFrame();
    source->stop();

    EXPECT_NE(first.at<uchar>(0, 0), later.at<uchar>(0, 0));
    EXPECT_GT(source->getFramesDropped(), 0u);
}

TEST(FrameSourceTest, ReadFailuresAreRetried) {
    DeviceScript script;
    script.working_apis = {cv::CAP_V4L2};
    script.deliver_frames = false;
    auto source = makeSource(&script);
    source->start();

    ASSERT_TRUE(waitFor([&] { return source->getReadFailures() >= 3; }));
    EXPECT_TRUE(source->isRunning());
    EXPECT_TRUE(source->getFrame().empty());
    source->stop();
}

TEST(FrameSourceTest, StopReleasesDeviceAndClearsFrame) {
    DeviceScript script;
    script.working_apis = {cv::CAP_V4L2};
    auto source = makeSource(&script);
    source->start();
    ASSERT_TRUE(waitFor([&] { return source->getFramesCaptured() >= 1; }));

    int releases_before = script.releases;
    source->stop();

    EXPECT_FALSE(source->isRunning());
    EXPECT_GT(script.releases.load(), releases_before);
    EXPECT_TRUE(source->getFrame().empty());
}

TEST(FrameSourceTest, StartWhileRunningIsNoOp) {
    DeviceScript script;
    script.working_apis = {cv::CAP_V4L2};
    auto source = makeSource(&script);
    source->start();
    size_t attempts = script.attempted_apis.size();

    source->start();

    EXPECT_EQ(script.attempted_apis.size(), attempts);
    source->stop();
}

TEST(FrameSourceTest, StuckReaderIsAbandonedWithinJoinTimeout) {
    DeviceScript script;
    script.working_apis = {cv::CAP_V4L2};
    script.hold_reads = true;
    auto source = makeSource(&script);
    source->setJoinTimeoutMs(50);
    source->start();
    ASSERT_TRUE(waitFor([&] { return script.reads.load() >= 1; }));

    auto t0 = std::chrono::steady_clock::now();
    source->stop();
    auto waited = std::chrono::steady_clock::now() - t0;

    EXPECT_LT(waited, std::chrono::seconds(1));
    EXPECT_FALSE(source->isRunning());
    // Not released under the read still in progress
    EXPECT_EQ(script.releases.load(), 0);

    // Destroyed while the reader is still blocked; it releases the device on its way out
    source.reset();
    script.hold_reads = false;
    EXPECT_TRUE(waitFor([&] { return script.releases.load() == 1; }));
}

TEST(FrameSourceTest, RestartWaitsForAbandonedReader) {
    DeviceScript script;
    script.working_apis = {cv::CAP_V4L2};
    script.hold_reads = true;
    auto source = makeSource(&script);
    source->setJoinTimeoutMs(50);
    source->start();
    ASSERT_TRUE(waitFor([&] { return script.reads.load() >= 1; }));
    source->stop();

    EXPECT_THROW(source->start(), CaptureUnavailable);
    EXPECT_FALSE(source->isRunning());

    script.hold_reads = false;
    ASSERT_TRUE(waitFor([&] { return script.releases.load() == 1; }));

    source->start();
    EXPECT_TRUE(source->isRunning());
    ASSERT_TRUE(waitFor([&] { return source->getFramesCaptured() >= 1; }));
    source->stop();
}
