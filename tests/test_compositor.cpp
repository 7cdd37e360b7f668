/**
 * @file test_compositor.cpp
 * @brief Unit tests for the layer stack and frame composition
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "compositor.hpp"

using namespace vcamstudio;

namespace {

// Fills the canvas and records the call order.
class SolidLayer : public Layer {
public:
    SolidLayer(const std::string& name, int z, cv::Scalar color, std::vector<std::string>* log)
        : Layer(name, z), color_(color), log_(log) {}

    void render(cv::Mat& canvas, const RenderContext&) override {
        canvas.setTo(color_);
        if (log_) log_->push_back(name_);
        renders++;
    }

    int renders = 0;

private:
    cv::Scalar color_;
    std::vector<std::string>* log_;
};


} // namespace

TEST(CompositorTest, DefaultLayerStack) {
    Compositor compositor(64, 48);
    auto layers = compositor.getLayers();

    ASSERT_EQ(layers.size(), 5u);
    EXPECT_EQ(layers[0]->getName(), "Webcam");
    EXPECT_EQ(layers[1]->getName(), "Template");
    EXPECT_EQ(layers[2]->getName(), "Ticker");
    EXPECT_EQ(layers[3]->getName(), "Countdown");
    EXPECT_EQ(layers[4]->getName(), "Indicators");

    EXPECT_TRUE(compositor.webcamLayer().isVisible());
    EXPECT_TRUE(compositor.tickerLayer().isVisible());
    EXPECT_FALSE(compositor.countdownLayer().isVisible());
    EXPECT_FALSE(compositor.indicatorLayer().isVisible());
}

TEST(CompositorTest, OutputHasConfiguredSize) {
    Compositor compositor(64, 48, [] { return 0.0; });
    cv::Mat out = compositor.composeFrame(cv::Mat(10, 10, CV_8UC3, cv::Scalar(1, 2, 3)));

    EXPECT_EQ(out.cols, 64);
    EXPECT_EQ(out.rows, 48);
    EXPECT_EQ(out.type(), CV_8UC3);
}

TEST(CompositorTest, AbsentSourceGivesBackground) {
    Compositor compositor(64, 48, [] { return 0.0; });
    compositor.setBackgroundColor(cv::Scalar(12, 34, 56));

    cv::Mat out = compositor.composeFrame(cv::Mat());

    EXPECT_EQ(out.at<cv::Vec3b>(24, 32), cv::Vec3b(12, 34, 56));
}

TEST(CompositorTest, SourceFillsCanvas) {
    Compositor compositor(64, 48, [] { return 0.0; });
    cv::Mat source(24, 32, CV_8UC3, cv::Scalar(0, 255, 0));

    cv::Mat out = compositor.composeFrame(source);

    EXPECT_EQ(out.at<cv::Vec3b>(47, 63), cv::Vec3b(0, 255, 0));
}

TEST(CompositorTest, ZOrderThenInsertionOrder) {
    Compositor compositor(64, 48, [] { return 0.0; });
    for (const auto& layer : compositor.getLayers()) {
        compositor.removeLayer(layer);
    }

    std::vector<std::string> log;
    auto a = std::make_shared<SolidLayer>("a", 5, cv::Scalar(1, 1, 1), &log);
    auto b = std::make_shared<SolidLayer>("b", 1, cv::Scalar(2, 2, 2), &log);
    auto c = std::make_shared<SolidLayer>("c", 5, cv::Scalar(3, 3, 3), &log);
    compositor.addLayer(a);
    compositor.addLayer(b);
    compositor.addLayer(c);

    cv::Mat out = compositor.composeFrame(cv::Mat());

    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log[0], "b");
    EXPECT_EQ(log[1], "a");
    EXPECT_EQ(log[2], "c");
    EXPECT_EQ(out.at<cv::Vec3b>(0, 0), cv::Vec3b(3, 3, 3));
}

TEST(CompositorTest, ZOrderChangeTakesEffectNextFrame) {
    Compositor compositor(64, 48, [] { return 0.0; });
    std::vector<std::string> log;
    auto low = std::make_shared<SolidLayer>("low", 100, cv::Scalar(1, 1, 1), &log);
    auto high = std::make_shared<SolidLayer>("high", 200, cv::Scalar(2, 2, 2), &log);
    compositor.addLayer(low);
    compositor.addLayer(high);

    low->setZOrder(300);
    cv::Mat out = compositor.composeFrame(cv::Mat());

    EXPECT_EQ(out.at<cv::Vec3b>(0, 0), cv::Vec3b(1, 1, 1));
}

TEST(CompositorTest, InvisibleLayerIsSkipped) {
    Compositor compositor(64, 48, [] { return 0.0; });
    auto layer = std::make_shared<SolidLayer>("solid", 100, cv::Scalar(9, 9, 9), nullptr);
    compositor.addLayer(layer);
    layer->setVisible(false);

    cv::Mat out = compositor.composeFrame(cv::Mat());

    EXPECT_EQ(layer->renders, 0);
    EXPECT_EQ(out.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));
}

TEST(CompositorTest, TransparentLayerIsSkipped) {
    Compositor compositor(64, 48, [] { return 0.0; });
    auto layer = std::make_shared<SolidLayer>("solid", 100, cv::Scalar(9, 9, 9), nullptr);
    compositor.addLayer(layer);
    layer->setOpacity(0.0f);

    compositor.composeFrame(cv::Mat());

    EXPECT_EQ(layer->renders, 0);
}

TEST(CompositorTest, RemoveLayer) {
    Compositor compositor(64, 48, [] { return 0.0; });
    auto layer = std::make_shared<SolidLayer>("solid", 100, cv::Scalar(9, 9, 9), nullptr);
    compositor.addLayer(layer);

    EXPECT_TRUE(compositor.removeLayer(layer));
    EXPECT_FALSE(compositor.removeLayer(layer));
    EXPECT_EQ(compositor.getLayers().size(), 5u);
}

TEST(CompositorTest, CountdownFollowsCompositorClock) {
    auto now = std::make_shared<double>(50.0);
    Compositor compositor(64, 48, [now] { return *now; });
    CountdownLayer& countdown = compositor.countdownLayer();
    countdown.reset(60.0);
    countdown.start();

    *now += 15.0;

    EXPECT_DOUBLE_EQ(countdown.getRemaining(), 45.0);
}
