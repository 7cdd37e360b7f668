/**
 * @file test_countdown_layer.cpp
 * @brief Unit tests for the countdown timer state machine and rendering
 */

#include <gtest/gtest.h>
#include <memory>
#include "countdown_layer.hpp"

using namespace vcamstudio;

namespace {

class CountdownLayerTest : public ::testing::Test {
protected:
    std::shared_ptr<double> now_ = std::make_shared<double>(1000.0);
    CountdownLayer countdown_{30, [this] { return *now_; }};

    void advance(double seconds) { *now_ += seconds; }
};

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// State machine
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(CountdownLayerTest, DefaultValues) {
    EXPECT_EQ(countdown_.getName(), "Countdown");
    EXPECT_EQ(countdown_.getPhase(), CountdownPhase::Idle);
    EXPECT_DOUBLE_EQ(countdown_.getDuration(), 300.0);
    EXPECT_DOUBLE_EQ(countdown_.getRemaining(), 300.0);
    EXPECT_EQ(countdown_.getPosition(), "top-right");
}

TEST_F(CountdownLayerTest, IdleRemainingIsFullDuration) {
    advance(50.0);
    EXPECT_DOUBLE_EQ(countdown_.getRemaining(), 300.0);
}

TEST_F(CountdownLayerTest, RunningCountsDown) {
    countdown_.start();
    advance(12.5);

    EXPECT_TRUE(countdown_.isRunning());
    EXPECT_DOUBLE_EQ(countdown_.getRemaining(), 287.5);
}

TEST_F(CountdownLayerTest, PauseResumeArithmetic) {
    countdown_.reset(100.0);
    countdown_.start();
    advance(30.0);
    countdown_.pause();

    EXPECT_TRUE(countdown_.isPaused());
    EXPECT_DOUBLE_EQ(countdown_.getRemaining(), 70.0);

    // Time spent paused is not counted
    advance(500.0);
    EXPECT_DOUBLE_EQ(countdown_.getRemaining(), 70.0);

    countdown_.resume();
    EXPECT_DOUBLE_EQ(countdown_.getDuration(), 70.0);
    advance(20.0);
    EXPECT_DOUBLE_EQ(countdown_.getRemaining(), 50.0);
}

TEST_F(CountdownLayerTest, TogglePauseFlipsState) {
    countdown_.start();
    countdown_.togglePause();
    EXPECT_EQ(countdown_.getPhase(), CountdownPhase::Paused);
    countdown_.togglePause();
    EXPECT_EQ(countdown_.getPhase(), CountdownPhase::Running);
}

TEST_F(CountdownLayerTest, PauseWhileIdleIsIgnored) {
    countdown_.pause();
    EXPECT_EQ(countdown_.getPhase(), CountdownPhase::Idle);

    countdown_.resume();
    EXPECT_EQ(countdown_.getPhase(), CountdownPhase::Idle);
}

TEST_F(CountdownLayerTest, NeverBelowZero) {
    countdown_.reset(10.0);
    countdown_.start();
    advance(25.0);

    EXPECT_DOUBLE_EQ(countdown_.getRemaining(), 0.0);
    EXPECT_TRUE(countdown_.isFinished());
    EXPECT_EQ(countdown_.getPhase(), CountdownPhase::Finished);
}

TEST_F(CountdownLayerTest, ResetReturnsToIdle) {
    countdown_.reset(60.0);
    countdown_.start();
    advance(61.0);
    ASSERT_TRUE(countdown_.isFinished());

    countdown_.reset();

    EXPECT_EQ(countdown_.getPhase(), CountdownPhase::Idle);
    EXPECT_FALSE(countdown_.isFinished());
    EXPECT_DOUBLE_EQ(countdown_.getRemaining(), 60.0);
}

TEST_F(CountdownLayerTest, StartWhileRunningRestarts) {
    countdown_.reset(100.0);
    countdown_.start();
    advance(40.0);
    countdown_.start();

    EXPECT_DOUBLE_EQ(countdown_.getRemaining(), 100.0);
}

TEST_F(CountdownLayerTest, NegativeDurationClampedToZero) {
    countdown_.reset(-5.0);
    EXPECT_DOUBLE_EQ(countdown_.getDuration(), 0.0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Formatting
// ─────────────────────────────────────────────────────────────────────────────

TEST(CountdownFormatTest, MinutesAndSeconds) {
    EXPECT_EQ(CountdownLayer::formatTime(0.0), "00:00");
    EXPECT_EQ(CountdownLayer::formatTime(59.9), "00:59");
    EXPECT_EQ(CountdownLayer::formatTime(300.0), "05:00");
    EXPECT_EQ(CountdownLayer::formatTime(3599.0), "59:59");
}

TEST(CountdownFormatTest, HoursWhenOverAnHour) {
    EXPECT_EQ(CountdownLayer::formatTime(3600.0), "01:00:00");
    EXPECT_EQ(CountdownLayer::formatTime(3725.0), "01:02:05");
}

TEST(CountdownFormatTest, NegativeShownAsZero) {
    EXPECT_EQ(CountdownLayer::formatTime(-3.0), "00:00");
}

TEST(CountdownFormatTest, FlashOnlyInLastThirtySeconds) {
    EXPECT_FALSE(CountdownLayer::flashActive(45.0));
    EXPECT_TRUE(CountdownLayer::flashActive(30.0));
    EXPECT_FALSE(CountdownLayer::flashActive(29.6));
    EXPECT_TRUE(CountdownLayer::flashActive(29.4));
    EXPECT_TRUE(CountdownLayer::flashActive(0.0));
}

// ─────────────────────────────────────────────────────────────────────────────
// Rendering
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(CountdownLayerTest, UnknownPositionFallsBackToTopLeft) {
    countdown_.setPosition("somewhere");
    countdown_.setBackgroundColor(cv::Scalar(0, 200, 0));

    cv::Mat canvas(720, 1280, CV_8UC3, cv::Scalar(0, 0, 0));
    countdown_.render(canvas, RenderContext{1280, 720, *now_, nullptr});

    EXPECT_EQ(canvas.at<cv::Vec3b>(12, 12), cv::Vec3b(0, 200, 0));
    EXPECT_EQ(canvas.at<cv::Vec3b>(12, 1270), cv::Vec3b(0, 0, 0));
}

TEST_F(CountdownLayerTest, DefaultPositionIsTopRight) {
    countdown_.setBackgroundColor(cv::Scalar(0, 200, 0));

    cv::Mat canvas(720, 1280, CV_8UC3, cv::Scalar(0, 0, 0));
    countdown_.render(canvas, RenderContext{1280, 720, *now_, nullptr});

    EXPECT_EQ(canvas.at<cv::Vec3b>(12, 1267), cv::Vec3b(0, 200, 0));
    EXPECT_EQ(canvas.at<cv::Vec3b>(12, 12), cv::Vec3b(0, 0, 0));
}
