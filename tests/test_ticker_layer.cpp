/**
 * @file test_ticker_layer.cpp
 * @brief Unit tests for the scrolling ticker
 */

#include <gtest/gtest.h>
#include <fstream>
#include "compositor.hpp"
#include "ticker_layer.hpp"

using namespace vcamstudio;

namespace {

std::string writeTempFile(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

} // namespace

TEST(TickerLayerTest, DefaultValues) {
    TickerLayer ticker;

    EXPECT_EQ(ticker.getName(), "Ticker");
    EXPECT_EQ(ticker.getZOrder(), 20);
    EXPECT_DOUBLE_EQ(ticker.getScrollOffset(), 0.0);
    EXPECT_FLOAT_EQ(ticker.getScrollSpeed(), 2.0f);
    EXPECT_EQ(ticker.getScrollMode(), ScrollMode::PerFrame);
    EXPECT_EQ(ticker.getFontSize(), 28);
    EXPECT_EQ(ticker.getBarHeight(), 50);
}

TEST(TickerLayerTest, AdvancesBySpeedPerVisibleComposite) {
    Compositor compositor(320, 180, [] { return 0.0; });
    TickerLayer& ticker = compositor.tickerLayer();
    ticker.setText("Breaking news");
    ticker.setScrollSpeed(2.0f);

    cv::Mat source;
    for (int i = 0; i < 100; i++) {
        compositor.composeFrame(source);
    }

    EXPECT_DOUBLE_EQ(ticker.getScrollOffset(), 200.0);
}

TEST(TickerLayerTest, HiddenTickerDoesNotAdvance) {
    Compositor compositor(320, 180, [] { return 0.0; });
    TickerLayer& ticker = compositor.tickerLayer();
    ticker.setText("Breaking news");
    ticker.setScrollOffset(42.0);
    ticker.setVisible(false);

    for (int i = 0; i < 10; i++) {
        compositor.composeFrame(cv::Mat());
    }

    EXPECT_DOUBLE_EQ(ticker.getScrollOffset(), 42.0);
}

TEST(TickerLayerTest, ZeroOpacityCountsAsHidden) {
    Compositor compositor(320, 180, [] { return 0.0; });
    TickerLayer& ticker = compositor.tickerLayer();
    ticker.setText("Breaking news");
    ticker.setOpacity(0.0f);

    compositor.composeFrame(cv::Mat());

    EXPECT_DOUBLE_EQ(ticker.getScrollOffset(), 0.0);
}

TEST(TickerLayerTest, FileLinesJoinedWithSeparator) {
    std::string path = writeTempFile("vcamstudio_ticker.txt", "first\n\n  second  \nthird\n");

    TickerLayer ticker;
    ASSERT_TRUE(ticker.loadTextFromFile(path));

    std::string text = ticker.getText();
    EXPECT_EQ(countOccurrences(text, TickerLayer::kSeparator), 2u);
    EXPECT_EQ(text, std::string("first") + TickerLayer::kSeparator + "second" +
                    TickerLayer::kSeparator + "third");
    EXPECT_EQ(ticker.getTextFile(), path);
}

TEST(TickerLayerTest, LoadResetsScrollOffset) {
    std::string path = writeTempFile("vcamstudio_ticker_reset.txt", "hello\n");

    TickerLayer ticker;
    ticker.setScrollOffset(120.0);
    ASSERT_TRUE(ticker.loadTextFromFile(path));

    EXPECT_DOUBLE_EQ(ticker.getScrollOffset(), 0.0);
}

TEST(TickerLayerTest, MissingFileKeepsText) {
    TickerLayer ticker;
    ticker.setText("kept");

    EXPECT_FALSE(ticker.loadTextFromFile("/nonexistent/ticker.txt"));
    EXPECT_EQ(ticker.getText(), "kept");
}

TEST(TickerLayerTest, ReloadWithoutFileFails) {
    TickerLayer ticker;
    EXPECT_FALSE(ticker.reloadText());
}

TEST(TickerLayerTest, DisplayTextRepeatsOnce) {
    TickerLayer ticker;
    ticker.setText("abc");

    EXPECT_EQ(ticker.getDisplayText(), std::string("abc") + TickerLayer::kSeparator + "abc");
}

TEST(TickerLayerTest, EmptyTextDrawsNothing) {
    TickerLayer ticker;
    cv::Mat canvas(100, 200, CV_8UC3, cv::Scalar(0, 0, 0));

    ticker.render(canvas, RenderContext{200, 100, 0.0, nullptr});

    EXPECT_EQ(cv::countNonZero(canvas.reshape(1)), 0);
    EXPECT_DOUBLE_EQ(ticker.getScrollOffset(), 0.0);
}

TEST(TickerLayerTest, BarPlacement) {
    TickerLayer ticker;

    EXPECT_EQ(ticker.barTop(720), 670);
    ticker.setBarPosition("top");
    EXPECT_EQ(ticker.barTop(720), 0);
    ticker.setBarY(300);
    EXPECT_EQ(ticker.barTop(720), 300);
    ticker.setBarPosition("bottom");
    EXPECT_EQ(ticker.barTop(720), 670);
}

TEST(TickerLayerTest, BarDrawnAtBottom) {
    TickerLayer ticker;
    ticker.setText("x");
    ticker.setBarOpacity(1.0f);
    ticker.setBackgroundColor(cv::Scalar(0, 0, 200));

    cv::Mat canvas(200, 400, CV_8UC3, cv::Scalar(0, 0, 0));
    ticker.render(canvas, RenderContext{400, 200, 0.0, nullptr});

    EXPECT_EQ(canvas.at<cv::Vec3b>(10, 10), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(canvas.at<cv::Vec3b>(199, 0), cv::Vec3b(0, 0, 200));
}

TEST(TickerLayerTest, WallClockModeUsesElapsedTime) {
    TickerLayer ticker;
    ticker.setText("news");
    ticker.setScrollMode(ScrollMode::WallClock);
    ticker.setScrollSpeed(60.0f);

    cv::Mat canvas(100, 200, CV_8UC3);
    ticker.render(canvas, RenderContext{200, 100, 10.0, nullptr});
    EXPECT_DOUBLE_EQ(ticker.getScrollOffset(), 0.0);

    ticker.render(canvas, RenderContext{200, 100, 10.5, nullptr});
    EXPECT_DOUBLE_EQ(ticker.getScrollOffset(), 30.0);

    // A long gap (hidden, stalled) does not jump the text
    ticker.render(canvas, RenderContext{200, 100, 20.0, nullptr});
    EXPECT_DOUBLE_EQ(ticker.getScrollOffset(), 30.0);
}
