// ticker_layer.hpp
#pragma once

#include "layer.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace vcamstudio {

enum class ScrollMode {
    PerFrame = 0,   // offset += speed after every visible render
    WallClock = 1   // offset += speed * elapsed seconds
};

// News-style scrolling text bar.
class TickerLayer : public Layer {
public:
    static const char* const kSeparator;

    explicit TickerLayer(int z_order = 20);

    void render(cv::Mat& canvas, const RenderContext& ctx) override;

    bool loadTextFromFile(const std::string& path);
    bool reloadText();
    void setText(const std::string& text);
    void setTextLines(const std::vector<std::string>& lines);
    std::string getText() const;
    std::string getTextFile() const;

    // The scrolling string: text + separator + text
    std::string getDisplayText() const;

    double getScrollOffset() const { return scroll_offset_; }
    void setScrollOffset(double offset) { scroll_offset_ = offset; }

    float getScrollSpeed() const { return scroll_speed_; }
    void setScrollSpeed(float speed) { scroll_speed_ = speed; }

    ScrollMode getScrollMode() const { return scroll_mode_; }
    void setScrollMode(ScrollMode mode) { scroll_mode_ = mode; }

    void setFontSize(int size) { font_size_ = size; }
    int getFontSize() const { return font_size_; }
    void setBarHeight(int height) { bar_height_ = height; }
    int getBarHeight() const { return bar_height_; }
    void setBarOpacity(float opacity) { bar_opacity_ = opacity; }
    // "bottom" or "top"
    void setBarPosition(const std::string& position);
    // Explicit bar top edge; negative restores the named position
    void setBarY(int y) { bar_y_ = y; }

    void setFontColor(const cv::Scalar& bgr);
    void setBackgroundColor(const cv::Scalar& bgr);

    // Top edge of the bar for a canvas of this height
    int barTop(int canvas_height) const;

    static std::string joinLines(const std::vector<std::string>& lines);

private:
    mutable std::mutex text_mutex_;
    std::string text_;
    std::string text_file_;
    cv::Scalar font_color_{255, 255, 255};
    cv::Scalar bg_color_{30, 30, 30};

    std::atomic<int> font_size_{28};
    std::atomic<int> bar_height_{50};
    std::atomic<float> bar_opacity_{0.85f};
    std::atomic<bool> bar_at_top_{false};
    std::atomic<int> bar_y_{-1};

    std::atomic<double> scroll_offset_{0.0};
    std::atomic<float> scroll_speed_{2.0f};
    std::atomic<ScrollMode> scroll_mode_{ScrollMode::PerFrame};
    double last_render_ts_{-1.0};

    void advanceScroll(double timestamp);
};

} // namespace vcamstudio
