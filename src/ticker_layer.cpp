// ticker_layer.cpp
#include "ticker_layer.hpp"
#include "errors.hpp"
#include "text_renderer.hpp"
#include "utils.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace vcamstudio {

const char* const TickerLayer::kSeparator = "     \xE2\x97\x8F     ";  // U+25CF

namespace {

// Longer gaps mean the layer was hidden or the loop stalled
const double kMaxWallClockStep = 1.0;

std::vector<std::string> readLines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw AssetLoadError("Cannot open ticker file: " + path);
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    if (file.bad()) {
        throw AssetLoadError("Error reading ticker file: " + path);
    }
    return lines;
}

} // namespace

TickerLayer::TickerLayer(int z_order)
    : Layer("Ticker", z_order) {}

std::string TickerLayer::joinLines(const std::vector<std::string>& lines) {
    std::string joined;
    for (const auto& raw : lines) {
        std::string line = trim(raw);
        if (line.empty()) continue;
        if (!joined.empty()) joined += kSeparator;
        joined += line;
    }
    return joined;
}

bool TickerLayer::loadTextFromFile(const std::string& path) {
    try {
        std::string joined = joinLines(readLines(path));
        {
            std::lock_guard<std::mutex> lock(text_mutex_);
            text_ = joined;
            text_file_ = path;
        }
        scroll_offset_ = 0.0;
        Logger::log(Logger::INFO, "Loaded ticker text from: " + path);
        return true;
    } catch (const AssetLoadError& e) {
        Logger::log(Logger::ERROR, std::string("Failed to load ticker text: ") + e.what());
        return false;
    }
}

bool TickerLayer::reloadText() {
    std::string path = getTextFile();
    if (path.empty()) {
        return false;
    }
    return loadTextFromFile(path);
}

void TickerLayer::setText(const std::string& text) {
    std::lock_guard<std::mutex> lock(text_mutex_);
    text_ = text;
}

void TickerLayer::setTextLines(const std::vector<std::string>& lines) {
    setText(joinLines(lines));
}

std::string TickerLayer::getText() const {
    std::lock_guard<std::mutex> lock(text_mutex_);
    return text_;
}

std::string TickerLayer::getTextFile() const {
    std::lock_guard<std::mutex> lock(text_mutex_);
    return text_file_;
}

std::string TickerLayer::getDisplayText() const {
    std::string text = getText();
    return text + kSeparator + text;
}

void TickerLayer::setBarPosition(const std::string& position) {
    bar_at_top_ = (position == "top");
    bar_y_ = -1;
}

void TickerLayer::setFontColor(const cv::Scalar& bgr) {
    std::lock_guard<std::mutex> lock(text_mutex_);
    font_color_ = bgr;
}

void TickerLayer::setBackgroundColor(const cv::Scalar& bgr) {
    std::lock_guard<std::mutex> lock(text_mutex_);
    bg_color_ = bgr;
}

int TickerLayer::barTop(int canvas_height) const {
    if (bar_y_ >= 0) {
        return bar_y_;
    }
    return bar_at_top_ ? 0 : canvas_height - bar_height_;
}

void TickerLayer::render(cv::Mat& canvas, const RenderContext& ctx) {
    if (!visible_) {
        return;
    }

    std::string text;
    cv::Scalar font_color, bg_color;
    {
        std::lock_guard<std::mutex> lock(text_mutex_);
        text = text_;
        font_color = font_color_;
        bg_color = bg_color_;
    }
    if (text.empty()) {
        return;
    }

    const int font_size = font_size_;
    const int bar_height = bar_height_;
    const int bar_y = barTop(ctx.canvas_height);

    blendRect(canvas, cv::Rect(0, bar_y, ctx.canvas_width, bar_height), bg_color, bar_opacity_);

    const TextRenderer& renderer = TextRenderer::instance();
    std::string single_text = text + kSeparator;
    std::string full_text = single_text + text;
    int single_width = renderer.measure(single_text, font_size).width;

    int text_y = bar_y + (bar_height - font_size) / 2;

    // The text enters from the right edge and wraps once a full copy has passed
    long long period = static_cast<long long>(single_width) + ctx.canvas_width;
    long long offset = static_cast<long long>(std::floor(scroll_offset_.load()));
    long long wrapped = period > 0 ? ((offset % period) + period) % period : 0;
    int x_pos = ctx.canvas_width - static_cast<int>(wrapped);

    renderer.draw(canvas, full_text, cv::Point(x_pos, text_y), font_size, font_color);

    advanceScroll(ctx.timestamp);
}

void TickerLayer::advanceScroll(double timestamp) {
    if (scroll_mode_ == ScrollMode::PerFrame) {
        scroll_offset_ = scroll_offset_ + scroll_speed_;
        last_render_ts_ = timestamp;
        return;
    }

    double dt = 0.0;
    if (last_render_ts_ >= 0.0) {
        dt = timestamp - last_render_ts_;
        if (dt < 0.0 || dt > kMaxWallClockStep) {
            dt = 0.0;
        }
    }
    last_render_ts_ = timestamp;
    scroll_offset_ = scroll_offset_ + scroll_speed_ * dt;
}

} // namespace vcamstudio
