// countdown_layer.cpp
#include "countdown_layer.hpp"
#include "text_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace vcamstudio {

namespace {
const double kFlashThreshold = 30.0;
} // namespace

CountdownLayer::CountdownLayer(int z_order, TimeSource clock)
    : Layer("Countdown", z_order), clock_(std::move(clock)) {}

void CountdownLayer::start() {
    double now = clock_();
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.started = true;
    state_.start_time = now;
    state_.paused = false;
    state_.finished = false;
}

void CountdownLayer::pause() {
    double now = clock_();
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_.started || state_.paused) {
        return;
    }
    double elapsed = now - state_.start_time;
    state_.pause_remaining = std::max(0.0, state_.duration - elapsed);
    state_.paused = true;
}

void CountdownLayer::resume() {
    double now = clock_();
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_.paused) {
        return;
    }
    state_.duration = state_.pause_remaining;
    state_.start_time = now;
    state_.paused = false;
}

void CountdownLayer::togglePause() {
    if (isPaused()) {
        resume();
    } else {
        pause();
    }
}

void CountdownLayer::reset() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.started = false;
    state_.paused = false;
    state_.finished = false;
}

void CountdownLayer::reset(double duration_seconds) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.duration = std::max(0.0, duration_seconds);
    state_.started = false;
    state_.paused = false;
    state_.finished = false;
}

double CountdownLayer::getRemaining() const {
    return getRemainingAt(clock_());
}

double CountdownLayer::getRemainingAt(double now) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_.started) {
        return state_.duration;
    }
    if (state_.paused) {
        return state_.pause_remaining;
    }
    double remaining = std::max(0.0, state_.duration - (now - state_.start_time));
    if (remaining == 0.0) {
        state_.finished = true;
    }
    return remaining;
}

CountdownPhase CountdownLayer::getPhase() const {
    double remaining = getRemaining();
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_.started) return CountdownPhase::Idle;
    if (state_.paused) return CountdownPhase::Paused;
    if (remaining <= 0.0) return CountdownPhase::Finished;
    return CountdownPhase::Running;
}

CountdownState CountdownLayer::getState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool CountdownLayer::isFinished() const {
    getRemaining();
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.finished;
}

void CountdownLayer::setDuration(double seconds) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.duration = std::max(0.0, seconds);
}

double CountdownLayer::getDuration() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.duration;
}

void CountdownLayer::setPosition(const std::string& position) {
    std::lock_guard<std::mutex> lock(style_mutex_);
    position_ = position;
}

std::string CountdownLayer::getPosition() const {
    std::lock_guard<std::mutex> lock(style_mutex_);
    return position_;
}

void CountdownLayer::setLabelText(const std::string& label) {
    std::lock_guard<std::mutex> lock(style_mutex_);
    label_text_ = label;
}

void CountdownLayer::setFontColor(const cv::Scalar& bgr) {
    std::lock_guard<std::mutex> lock(style_mutex_);
    font_color_ = bgr;
}

void CountdownLayer::setBackgroundColor(const cv::Scalar& bgr) {
    std::lock_guard<std::mutex> lock(style_mutex_);
    bg_color_ = bgr;
}

void CountdownLayer::setFlashColor(const cv::Scalar& bgr) {
    std::lock_guard<std::mutex> lock(style_mutex_);
    flash_color_ = bgr;
}

std::string CountdownLayer::formatTime(double seconds) {
    long total = seconds > 0.0 ? static_cast<long>(seconds) : 0;
    char buf[32];
    if (total >= 3600) {
        std::snprintf(buf, sizeof(buf), "%02ld:%02ld:%02ld",
                      total / 3600, (total % 3600) / 60, total % 60);
    } else {
        std::snprintf(buf, sizeof(buf), "%02ld:%02ld", total / 60, total % 60);
    }
    return buf;
}

bool CountdownLayer::flashActive(double remaining) {
    if (remaining > kFlashThreshold) {
        return false;
    }
    long slot = static_cast<long>(std::floor(remaining * 2.0));
    return slot % 2 == 0;
}

void CountdownLayer::render(cv::Mat& canvas, const RenderContext& ctx) {
    if (!visible_) {
        return;
    }

    std::string position, label;
    cv::Scalar font_color, bg_color, flash_color;
    {
        std::lock_guard<std::mutex> lock(style_mutex_);
        position = position_;
        label = label_text_;
        font_color = font_color_;
        bg_color = bg_color_;
        flash_color = flash_color_;
    }

    const TextRenderer& renderer = TextRenderer::instance();
    const int font_size = font_size_;
    const int padding = padding_;
    const bool show_label = show_label_;

    double remaining = getRemainingAt(ctx.timestamp);
    std::string time_str = formatTime(remaining);

    cv::Size time_size = renderer.measure(time_str, font_size, 2);
    cv::Size label_size(0, 0);
    int label_font_size = static_cast<int>(font_size * 0.5);
    if (show_label) {
        label_size = renderer.measure(label, label_font_size, 1);
        label_size.height += 5;
    }

    int box_w = std::max(time_size.width, label_size.width) + padding * 2;
    int box_h = time_size.height + label_size.height + padding * 2;

    cv::Point origin = resolvePosition(position, ctx.canvas_width, ctx.canvas_height, box_w, box_h);
    blendRect(canvas, cv::Rect(origin.x, origin.y, box_w, box_h), bg_color, opacity_);

    int text_y = origin.y + padding;
    if (show_label) {
        int lx = origin.x + (box_w - label_size.width) / 2;
        renderer.draw(canvas, label, cv::Point(lx, text_y), label_font_size, font_color);
        text_y += label_size.height;
    }

    cv::Scalar time_color = flashActive(remaining) ? flash_color : font_color;
    int text_x = origin.x + (box_w - time_size.width) / 2;
    renderer.draw(canvas, time_str, cv::Point(text_x, text_y), font_size, time_color, 2, true);
}

} // namespace vcamstudio
