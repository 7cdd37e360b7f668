// countdown_layer.hpp
#pragma once

#include "layer.hpp"
#include "utils.hpp"
#include <atomic>
#include <mutex>
#include <string>

namespace vcamstudio {

enum class CountdownPhase {
    Idle,
    Running,
    Paused,
    Finished
};

struct CountdownState {
    double duration{300.0};      // seconds
    bool started{false};
    double start_time{0.0};
    bool paused{false};
    double pause_remaining{0.0};
    bool finished{false};
};

// Countdown timer box. Idle -> Running <-> Paused, reset() returns to Idle.
// resume() restarts from the time left at pause(); remaining never drops below 0.
class CountdownLayer : public Layer {
public:
    explicit CountdownLayer(int z_order = 30, TimeSource clock = wallClockSeconds);

    void render(cv::Mat& canvas, const RenderContext& ctx) override;

    void start();
    void pause();
    void resume();
    void togglePause();
    void reset();
    void reset(double duration_seconds);

    double getRemaining() const;
    double getRemainingAt(double now) const;
    CountdownPhase getPhase() const;
    CountdownState getState() const;
    bool isRunning() const { return getPhase() == CountdownPhase::Running; }
    bool isPaused() const { return getPhase() == CountdownPhase::Paused; }
    bool isFinished() const;

    void setDuration(double seconds);
    double getDuration() const;

    void setPosition(const std::string& position);
    std::string getPosition() const;
    void setLabelText(const std::string& label);
    void setShowLabel(bool show) { show_label_ = show; }
    void setFontSize(int size) { font_size_ = size; }
    void setPadding(int padding) { padding_ = padding; }
    void setFontColor(const cv::Scalar& bgr);
    void setBackgroundColor(const cv::Scalar& bgr);
    void setFlashColor(const cv::Scalar& bgr);

    // MM:SS, or HH:MM:SS from one hour up. Fractions are truncated.
    static std::string formatTime(double seconds);
    // Low-time flash: on for the even half-second slots of the last 30 s
    static bool flashActive(double remaining);

private:
    TimeSource clock_;

    mutable std::mutex state_mutex_;
    mutable CountdownState state_;

    mutable std::mutex style_mutex_;
    std::string position_{"top-right"};
    std::string label_text_{"TEMPO"};
    cv::Scalar font_color_{255, 255, 255};
    cv::Scalar bg_color_{30, 30, 200};
    cv::Scalar flash_color_{100, 100, 255};

    std::atomic<bool> show_label_{true};
    std::atomic<int> font_size_{48};
    std::atomic<int> padding_{15};
};

} // namespace vcamstudio
