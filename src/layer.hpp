// layer.hpp
#pragma once

#include <opencv2/core.hpp>
#include <atomic>
#include <string>

namespace vcamstudio {

struct RenderContext {
    int canvas_width;
    int canvas_height;
    double timestamp;                   // seconds, identical for every layer of one composite
    const cv::Mat* source_frame{nullptr};  // only set for layers that consume it
};

// One overlay unit. Properties are atomics so the UI thread can flip them.
class Layer {
public:
    Layer(std::string name, int z_order, bool visible = true, float opacity = 1.0f);
    virtual ~Layer() = default;

    Layer(const Layer&) = delete;
    Layer& operator=(const Layer&) = delete;

    // Draw onto the canvas in place. Must not throw on missing optional inputs.
    virtual void render(cv::Mat& canvas, const RenderContext& ctx) = 0;

    // True for layers that want the camera frame in RenderContext::source_frame.
    virtual bool consumesSourceFrame() const { return false; }

    const std::string& getName() const { return name_; }

    bool isVisible() const { return visible_; }
    void setVisible(bool visible) { visible_ = visible; }

    float getOpacity() const { return opacity_; }
    void setOpacity(float opacity);

    int getZOrder() const { return z_order_; }
    void setZOrder(int z) { z_order_ = z; }

    // Visible and not fully transparent.
    bool shouldRender() const { return visible_ && opacity_ > 0.0f; }

protected:
    std::string name_;
    std::atomic<bool> visible_;
    std::atomic<float> opacity_;
    std::atomic<int> z_order_;
};

// Blending helpers shared by the layers

// dst = src*opacity + dst*(1-opacity); opacity 1 copies straight over.
void blendInto(cv::Mat& dst, const cv::Mat& src, float opacity);

// src is BGRA, per-pixel alpha scaled by opacity.
void blendWithAlpha(cv::Mat& dst, const cv::Mat& src_bgra, float opacity);

// Semi-transparent filled rectangle, clipped to the canvas.
void blendRect(cv::Mat& canvas, const cv::Rect& rect, const cv::Scalar& color, float opacity);

// Converts 1 or 4 channel images to 3 channel BGR, passes BGR through.
cv::Mat toBgr(const cv::Mat& img);

// Named anchor positions. Unknown names land on top-left.
cv::Point resolvePosition(const std::string& name, int canvas_width, int canvas_height,
                          int box_width, int box_height);
cv::Point resolveCornerPosition(const std::string& name, int canvas_width, int canvas_height,
                                int box_width, int box_height);

} // namespace vcamstudio
