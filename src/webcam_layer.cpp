// webcam_layer.cpp
#include "webcam_layer.hpp"

#include <opencv2/imgproc.hpp>

namespace vcamstudio {

WebcamLayer::WebcamLayer(int z_order)
    : Layer("Webcam", z_order) {}

void WebcamLayer::setRegion(int x, int y, int width, int height) {
    x_ = x;
    y_ = y;
    width_ = width;
    height_ = height;
}

cv::Rect WebcamLayer::getRegion(int canvas_width, int canvas_height) const {
    int w = width_ > 0 ? width_.load() : canvas_width;
    int h = height_ > 0 ? height_.load() : canvas_height;
    return cv::Rect(x_, y_, w, h);
}

void WebcamLayer::render(cv::Mat& canvas, const RenderContext& ctx) {
    if (!visible_ || ctx.source_frame == nullptr || ctx.source_frame->empty()) {
        return;
    }

    cv::Rect region = getRegion(ctx.canvas_width, ctx.canvas_height);
    if (region.width <= 0 || region.height <= 0) {
        return;
    }

    cv::Mat resized;
    cv::resize(toBgr(*ctx.source_frame), resized, region.size());

    if (flip_horizontal_) {
        cv::flip(resized, resized, 1);
    }

    // Regions hanging off the canvas are cropped, not rejected
    cv::Rect visible_part = region & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (visible_part.area() <= 0) {
        return;
    }
    cv::Rect src_part(visible_part.x - region.x, visible_part.y - region.y,
                      visible_part.width, visible_part.height);

    cv::Mat dst = canvas(visible_part);
    blendInto(dst, resized(src_part), opacity_);
}

} // namespace vcamstudio
