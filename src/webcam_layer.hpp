// webcam_layer.hpp
#pragma once

#include "layer.hpp"
#include <atomic>

namespace vcamstudio {

class WebcamLayer : public Layer {
public:
    explicit WebcamLayer(int z_order = 0);

    void render(cv::Mat& canvas, const RenderContext& ctx) override;
    bool consumesSourceFrame() const override { return true; }

    // width/height of 0 mean "use the canvas size"
    void setRegion(int x, int y, int width, int height);
    cv::Rect getRegion(int canvas_width, int canvas_height) const;

    void setFlipHorizontal(bool flip) { flip_horizontal_ = flip; }
    bool getFlipHorizontal() const { return flip_horizontal_; }

private:
    std::atomic<int> x_{0};
    std::atomic<int> y_{0};
    std::atomic<int> width_{0};
    std::atomic<int> height_{0};
    std::atomic<bool> flip_horizontal_{false};
};

} // namespace vcamstudio
