// image_layer.hpp
#pragma once

#include "layer.hpp"
#include <mutex>
#include <string>

namespace vcamstudio {

// Static picture (usually a PNG template with transparency) stretched over the canvas.
class ImageOverlayLayer : public Layer {
public:
    explicit ImageOverlayLayer(int z_order = 10);

    void render(cv::Mat& canvas, const RenderContext& ctx) override;

    // Returns false and keeps the previous image when the file is missing or undecodable.
    bool loadImage(const std::string& path);
    void setImage(const cv::Mat& image);
    void clearImage();

    bool hasImage() const;
    std::string getImagePath() const;

private:
    mutable std::mutex image_mutex_;
    cv::Mat image_;          // BGR or BGRA as decoded
    cv::Mat scaled_;         // image_ resized to the last canvas size
    std::string image_path_;
};

} // namespace vcamstudio
