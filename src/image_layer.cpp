// image_layer.cpp
#include "image_layer.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <fstream>

namespace vcamstudio {

namespace {

cv::Mat decodeImage(const std::string& path) {
    if (path.empty() || !std::ifstream(path).good()) {
        throw AssetLoadError("Image not found: " + path);
    }

    cv::Mat img;
    try {
        img = cv::imread(path, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw AssetLoadError("Failed to decode image " + path + ": " + e.what());
    }
    if (img.empty()) {
        throw AssetLoadError("Failed to decode image: " + path);
    }

    if (img.depth() != CV_8U) {
        // 16-bit PNGs and friends
        double scale = img.depth() == CV_16U ? 1.0 / 257.0 : 1.0;
        img.convertTo(img, CV_8U, scale);
    }
    if (img.channels() == 1) {
        cv::cvtColor(img, img, cv::COLOR_GRAY2BGR);
    }
    return img;
}

} // namespace

ImageOverlayLayer::ImageOverlayLayer(int z_order)
    : Layer("Template", z_order) {}

bool ImageOverlayLayer::loadImage(const std::string& path) {
    try {
        cv::Mat img = decodeImage(path);
        {
            std::lock_guard<std::mutex> lock(image_mutex_);
            image_ = img;
            scaled_.release();
            image_path_ = path;
        }
        Logger::log(Logger::INFO, "Loaded overlay image: " + path);
        return true;
    } catch (const AssetLoadError& e) {
        Logger::log(Logger::WARNING, e.what());
        return false;
    }
}

void ImageOverlayLayer::setImage(const cv::Mat& image) {
    std::lock_guard<std::mutex> lock(image_mutex_);
    image_ = image.channels() == 1 ? toBgr(image) : image.clone();
    scaled_.release();
    image_path_.clear();
}

void ImageOverlayLayer::clearImage() {
    std::lock_guard<std::mutex> lock(image_mutex_);
    image_.release();
    scaled_.release();
    image_path_.clear();
}

bool ImageOverlayLayer::hasImage() const {
    std::lock_guard<std::mutex> lock(image_mutex_);
    return !image_.empty();
}

std::string ImageOverlayLayer::getImagePath() const {
    std::lock_guard<std::mutex> lock(image_mutex_);
    return image_path_;
}

void ImageOverlayLayer::render(cv::Mat& canvas, const RenderContext& ctx) {
    if (!visible_) {
        return;
    }

    cv::Mat overlay;
    {
        std::lock_guard<std::mutex> lock(image_mutex_);
        if (image_.empty()) {
            return;
        }
        cv::Size canvas_size(ctx.canvas_width, ctx.canvas_height);
        if (scaled_.size() != canvas_size) {
            cv::resize(image_, scaled_, canvas_size);
        }
        overlay = scaled_;
    }

    if (overlay.channels() == 4) {
        blendWithAlpha(canvas, overlay, opacity_);
    } else {
        blendInto(canvas, overlay, opacity_);
    }
}

} // namespace vcamstudio
