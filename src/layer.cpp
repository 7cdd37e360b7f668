// layer.cpp
#include "layer.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <utility>
#include <vector>

namespace vcamstudio {

namespace {

const int kEdgeMargin = 10;
// Bottom anchors sit above the default ticker bar
const int kBottomMargin = 60;

} // namespace

Layer::Layer(std::string name, int z_order, bool visible, float opacity)
    : name_(std::move(name)), visible_(visible), opacity_(1.0f), z_order_(z_order) {
    setOpacity(opacity);
}

void Layer::setOpacity(float opacity) {
    opacity_ = std::min(1.0f, std::max(0.0f, opacity));
}

void blendInto(cv::Mat& dst, const cv::Mat& src, float opacity) {
    if (opacity >= 1.0f) {
        src.copyTo(dst);
    } else if (opacity > 0.0f) {
        cv::addWeighted(src, opacity, dst, 1.0 - opacity, 0.0, dst);
    }
}

void blendWithAlpha(cv::Mat& dst, const cv::Mat& src_bgra, float opacity) {
    CV_Assert(src_bgra.channels() == 4 && dst.channels() == 3);
    CV_Assert(src_bgra.size() == dst.size());

    std::vector<cv::Mat> channels;
    cv::split(src_bgra, channels);

    cv::Mat alpha;
    channels[3].convertTo(alpha, CV_32F, opacity / 255.0);
    cv::Mat alpha3;
    cv::merge(std::vector<cv::Mat>{alpha, alpha, alpha}, alpha3);

    cv::Mat src_bgr;
    cv::merge(std::vector<cv::Mat>{channels[0], channels[1], channels[2]}, src_bgr);

    cv::Mat src_f, dst_f;
    src_bgr.convertTo(src_f, CV_32FC3);
    dst.convertTo(dst_f, CV_32FC3);

    cv::Mat inv_alpha3 = cv::Scalar::all(1.0) - alpha3;
    cv::Mat out = src_f.mul(alpha3) + dst_f.mul(inv_alpha3);
    out.convertTo(dst, CV_8UC3);
}

void blendRect(cv::Mat& canvas, const cv::Rect& rect, const cv::Scalar& color, float opacity) {
    cv::Rect clipped = rect & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (clipped.area() <= 0 || opacity <= 0.0f) {
        return;
    }
    cv::Mat roi = canvas(clipped);
    cv::Mat fill(roi.size(), roi.type(), color);
    blendInto(roi, fill, opacity);
}

cv::Mat toBgr(const cv::Mat& img) {
    cv::Mat bgr;
    switch (img.channels()) {
        case 1:
            cv::cvtColor(img, bgr, cv::COLOR_GRAY2BGR);
            return bgr;
        case 4:
            cv::cvtColor(img, bgr, cv::COLOR_BGRA2BGR);
            return bgr;
        default:
            return img;
    }
}

cv::Point resolvePosition(const std::string& name, int canvas_width, int canvas_height,
                          int box_width, int box_height) {
    if (name == "top-right") {
        return cv::Point(canvas_width - box_width - kEdgeMargin, kEdgeMargin);
    } else if (name == "top-center") {
        return cv::Point((canvas_width - box_width) / 2, kEdgeMargin);
    } else if (name == "center") {
        return cv::Point((canvas_width - box_width) / 2, (canvas_height - box_height) / 2);
    }
    return resolveCornerPosition(name, canvas_width, canvas_height, box_width, box_height);
}

cv::Point resolveCornerPosition(const std::string& name, int canvas_width, int canvas_height,
                                int box_width, int box_height) {
    if (name == "top-right") {
        return cv::Point(canvas_width - box_width - kEdgeMargin, kEdgeMargin);
    } else if (name == "bottom-left") {
        return cv::Point(kEdgeMargin, canvas_height - box_height - kBottomMargin);
    } else if (name == "bottom-right") {
        return cv::Point(canvas_width - box_width - kEdgeMargin,
                         canvas_height - box_height - kBottomMargin);
    }
    // "top-left" and anything unrecognised
    return cv::Point(kEdgeMargin, kEdgeMargin);
}

} // namespace vcamstudio
