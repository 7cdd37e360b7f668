// compositor.cpp
#include "compositor.hpp"

#include <algorithm>
#include <utility>

namespace vcamstudio {

Compositor::Compositor(int width, int height, TimeSource clock)
    : width_(width), height_(height), clock_(std::move(clock)),
      webcam_(std::make_shared<WebcamLayer>(0)),
      template_(std::make_shared<ImageOverlayLayer>(10)),
      ticker_(std::make_shared<TickerLayer>(20)),
      countdown_(std::make_shared<CountdownLayer>(30, clock_)),
      indicators_(std::make_shared<IndicatorLayer>(40)) {
    countdown_->setVisible(false);
    indicators_->setVisible(false);

    addLayer(webcam_);
    addLayer(template_);
    addLayer(ticker_);
    addLayer(countdown_);
    addLayer(indicators_);
}

void Compositor::addLayer(const std::shared_ptr<Layer>& layer) {
    if (!layer) return;
    std::lock_guard<std::mutex> lock(layers_mutex_);
    layers_.push_back(Entry{layer, next_sequence_++});
}

bool Compositor::removeLayer(const std::shared_ptr<Layer>& layer) {
    std::lock_guard<std::mutex> lock(layers_mutex_);
    auto it = std::find_if(layers_.begin(), layers_.end(),
                           [&layer](const Entry& e) { return e.layer == layer; });
    if (it == layers_.end()) {
        return false;
    }
    layers_.erase(it);
    return true;
}

std::vector<std::shared_ptr<Layer>> Compositor::getLayers() const {
    std::vector<Entry> entries;
    {
        std::lock_guard<std::mutex> lock(layers_mutex_);
        entries = layers_;
    }

    // z-order is re-read every time, it may change between frames
    std::vector<std::pair<int, Entry>> keyed;
    keyed.reserve(entries.size());
    for (const auto& e : entries) {
        keyed.emplace_back(e.layer->getZOrder(), e);
    }
    std::sort(keyed.begin(), keyed.end(),
              [](const std::pair<int, Entry>& a, const std::pair<int, Entry>& b) {
                  if (a.first != b.first) return a.first < b.first;
                  return a.second.sequence < b.second.sequence;
              });

    std::vector<std::shared_ptr<Layer>> sorted;
    sorted.reserve(keyed.size());
    for (const auto& k : keyed) {
        sorted.push_back(k.second.layer);
    }
    return sorted;
}

void Compositor::setBackgroundColor(const cv::Scalar& bgr) {
    std::lock_guard<std::mutex> lock(layers_mutex_);
    bg_color_ = bgr;
}

cv::Scalar Compositor::getBackgroundColor() const {
    std::lock_guard<std::mutex> lock(layers_mutex_);
    return bg_color_;
}

cv::Mat Compositor::composeFrame(const cv::Mat& source) {
    return composeFrame(source, clock_());
}

cv::Mat Compositor::composeFrame(const cv::Mat& source, double timestamp) {
    cv::Mat canvas(height_, width_, CV_8UC3, getBackgroundColor());

    for (const auto& layer : getLayers()) {
        if (!layer->shouldRender()) {
            continue;
        }
        RenderContext ctx{width_, height_, timestamp, nullptr};
        if (layer->consumesSourceFrame() && !source.empty()) {
            ctx.source_frame = &source;
        }
        layer->render(canvas, ctx);
    }

    return canvas;
}

} // namespace vcamstudio
