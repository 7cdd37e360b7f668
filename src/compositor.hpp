// compositor.hpp
#pragma once

#include <opencv2/core.hpp>
#include <memory>
#include <mutex>
#include <vector>

#include "countdown_layer.hpp"
#include "image_layer.hpp"
#include "indicator_layer.hpp"
#include "layer.hpp"
#include "ticker_layer.hpp"
#include "utils.hpp"
#include "webcam_layer.hpp"

namespace vcamstudio {

// Owns the layer stack and produces one composed BGR canvas per call.
class Compositor {
public:
    Compositor(int width = 1280, int height = 720, TimeSource clock = wallClockSeconds);

    // Empty source is fine, the webcam layer just passes through.
    cv::Mat composeFrame(const cv::Mat& source);
    cv::Mat composeFrame(const cv::Mat& source, double timestamp);

    void addLayer(const std::shared_ptr<Layer>& layer);
    bool removeLayer(const std::shared_ptr<Layer>& layer);
    // Render order: z-order ascending, insertion order on ties
    std::vector<std::shared_ptr<Layer>> getLayers() const;

    WebcamLayer& webcamLayer() { return *webcam_; }
    ImageOverlayLayer& templateLayer() { return *template_; }
    TickerLayer& tickerLayer() { return *ticker_; }
    CountdownLayer& countdownLayer() { return *countdown_; }
    IndicatorLayer& indicatorLayer() { return *indicators_; }

    void setBackgroundColor(const cv::Scalar& bgr);
    cv::Scalar getBackgroundColor() const;
    int getWidth() const { return width_; }
    int getHeight() const { return height_; }

private:
    struct Entry {
        std::shared_ptr<Layer> layer;
        uint64_t sequence;
    };

    int width_;
    int height_;
    TimeSource clock_;

    std::shared_ptr<WebcamLayer> webcam_;
    std::shared_ptr<ImageOverlayLayer> template_;
    std::shared_ptr<TickerLayer> ticker_;
    std::shared_ptr<CountdownLayer> countdown_;
    std::shared_ptr<IndicatorLayer> indicators_;

    mutable std::mutex layers_mutex_;
    std::vector<Entry> layers_;
    uint64_t next_sequence_{0};
    cv::Scalar bg_color_{0, 0, 0};
};

} // namespace vcamstudio
