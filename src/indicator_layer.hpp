// indicator_layer.hpp
#pragma once

#include "layer.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace vcamstudio {

struct Indicator {
    std::string label;
    std::string value;
    bool has_color{false};
    cv::Scalar color;   // BGR

    // "label: value", or just the value when there is no label
    std::string displayText() const;
};

// Panel of label/value lines fed from a JSON or "label: value" text file.
class IndicatorLayer : public Layer {
public:
    explicit IndicatorLayer(int z_order = 40);

    void render(cv::Mat& canvas, const RenderContext& ctx) override;

    bool loadIndicators(const std::string& path);
    bool reload();

    std::vector<Indicator> getIndicators() const;
    void setIndicators(const std::vector<Indicator>& indicators);
    std::string getIndicatorsFile() const;
    int getReloadCount() const { return reload_count_; }

    void setAutoReload(bool enabled) { auto_reload_ = enabled; }
    bool getAutoReload() const { return auto_reload_; }
    void setReloadInterval(double seconds) { reload_interval_ = seconds; }
    double getReloadInterval() const { return reload_interval_; }

    void setPosition(const std::string& position);
    std::string getPosition() const;
    void setFontSize(int size) { font_size_ = size; }
    void setPadding(int padding) { padding_ = padding; }
    void setItemSpacing(int spacing) { item_spacing_ = spacing; }
    void setFontColor(const cv::Scalar& bgr);
    void setBackgroundColor(const cv::Scalar& bgr);

    // JSON array first, "label: value" lines otherwise
    static std::vector<Indicator> parse(const std::string& content);
    static std::vector<Indicator> parseLines(const std::string& content);

private:
    mutable std::mutex data_mutex_;
    std::vector<Indicator> indicators_;
    std::string indicators_file_;
    std::string position_{"top-left"};
    cv::Scalar font_color_{255, 255, 255};
    cv::Scalar bg_color_{40, 40, 40};

    std::atomic<int> font_size_{22};
    std::atomic<int> padding_{10};
    std::atomic<int> item_spacing_{5};
    std::atomic<bool> auto_reload_{true};
    std::atomic<double> reload_interval_{5.0};
    std::atomic<int> reload_count_{0};
    double last_reload_{0.0};
};

} // namespace vcamstudio
