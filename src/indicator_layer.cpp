// indicator_layer.cpp
#include "indicator_layer.hpp"
#include "errors.hpp"
#include "text_renderer.hpp"
#include "utils.hpp"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace vcamstudio {

namespace {

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw AssetLoadError("Cannot open indicators file: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw AssetLoadError("Error reading indicators file: " + path);
    }
    return ss.str();
}

std::string scalarOrEmpty(const YAML::Node& node) {
    if (node && node.IsScalar()) {
        return node.Scalar();
    }
    return "";
}

// YAML flow syntax tolerates "[a, b,]", JSON does not
bool hasTrailingComma(const std::string& content) {
    bool in_string = false;
    bool escaped = false;
    char last = 0;
    for (char c : content) {
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
                last = c;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if ((c == ']' || c == '}') && last == ',') {
            return true;
        }
        last = c;
    }
    return false;
}

// JSON is read through the YAML parser; flow syntax is a subset of YAML 1.2.
bool parseJsonArray(const std::string& content, std::vector<Indicator>& out) {
    if (content.empty() || content[0] != '[') {
        return false;
    }
    if (hasTrailingComma(content)) {
        Logger::log(Logger::DEBUG, "Indicators are not JSON: trailing comma");
        return false;
    }

    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        Logger::log(Logger::DEBUG, std::string("Indicators are not JSON: ") + e.what());
        return false;
    }
    if (!root.IsSequence()) {
        return false;
    }

    for (const auto& item : root) {
        if (!item.IsMap()) {
            Logger::log(Logger::WARNING, "Skipping indicator entry that is not an object");
            continue;
        }
        Indicator ind;
        ind.label = scalarOrEmpty(item["label"]);
        ind.value = scalarOrEmpty(item["value"]);

        const YAML::Node color = item["color"];
        if (color && color.IsSequence() && color.size() >= 3) {
            try {
                ind.color = rgbToBgr(color[0].as<int>(), color[1].as<int>(), color[2].as<int>());
                ind.has_color = true;
            } catch (const YAML::Exception&) {
                Logger::log(Logger::WARNING, "Ignoring malformed color for indicator '" + ind.label + "'");
            }
        }
        out.push_back(ind);
    }
    return true;
}

} // namespace

std::string Indicator::displayText() const {
    if (label.empty()) {
        return value;
    }
    return label + ": " + value;
}

IndicatorLayer::IndicatorLayer(int z_order)
    : Layer("Indicators", z_order) {}

std::vector<Indicator> IndicatorLayer::parseLines(const std::string& content) {
    std::vector<Indicator> indicators;
    std::istringstream in(content);
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = trim(raw);
        if (line.empty()) continue;

        Indicator ind;
        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            ind.label = trim(line.substr(0, colon));
            ind.value = trim(line.substr(colon + 1));
        } else {
            ind.value = line;
        }
        indicators.push_back(ind);
    }
    return indicators;
}

std::vector<Indicator> IndicatorLayer::parse(const std::string& content) {
    std::string trimmed = trim(content);
    std::vector<Indicator> indicators;
    if (parseJsonArray(trimmed, indicators)) {
        return indicators;
    }
    return parseLines(trimmed);
}

bool IndicatorLayer::loadIndicators(const std::string& path) {
    try {
        std::vector<Indicator> parsed = parse(readFile(path));
        size_t count = parsed.size();
        {
            std::lock_guard<std::mutex> lock(data_mutex_);
            indicators_ = std::move(parsed);
            indicators_file_ = path;
        }
        Logger::log(Logger::INFO, "Loaded " + std::to_string(count) + " indicators from " + path);
        return true;
    } catch (const AssetLoadError& e) {
        Logger::log(Logger::ERROR, std::string("Failed to load indicators: ") + e.what());
        return false;
    }
}

bool IndicatorLayer::reload() {
    std::string path = getIndicatorsFile();
    if (path.empty()) {
        return false;
    }
    reload_count_++;
    return loadIndicators(path);
}

std::vector<Indicator> IndicatorLayer::getIndicators() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return indicators_;
}

void IndicatorLayer::setIndicators(const std::vector<Indicator>& indicators) {
    std::lock_guard<std::mutex> lock(data_mutex_);
    indicators_ = indicators;
}

std::string IndicatorLayer::getIndicatorsFile() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return indicators_file_;
}

void IndicatorLayer::setPosition(const std::string& position) {
    std::lock_guard<std::mutex> lock(data_mutex_);
    position_ = position;
}

std::string IndicatorLayer::getPosition() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return position_;
}

void IndicatorLayer::setFontColor(const cv::Scalar& bgr) {
    std::lock_guard<std::mutex> lock(data_mutex_);
    font_color_ = bgr;
}

void IndicatorLayer::setBackgroundColor(const cv::Scalar& bgr) {
    std::lock_guard<std::mutex> lock(data_mutex_);
    bg_color_ = bgr;
}

void IndicatorLayer::render(cv::Mat& canvas, const RenderContext& ctx) {
    if (!visible_) {
        return;
    }

    // Checked before the empty test so a file that started empty is picked up
    if (auto_reload_ && !getIndicatorsFile().empty() &&
        ctx.timestamp - last_reload_ > reload_interval_) {
        reload();
        last_reload_ = ctx.timestamp;
    }

    std::vector<Indicator> indicators;
    std::string position;
    cv::Scalar font_color, bg_color;
    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        indicators = indicators_;
        position = position_;
        font_color = font_color_;
        bg_color = bg_color_;
    }
    if (indicators.empty()) {
        return;
    }

    const TextRenderer& renderer = TextRenderer::instance();
    const int font_size = font_size_;
    const int padding = padding_;
    const int spacing = item_spacing_;

    int max_w = 0;
    int total_h = padding;
    std::vector<int> item_heights;
    item_heights.reserve(indicators.size());
    for (const auto& ind : indicators) {
        cv::Size size = renderer.measure(ind.displayText(), font_size);
        max_w = std::max(max_w, size.width);
        item_heights.push_back(size.height);
        total_h += size.height + spacing;
    }
    total_h += padding;

    int box_w = max_w + padding * 2;
    int box_h = total_h;

    cv::Point origin = resolveCornerPosition(position, ctx.canvas_width, ctx.canvas_height, box_w, box_h);
    blendRect(canvas, cv::Rect(origin.x, origin.y, box_w, box_h), bg_color, opacity_ * 0.8f);

    int y = origin.y + padding;
    for (size_t i = 0; i < indicators.size(); i++) {
        const Indicator& ind = indicators[i];
        renderer.draw(canvas, ind.displayText(), cv::Point(origin.x + padding, y), font_size,
                      ind.has_color ? ind.color : font_color);
        y += item_heights[i] + spacing;
    }
}

} // namespace vcamstudio
