// config.cpp
#include "config.hpp"
#include "compositor.hpp"
#include "utils.hpp"

#include <getopt.h>
#include <iostream>

namespace vcamstudio {

void loadConfig(const YAML::Node& root, AppConfig& cfg) {
    if (!root || !root.IsMap()) {
        return;
    }

    cfg.log_level = root["log_level"].as<std::string>(cfg.log_level);
    cfg.show_window = root["show_window"].as<bool>(cfg.show_window);
    cfg.font_path = root["font_path"].as<std::string>(cfg.font_path);

    if (const YAML::Node cam = root["camera"]) {
        cfg.camera.device = cam["input_device"].as<int>(cfg.camera.device);
        cfg.camera.width = cam["width"].as<int>(cfg.camera.width);
        cfg.camera.height = cam["height"].as<int>(cfg.camera.height);
        cfg.camera.fps = cam["fps"].as<int>(cfg.camera.fps);
        cfg.camera.pipeline = cam["pipeline"].as<std::string>(cfg.camera.pipeline);
        cfg.camera.flip_horizontal = cam["flip_horizontal"].as<bool>(cfg.camera.flip_horizontal);
    }

    if (const YAML::Node out = root["output"]) {
        cfg.enable_output = out["enabled"].as<bool>(cfg.enable_output);
        cfg.output.width = out["width"].as<int>(cfg.output.width);
        cfg.output.height = out["height"].as<int>(cfg.output.height);
        cfg.output.fps = out["fps"].as<int>(cfg.output.fps);
        cfg.output.backend = out["virtual_cam_backend"].as<std::string>(cfg.output.backend);
        cfg.output.device = out["device"].as<std::string>(cfg.output.device);
        cfg.output.pipeline = out["pipeline"].as<std::string>(cfg.output.pipeline);
        cfg.output.background = out["background"].as<std::vector<int>>(cfg.output.background);
    }

    if (const YAML::Node tpl = root["template"]) {
        cfg.overlay_template.image = tpl["image"].as<std::string>(cfg.overlay_template.image);
        cfg.overlay_template.opacity = tpl["opacity"].as<float>(cfg.overlay_template.opacity);
    }

    if (const YAML::Node t = root["ticker"]) {
        cfg.ticker.enabled = t["enabled"].as<bool>(cfg.ticker.enabled);
        cfg.ticker.text_file = t["text_file"].as<std::string>(cfg.ticker.text_file);
        cfg.ticker.lines = t["lines"].as<std::vector<std::string>>(cfg.ticker.lines);
        cfg.ticker.scroll_speed = t["scroll_speed"].as<float>(cfg.ticker.scroll_speed);
        cfg.ticker.scroll_mode = t["scroll_mode"].as<std::string>(cfg.ticker.scroll_mode);
        cfg.ticker.font_size = t["font_size"].as<int>(cfg.ticker.font_size);
        cfg.ticker.font_color = t["font_color"].as<std::vector<int>>(cfg.ticker.font_color);
        cfg.ticker.bg_color = t["bg_color"].as<std::vector<int>>(cfg.ticker.bg_color);
        cfg.ticker.bar_height = t["bar_height"].as<int>(cfg.ticker.bar_height);
        cfg.ticker.bar_opacity = t["bar_opacity"].as<float>(cfg.ticker.bar_opacity);
        cfg.ticker.position = t["position"].as<std::string>(cfg.ticker.position);
    }

    if (const YAML::Node c = root["countdown"]) {
        cfg.countdown.enabled = c["enabled"].as<bool>(cfg.countdown.enabled);
        cfg.countdown.duration_minutes = c["duration_minutes"].as<double>(cfg.countdown.duration_minutes);
        cfg.countdown.font_size = c["font_size"].as<int>(cfg.countdown.font_size);
        cfg.countdown.font_color = c["font_color"].as<std::vector<int>>(cfg.countdown.font_color);
        cfg.countdown.bg_color = c["bg_color"].as<std::vector<int>>(cfg.countdown.bg_color);
        cfg.countdown.position = c["position"].as<std::string>(cfg.countdown.position);
        cfg.countdown.show_label = c["show_label"].as<bool>(cfg.countdown.show_label);
        cfg.countdown.label_text = c["label_text"].as<std::string>(cfg.countdown.label_text);
        cfg.countdown.opacity = c["opacity"].as<float>(cfg.countdown.opacity);
    }

    if (const YAML::Node ind = root["indicators"]) {
        cfg.indicators.enabled = ind["enabled"].as<bool>(cfg.indicators.enabled);
        cfg.indicators.data_file = ind["data_file"].as<std::string>(cfg.indicators.data_file);
        cfg.indicators.font_size = ind["font_size"].as<int>(cfg.indicators.font_size);
        cfg.indicators.font_color = ind["font_color"].as<std::vector<int>>(cfg.indicators.font_color);
        cfg.indicators.bg_color = ind["bg_color"].as<std::vector<int>>(cfg.indicators.bg_color);
        cfg.indicators.position = ind["position"].as<std::string>(cfg.indicators.position);
        cfg.indicators.auto_reload = ind["auto_reload"].as<bool>(cfg.indicators.auto_reload);
        cfg.indicators.reload_interval = ind["reload_interval"].as<double>(cfg.indicators.reload_interval);
    }
}

bool loadConfigFile(AppConfig& cfg) {
    try {
        YAML::Node root = YAML::LoadFile(cfg.config_file);
        loadConfig(root, cfg);
        return true;
    } catch (const YAML::Exception& e) {
        Logger::log(Logger::WARNING, "Could not load config file " + cfg.config_file + ": " + e.what());
        Logger::log(Logger::WARNING, "Using default values.");
        return false;
    }
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "Options:\n"
              << "  -c, --config FILE         Config file path (default: config/config.yaml)\n"
              << "  -d, --device INDEX        Camera device index (default: 0)\n"
              << "  -w, --width WIDTH         Output width (default: 1280)\n"
              << "  -h, --height HEIGHT       Output height (default: 720)\n"
              << "  -f, --fps FPS             Target FPS (default: 30)\n"
              << "  -p, --pipeline PIPELINE   Custom GStreamer capture pipeline\n"
              << "  -b, --backend BACKEND     Virtual camera backend: v4l2loopback|gstreamer\n"
              << "  -o, --sink-device PATH    Virtual camera device (default: /dev/video10)\n"
              << "  -n, --no-window           Disable preview window\n"
              << "  -x, --no-output           Do not start the virtual camera\n"
              << "  -l, --log-level LEVEL     debug|info|warn|error (default: info)\n"
              << "  -F, --font PATH           TrueType font for overlay text\n"
              << "  --help                    Show this help\n";
}

bool parseArgs(int argc, char* argv[], AppConfig& cfg) {
    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"device", required_argument, 0, 'd'},
        {"width", required_argument, 0, 'w'},
        {"height", required_argument, 0, 'h'},
        {"fps", required_argument, 0, 'f'},
        {"pipeline", required_argument, 0, 'p'},
        {"backend", required_argument, 0, 'b'},
        {"sink-device", required_argument, 0, 'o'},
        {"no-window", no_argument, 0, 'n'},
        {"no-output", no_argument, 0, 'x'},
        {"log-level", required_argument, 0, 'l'},
        {"font", required_argument, 0, 'F'},
        {"help", no_argument, 0, '?'},
        {0, 0, 0, 0}
    };

    // Parsed twice (before and after the config file), so rewind getopt
    optind = 1;
    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:d:w:h:f:p:b:o:nxl:F:?",
                              long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c': cfg.config_file = optarg; break;
            case 'd': cfg.camera.device = std::stoi(optarg); break;
            case 'w':
                cfg.output.width = std::stoi(optarg);
                cfg.camera.width = cfg.output.width;
                break;
            case 'h':
                cfg.output.height = std::stoi(optarg);
                cfg.camera.height = cfg.output.height;
                break;
            case 'f':
                cfg.output.fps = std::stoi(optarg);
                cfg.camera.fps = cfg.output.fps;
                break;
            case 'p': cfg.camera.pipeline = optarg; break;
            case 'b': cfg.output.backend = optarg; break;
            case 'o': cfg.output.device = optarg; break;
            case 'n': cfg.show_window = false; break;
            case 'x': cfg.enable_output = false; break;
            case 'l': cfg.log_level = optarg; break;
            case 'F': cfg.font_path = optarg; break;
            case '?':
                return false;
        }
    }
    return true;
}

void applyConfig(const AppConfig& cfg, Compositor& compositor) {
    compositor.setBackgroundColor(rgbToBgr(cfg.output.background, cv::Scalar(0, 0, 0)));

    WebcamLayer& webcam = compositor.webcamLayer();
    webcam.setFlipHorizontal(cfg.camera.flip_horizontal);

    ImageOverlayLayer& tpl = compositor.templateLayer();
    tpl.setOpacity(cfg.overlay_template.opacity);
    if (!cfg.overlay_template.image.empty()) {
        tpl.setVisible(tpl.loadImage(cfg.overlay_template.image));
    }

    TickerLayer& ticker = compositor.tickerLayer();
    ticker.setVisible(cfg.ticker.enabled);
    ticker.setScrollSpeed(cfg.ticker.scroll_speed);
    ticker.setScrollMode(cfg.ticker.scroll_mode == "wallclock" ? ScrollMode::WallClock
                                                               : ScrollMode::PerFrame);
    ticker.setFontSize(cfg.ticker.font_size);
    ticker.setFontColor(rgbToBgr(cfg.ticker.font_color, cv::Scalar(255, 255, 255)));
    ticker.setBackgroundColor(rgbToBgr(cfg.ticker.bg_color, cv::Scalar(30, 30, 30)));
    ticker.setBarHeight(cfg.ticker.bar_height);
    ticker.setBarOpacity(cfg.ticker.bar_opacity);
    ticker.setBarPosition(cfg.ticker.position);
    if (!cfg.ticker.text_file.empty()) {
        ticker.loadTextFromFile(cfg.ticker.text_file);
    } else if (!cfg.ticker.lines.empty()) {
        ticker.setTextLines(cfg.ticker.lines);
    }

    CountdownLayer& countdown = compositor.countdownLayer();
    countdown.setVisible(cfg.countdown.enabled);
    countdown.reset(cfg.countdown.duration_minutes * 60.0);
    countdown.setFontSize(cfg.countdown.font_size);
    countdown.setFontColor(rgbToBgr(cfg.countdown.font_color, cv::Scalar(255, 255, 255)));
    countdown.setBackgroundColor(rgbToBgr(cfg.countdown.bg_color, cv::Scalar(30, 30, 200)));
    countdown.setPosition(cfg.countdown.position);
    countdown.setShowLabel(cfg.countdown.show_label);
    countdown.setLabelText(cfg.countdown.label_text);
    countdown.setOpacity(cfg.countdown.opacity);

    IndicatorLayer& indicators = compositor.indicatorLayer();
    indicators.setVisible(cfg.indicators.enabled);
    indicators.setFontSize(cfg.indicators.font_size);
    indicators.setFontColor(rgbToBgr(cfg.indicators.font_color, cv::Scalar(255, 255, 255)));
    indicators.setBackgroundColor(rgbToBgr(cfg.indicators.bg_color, cv::Scalar(40, 40, 40)));
    indicators.setPosition(cfg.indicators.position);
    indicators.setAutoReload(cfg.indicators.auto_reload);
    indicators.setReloadInterval(cfg.indicators.reload_interval);
    if (!cfg.indicators.data_file.empty()) {
        indicators.loadIndicators(cfg.indicators.data_file);
    }
}

} // namespace vcamstudio
