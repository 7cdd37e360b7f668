// config.hpp
#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace vcamstudio {

class Compositor;

struct CameraConfig {
    int device = 0;
    int width = 1280;
    int height = 720;
    int fps = 30;
    std::string pipeline = "";
    bool flip_horizontal = false;
};

struct OutputConfig {
    int width = 1280;
    int height = 720;
    int fps = 30;
    std::string backend = "";           // v4l2loopback | gstreamer | "" (auto)
    std::string device = "/dev/video10";
    std::string pipeline = "";
    std::vector<int> background = {0, 0, 0};
};

struct TemplateConfig {
    std::string image = "";
    float opacity = 1.0f;
};

struct TickerConfig {
    bool enabled = true;
    std::string text_file = "";
    std::vector<std::string> lines;
    float scroll_speed = 2.0f;
    std::string scroll_mode = "frame";  // frame | wallclock
    int font_size = 28;
    std::vector<int> font_color = {255, 255, 255};
    std::vector<int> bg_color = {30, 30, 30};
    int bar_height = 50;
    float bar_opacity = 0.85f;
    std::string position = "bottom";
};

struct CountdownConfig {
    bool enabled = false;
    double duration_minutes = 5.0;
    int font_size = 48;
    std::vector<int> font_color = {255, 255, 255};
    std::vector<int> bg_color = {200, 30, 30};
    std::string position = "top-right";
    bool show_label = true;
    std::string label_text = "TEMPO";
    float opacity = 1.0f;
};

struct IndicatorsConfig {
    bool enabled = false;
    std::string data_file = "";
    int font_size = 22;
    std::vector<int> font_color = {255, 255, 255};
    std::vector<int> bg_color = {40, 40, 40};
    std::string position = "top-left";
    bool auto_reload = true;
    double reload_interval = 5.0;
};

struct AppConfig {
    CameraConfig camera;
    OutputConfig output;
    TemplateConfig overlay_template;
    TickerConfig ticker;
    CountdownConfig countdown;
    IndicatorsConfig indicators;

    std::string config_file = "config/config.yaml";
    std::string log_level = "info";
    std::string font_path = "";
    bool show_window = true;
    bool enable_output = true;
};

// Fills cfg from a parsed YAML document; absent keys keep their defaults.
void loadConfig(const YAML::Node& root, AppConfig& cfg);
// Reads the file named in cfg.config_file. Returns false if it could not be parsed.
bool loadConfigFile(AppConfig& cfg);
// Command line on top of whatever the file set. Returns false when --help was given.
bool parseArgs(int argc, char* argv[], AppConfig& cfg);
void printUsage(const char* argv0);

// Pushes per-layer settings into the compositor through its public setters.
void applyConfig(const AppConfig& cfg, Compositor& compositor);

} // namespace vcamstudio
