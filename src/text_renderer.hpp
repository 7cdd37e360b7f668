// text_renderer.hpp
#pragma once

#include <opencv2/core.hpp>
#include <mutex>
#include <string>

namespace vcamstudio {

// Process-wide text drawing. FreeType2 when available, Hershey fonts otherwise.
// The origin is the top-left corner of the text box.
class TextRenderer {
public:
    // Only the first call has any effect. Empty path means "search the system".
    static void initialize(const std::string& font_path = "");
    static const TextRenderer& instance();

    cv::Size measure(const std::string& text, int font_height, int thickness = 1) const;
    cv::Size draw(cv::Mat& img, const std::string& text, cv::Point top_left,
                  int font_height, const cv::Scalar& color,
                  int thickness = 1, bool bold = false) const;

    bool usingFreeType() const { return freetype_ready_; }
    const std::string& fontPath() const { return font_path_; }

    static std::string findSystemFont();

private:
    TextRenderer() = default;
    void load(const std::string& font_path);

    cv::Size measureHershey(const std::string& text, int font_height,
                            int thickness, bool bold) const;

    bool freetype_ready_{false};
    std::string font_path_;
    mutable std::mutex ft_mutex_;
    cv::Ptr<cv::Algorithm> ft_;

    static std::once_flag init_flag_;
};

} // namespace vcamstudio
