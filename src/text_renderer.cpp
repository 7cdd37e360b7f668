// text_renderer.cpp
#include "text_renderer.hpp"
#include "utils.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <fstream>

#ifdef VCAMSTUDIO_HAS_FREETYPE
#include <opencv2/freetype.hpp>
#endif

namespace vcamstudio {

std::once_flag TextRenderer::init_flag_;

namespace {

const TextRenderer* g_renderer = nullptr;

const char* const kFontCandidates[] = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
    "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
    "C:/Windows/Fonts/segoeui.ttf",
    "C:/Windows/Fonts/arial.ttf",
};

bool fileExists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

} // namespace

std::string TextRenderer::findSystemFont() {
    for (const char* candidate : kFontCandidates) {
        if (fileExists(candidate)) {
            return candidate;
        }
    }
    return "";
}

void TextRenderer::initialize(const std::string& font_path) {
    std::call_once(init_flag_, [&font_path]() {
        static TextRenderer renderer;
        renderer.load(font_path);
        g_renderer = &renderer;
    });
}

const TextRenderer& TextRenderer::instance() {
    initialize();
    return *g_renderer;
}

void TextRenderer::load(const std::string& font_path) {
    font_path_ = font_path.empty() ? findSystemFont() : font_path;

#ifdef VCAMSTUDIO_HAS_FREETYPE
    if (!font_path_.empty()) {
        try {
            cv::Ptr<cv::freetype::FreeType2> ft = cv::freetype::createFreeType2();
            ft->loadFontData(font_path_, 0);
            ft_ = ft;
            freetype_ready_ = true;
            Logger::log(Logger::INFO, "Text renderer: FreeType2 with " + font_path_);
            return;
        } catch (const cv::Exception& e) {
            Logger::log(Logger::WARNING, std::string("FreeType2 init failed: ") + e.what());
        }
    }
#endif

    Logger::log(Logger::INFO, "Text renderer: Hershey bitmap fonts");
}

cv::Size TextRenderer::measureHershey(const std::string& text, int font_height,
                                      int thickness, bool bold) const {
    int font_face = bold ? cv::FONT_HERSHEY_DUPLEX : cv::FONT_HERSHEY_SIMPLEX;
    double scale = font_height / 30.0;
    int thick = std::max(1, thickness);
    if (bold) {
        thick = std::max(2, thick + 1);
    }
    int baseline = 0;
    return cv::getTextSize(text, font_face, scale, thick, &baseline);
}

cv::Size TextRenderer::measure(const std::string& text, int font_height, int thickness) const {
#ifdef VCAMSTUDIO_HAS_FREETYPE
    if (freetype_ready_) {
        std::lock_guard<std::mutex> lock(ft_mutex_);
        cv::Ptr<cv::freetype::FreeType2> ft = ft_.dynamicCast<cv::freetype::FreeType2>();
        int baseline = 0;
        return ft->getTextSize(text, font_height, -1, &baseline);
    }
#endif
    return measureHershey(text, font_height, thickness, false);
}

cv::Size TextRenderer::draw(cv::Mat& img, const std::string& text, cv::Point top_left,
                            int font_height, const cv::Scalar& color,
                            int thickness, bool bold) const {
    if (text.empty()) {
        return cv::Size(0, 0);
    }

#ifdef VCAMSTUDIO_HAS_FREETYPE
    if (freetype_ready_) {
        std::lock_guard<std::mutex> lock(ft_mutex_);
        cv::Ptr<cv::freetype::FreeType2> ft = ft_.dynamicCast<cv::freetype::FreeType2>();
        int baseline = 0;
        cv::Size size = ft->getTextSize(text, font_height, -1, &baseline);
        ft->putText(img, text, top_left, font_height, color, -1, cv::LINE_AA, false);
        if (bold) {
            ft->putText(img, text, top_left, font_height, color, 1, cv::LINE_AA, false);
        }
        return size;
    }
#endif

    int font_face = bold ? cv::FONT_HERSHEY_DUPLEX : cv::FONT_HERSHEY_SIMPLEX;
    double scale = font_height / 30.0;
    int thick = std::max(1, thickness);
    if (bold) {
        thick = std::max(2, thick + 1);
    }
    cv::Size size = measureHershey(text, font_height, thickness, bold);
    // putText anchors on the baseline, shift down to honour the top-left origin
    cv::putText(img, text, cv::Point(top_left.x, top_left.y + size.height),
                font_face, scale, color, thick, cv::LINE_AA);
    return size;
}

} // namespace vcamstudio
