// utils.cpp
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <iomanip>
#include <ctime>

namespace vcamstudio {

std::atomic<Logger::Level> Logger::min_level_{Logger::INFO};
std::mutex Logger::mutex_;

void Logger::log(Level level, const std::string& message) {
    if (level < min_level_.load()) return;

    const char* level_str[] = {"DEBUG", "INFO", "WARN", "ERROR"};

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = (level >= WARNING) ? std::cerr : std::cout;
    out << "[" << std::put_time(&local_tm, "%H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms.count();
    out << "] [" << level_str[level] << "] " << message << std::endl;
}

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return DEBUG;
    if (lower == "info") return INFO;
    if (lower == "warn" || lower == "warning") return WARNING;
    if (lower == "error") return ERROR;
    return fallback;
}

double wallClockSeconds() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration<double>(now.time_since_epoch()).count();
}

cv::Scalar rgbToBgr(int r, int g, int b) {
    return cv::Scalar(b, g, r);
}

cv::Scalar rgbToBgr(const std::vector<int>& rgb, const cv::Scalar& fallback) {
    if (rgb.size() < 3) return fallback;
    return rgbToBgr(rgb[0], rgb[1], rgb[2]);
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace vcamstudio
