// utils.hpp
#pragma once

#include <chrono>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace vcamstudio {

class PerfStats {
public:
    std::atomic<float> fps{0};
    std::atomic<uint64_t> frames{0};
    std::atomic<int64_t> compose_time{0};  // microseconds
    std::atomic<int64_t> send_time{0};     // microseconds
    std::atomic<int> send_failures{0};
    std::atomic<int> errors{0};

    float getFrameTimeMs() const {
        return (compose_time + send_time) / 1000.0f;
    }
};

// Plain copy of PerfStats for readers on other threads
struct PerfSnapshot {
    float fps = 0;
    uint64_t frames = 0;
    int64_t compose_time = 0;
    int64_t send_time = 0;
    int send_failures = 0;
    int errors = 0;
};

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    double elapsed_ms() const {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

    int64_t elapsed_us() const {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Seconds since the epoch, the timestamp handed to layers.
double wallClockSeconds();

using TimeSource = std::function<double()>;

// Config colours are RGB triples, OpenCV wants BGR.
cv::Scalar rgbToBgr(int r, int g, int b);
cv::Scalar rgbToBgr(const std::vector<int>& rgb, const cv::Scalar& fallback);

std::string trim(const std::string& s);

// Simple logger
class Logger {
public:
    enum Level {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    static void log(Level level, const std::string& message);
    static void setLevel(Level level) { min_level_ = level; }
    static Level getLevel() { return min_level_; }
    static Level parseLevel(const std::string& name, Level fallback = INFO);

private:
    static std::atomic<Level> min_level_;
    static std::mutex mutex_;
};

} // namespace vcamstudio
