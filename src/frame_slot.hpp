// frame_slot.hpp
#pragma once

#include <cstdint>
#include <mutex>
#include <utility>
#include <opencv2/core.hpp>

namespace vcamstudio {

struct ComposedFrame {
    cv::Mat frame;
    uint64_t timestamp_us{0};  // steady clock
    uint64_t frame_id{0};

    ComposedFrame clone() const {
        ComposedFrame copy;
        copy.frame = frame.clone();
        copy.timestamp_us = timestamp_us;
        copy.frame_id = frame_id;
        return copy;
    }
};

// Deep copy for cv::Mat, plain copy for everything else.
inline cv::Mat copyOut(const cv::Mat& m) { return m.clone(); }
inline ComposedFrame copyOut(const ComposedFrame& f) { return f.clone(); }

// Single-slot buffer: put() replaces the value, a slow reader skips frames.
// Values are moved in and deep copied out.
template<typename T>
class LatestSlot {
private:
    mutable std::mutex mutex_;
    T value_{};
    bool has_value_{false};
    mutable bool unread_{false};
    uint64_t overwritten_{0};

public:
    void put(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unread_) {
            overwritten_++;
        }
        value_ = std::move(item);
        has_value_ = true;
        unread_ = true;
    }

    bool get(T& item) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!has_value_) {
            return false;
        }
        item = copyOut(value_);
        unread_ = false;
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = T{};
        has_value_ = false;
        unread_ = false;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !has_value_;
    }

    // Values replaced before any reader saw them.
    uint64_t overwritten() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return overwritten_;
    }
};

} // namespace vcamstudio
