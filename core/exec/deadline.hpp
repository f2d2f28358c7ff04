#pragma once

#include <algorithm>
#include <chrono>

namespace codegym {

/// Wall-clock budget for one process launch.
/// Started on construction; a non-positive budget never expires.
class Deadline {
public:
    explicit Deadline(double max_seconds)
        : max_seconds_(max_seconds),
          start_time_(std::chrono::steady_clock::now()) {}

    bool unlimited() const { return max_seconds_ <= 0.0; }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    bool expired() const {
        if (unlimited()) return false;
        return elapsedSeconds() >= max_seconds_;
    }

    /// Milliseconds left, capped at cap_ms. Returns cap_ms when unlimited.
    int remainingMillis(int cap_ms) const {
        if (unlimited()) return cap_ms;
        double left = (max_seconds_ - elapsedSeconds()) * 1000.0;
        if (left <= 0.0) return 0;
        if (left >= static_cast<double>(cap_ms)) return cap_ms;
        return std::min(cap_ms, static_cast<int>(left) + 1);
    }

    double maxSeconds() const { return max_seconds_; }

private:
    double max_seconds_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace codegym
