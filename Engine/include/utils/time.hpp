#pragma once

#include <chrono>
#include <functional>
#include <cstdint>

namespace Synod {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

/**
 * @brief Source of "now" for liveness and retention checks.
 *
 * Components take one of these so tests can drive time by hand.
 */
using NowFn = std::function<TimePoint()>;

inline NowFn system_now() {
    return [] { return Clock::now(); };
}

/**
 * @brief Milliseconds between two time points (negative if b precedes a).
 */
inline int64_t ms_between(TimePoint a, TimePoint b) {
    return std::chrono::duration_cast<Millis>(b - a).count();
}

/**
 * @brief High-resolution timer and high-level timing utilities.
 */
class Timer {
public:
    Timer() : start_(Clock::now()) {}

    /**
     * @brief Reset the timer to the current time.
     */
    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Get elapsed milliseconds since last reset or construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    /**
     * @brief Static helper to get milliseconds since a given time point.
     */
    static double ms_since(TimePoint start) {
        return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    }

private:
    TimePoint start_;
};

} // namespace Synod
