#pragma once

#include <utils/time.hpp>
#include <atomic>
#include <memory>

namespace Synod::testing {

/**
 * @brief Hand-driven clock; copies share the same time.
 */
class ManualClock {
public:
    ManualClock() : offset_ms_(std::make_shared<std::atomic<int64_t>>(0)) {}

    void advance(int64_t ms) { offset_ms_->fetch_add(ms); }

    TimePoint now() const { return base_ + Millis(offset_ms_->load()); }

    NowFn fn() const {
        auto offset = offset_ms_;
        auto base = base_;
        return [offset, base] { return base + Millis(offset->load()); };
    }

private:
    TimePoint base_ = Clock::now();
    std::shared_ptr<std::atomic<int64_t>> offset_ms_;
};

} // namespace Synod::testing
