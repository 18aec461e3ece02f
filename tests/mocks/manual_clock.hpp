#pragma once

#include <chrono>
#include <mutex>
#include "core/clock.hpp"

namespace sentinel {
namespace testing {

// Clock that only moves when a test tells it to
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = from_epoch_ms(1700000000000))
        : now_(start) {}

    Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

    void set(Timestamp ts) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = ts;
    }

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

} // namespace testing
} // namespace sentinel
