#pragma once

#include <chrono>
#include <cstdint>

namespace sentinel {

using Timestamp = std::chrono::system_clock::time_point;

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

inline int64_t to_epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

} // namespace sentinel
