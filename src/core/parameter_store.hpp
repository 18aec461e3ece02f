#pragma once

#include <mutex>
#include <utility>
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace sentinel {

// Holds the live DynamicParameters. Every read returns a full copy and every
// write swaps the whole value under the same mutex.
class ParameterStore {
public:
    explicit ParameterStore(DynamicParameters initial);

    static DynamicParameters defaults_from(const EngineConfig& config);

    DynamicParameters snapshot() const;
    void replace(const DynamicParameters& params);

    // Applies fn to a copy of the current value and installs the result.
    // Returns the installed value.
    template<typename F>
    DynamicParameters update(F&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        DynamicParameters next = current_;
        std::forward<F>(fn)(next);
        current_ = next;
        return next;
    }

private:
    mutable std::mutex mutex_;
    DynamicParameters current_;
};

} // namespace sentinel
