#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "clock.hpp"
#include "types.hpp"

namespace sentinel {

// Read-only copy of the history ring taken at the start of a tick.
// Scoring and sizing read this instead of the live ring so a tick stays deterministic.
struct HistorySnapshot {
    std::vector<OutcomeRecord> records;     // oldest first

    // Success rate of past attempts on the same two pools; nullopt when none exist
    std::optional<double> success_rate_for_pools(const std::string& first_pool,
                                                 const std::string& second_pool) const;

    // Mean trade size of successful outcomes for the unordered asset pair; 0 when none
    double historical_optimal_size(const std::string& asset_a, const std::string& asset_b) const;

    HistoricalStats stats(Timestamp now, std::chrono::hours window) const;
};

// Bounded in-memory ring of the most recent outcomes, in completion order
class OutcomeHistory {
public:
    OutcomeHistory(size_t capacity, std::shared_ptr<Clock> clock);

    // Returns the total number of outcomes appended over the process lifetime
    size_t append(OutcomeRecord record);

    std::vector<OutcomeRecord> recent(size_t count) const;
    HistorySnapshot snapshot() const;
    HistoricalStats get_historical_stats(int window_hours) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t total_recorded() const;

private:
    size_t capacity_;
    std::shared_ptr<Clock> clock_;
    mutable std::mutex mutex_;
    std::deque<OutcomeRecord> records_;
    size_t total_recorded_ = 0;
};

} // namespace sentinel
