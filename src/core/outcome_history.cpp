#include "outcome_history.hpp"
#include <algorithm>
#include "exceptions.hpp"

namespace sentinel {

namespace {

bool same_asset_pair(const OutcomeRecord& record, const std::string& asset_a, const std::string& asset_b) {
    return (record.asset_a == asset_a && record.asset_b == asset_b) ||
           (record.asset_a == asset_b && record.asset_b == asset_a);
}

} // namespace

std::optional<double> HistorySnapshot::success_rate_for_pools(const std::string& first_pool,
                                                              const std::string& second_pool) const {
    size_t total = 0;
    size_t successes = 0;
    for (const auto& record : records) {
        if (!record.involves_pools(first_pool, second_pool)) {
            continue;
        }
        ++total;
        if (record.success) {
            ++successes;
        }
    }
    if (total == 0) {
        return std::nullopt;
    }
    return static_cast<double>(successes) / static_cast<double>(total);
}

double HistorySnapshot::historical_optimal_size(const std::string& asset_a, const std::string& asset_b) const {
    double sum = 0.0;
    size_t count = 0;
    for (const auto& record : records) {
        if (record.success && same_asset_pair(record, asset_a, asset_b)) {
            sum += record.trade_size;
            ++count;
        }
    }
    return count == 0 ? 0.0 : sum / static_cast<double>(count);
}

HistoricalStats HistorySnapshot::stats(Timestamp now, std::chrono::hours window) const {
    HistoricalStats result;
    double profit_sum = 0.0;
    const Timestamp cutoff = now - window;
    for (const auto& record : records) {
        if (record.timestamp < cutoff) {
            continue;
        }
        ++result.total_count;
        if (record.success) {
            ++result.success_count;
            profit_sum += record.realized_profit;
        }
    }
    if (result.success_count > 0) {
        result.avg_profit = profit_sum / static_cast<double>(result.success_count);
    }
    return result;
}

OutcomeHistory::OutcomeHistory(size_t capacity, std::shared_ptr<Clock> clock)
    : capacity_(capacity), clock_(std::move(clock)) {
    if (capacity_ == 0) {
        throw ConfigurationError("outcome history capacity must be positive");
    }
    if (!clock_) {
        throw ConfigurationError("outcome history requires a clock");
    }
}

size_t OutcomeHistory::append(OutcomeRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
    return ++total_recorded_;
}

std::vector<OutcomeRecord> OutcomeHistory::recent(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = std::min(count, records_.size());
    return std::vector<OutcomeRecord>(records_.end() - static_cast<std::ptrdiff_t>(n), records_.end());
}

HistorySnapshot OutcomeHistory::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    HistorySnapshot snap;
    snap.records.assign(records_.begin(), records_.end());
    return snap;
}

HistoricalStats OutcomeHistory::get_historical_stats(int window_hours) const {
    return snapshot().stats(clock_->now(), std::chrono::hours(window_hours));
}

size_t OutcomeHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t OutcomeHistory::total_recorded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_recorded_;
}

} // namespace sentinel
