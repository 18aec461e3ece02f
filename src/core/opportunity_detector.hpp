#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "clock.hpp"
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace sentinel {

struct DetectionStats {
    uint64_t detection_runs = 0;
    uint64_t pairs_compared = 0;
    uint64_t skipped_below_floor = 0;
    uint64_t skipped_unprofitable = 0;
    uint64_t skipped_duplicate = 0;
    uint64_t skipped_unquoted = 0;
    uint64_t invalid_snapshots = 0;
    uint64_t emitted = 0;
    uint64_t expired = 0;
};

void to_json(nlohmann::json& j, const DetectionStats& s);

// Compares every unordered pair of pools quoting the same asset pair and emits
// candidate opportunities above a coarse spread floor. Emitted opportunities stay
// in the active set until their TTL elapses.
class OpportunityDetector {
public:
    OpportunityDetector(const ArbitrageConfig& config, std::shared_ptr<Clock> clock);

    std::vector<Opportunity> detect(const std::vector<PoolSnapshot>& snapshots,
                                    const DynamicParameters& params);

    // Drops expired opportunities; returns how many were removed
    size_t purge_expired();

    std::vector<Opportunity> active_opportunities() const;
    size_t active_count() const;
    std::optional<Opportunity> find(const std::string& id) const;
    bool mark_approved(const std::string& id, double trade_amount);

    DetectionStats get_stats() const;

    static std::string make_opportunity_id(const std::string& first_pool,
                                           const std::string& second_pool,
                                           Timestamp created_at);

private:
    std::optional<Opportunity> analyze_pair(const PoolSnapshot& first,
                                            const PoolSnapshot& second,
                                            const DynamicParameters& params,
                                            Timestamp now);
    size_t purge_expired_locked(Timestamp now);

    ArbitrageConfig config_;
    std::shared_ptr<Clock> clock_;
    std::chrono::milliseconds ttl_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Opportunity> active_;
    DetectionStats stats_;
};

} // namespace sentinel
