#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "clock.hpp"

namespace sentinel {

// Per-tick observation of one pool. price_a is asset A quoted in B, price_b the inverse quote.
struct PoolSnapshot {
    std::string pool_id;
    std::string asset_a;
    std::string asset_b;
    double price_a = 0.0;
    double price_b = 0.0;
    double liquidity_a = 0.0;
    double liquidity_b = 0.0;
    Timestamp observed_at{};

    // Order-independent key, "A/B" and "B/A" map to the same value
    std::string asset_pair_key() const;
    // Price of `asset` quoted in the other asset of this pool, 0 if the pool does not hold it
    double price_of(const std::string& asset) const;
    double liquidity_of(const std::string& asset) const;
};

struct Opportunity {
    std::string id;
    PoolSnapshot pool_a;
    PoolSnapshot pool_b;
    double buy_price = 0.0;
    double sell_price = 0.0;
    double spread = 0.0;
    double spread_percentage = 0.0;
    double estimated_profit = 0.0;
    double gas_estimate = 0.0;
    double trade_amount = 0.0;
    bool approved = false;
    Timestamp created_at{};
    Timestamp expires_at{};

    bool is_expired(Timestamp now) const { return now > expires_at; }
    std::chrono::milliseconds age(Timestamp now) const;

    // pool_b's price of pool_a's base asset, in pool_a's orientation
    double comparable_price_b() const;
    // Smaller of the two pools' depth in pool_a's base asset
    double min_liquidity() const;
    // Smallest depth on any of the four sides
    double min_liquidity_any_side() const;
    std::string asset_pair() const;
};

struct OpportunityFeatures {
    double spread_percentage = 0.0;
    double estimated_profit = 0.0;
    double liquidity = 0.0;
    double volatility = 0.0;
    double profit_to_gas_ratio = 0.0;
    int64_t age_ms = 0;
};

struct Score {
    int overall = 0;
    double spread = 0.0;
    double liquidity = 0.0;
    double profit = 0.0;
    double volatility = 0.0;
    double gas_efficiency = 0.0;
    double historical = 0.0;
    double confidence = 0.0;
    OpportunityFeatures features;
};

struct RiskProfile {
    double overall = 0.0;
    double liquidity_risk = 0.0;
    double slippage_risk = 0.0;
    double gas_risk = 0.0;
    double execution_risk = 0.0;
    bool acceptable = false;
    std::vector<std::string> warnings;
};

struct DynamicParameters {
    double min_spread_threshold = 0.005;
    double min_profit_threshold = 0.1;
    double max_slippage = 0.01;
    double target_trade_size = 1000.0;
    double risk_tolerance = 0.5;
};

enum class ExecutionStatus {
    SUCCEEDED,
    SAFETY_REJECTED,
    SIMULATION_FAILED,
    UNPROFITABLE_SIMULATION,
    EXECUTION_FAILED,
    CONCURRENCY_REJECTED
};

std::string to_string(ExecutionStatus status);

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::EXECUTION_FAILED;
    std::string reason;
    std::string reference_id;
    double simulated_profit = 0.0;
    double realized_profit = 0.0;
    double gas_cost = 0.0;
    int64_t elapsed_ms = 0;

    bool success() const { return status == ExecutionStatus::SUCCEEDED; }
};

struct OutcomeRecord {
    Timestamp timestamp{};
    std::string opportunity_id;
    std::string pool_a_id;
    std::string pool_b_id;
    std::string asset_a;
    std::string asset_b;
    int score = 0;
    double predicted_profit = 0.0;
    double simulated_profit = 0.0;
    double realized_profit = 0.0;
    double gas_cost = 0.0;
    double trade_size = 0.0;
    bool success = false;
    ExecutionStatus status = ExecutionStatus::EXECUTION_FAILED;
    std::string error;
    std::string reference_id;
    OpportunityFeatures features;
    int64_t elapsed_ms = 0;

    // True when the record refers to the same two pools, in either order
    bool involves_pools(const std::string& first, const std::string& second) const;
};

struct HistoricalStats {
    size_t total_count = 0;
    size_t success_count = 0;
    double avg_profit = 0.0;
};

void to_json(nlohmann::json& j, const PoolSnapshot& s);
void from_json(const nlohmann::json& j, PoolSnapshot& s);
void to_json(nlohmann::json& j, const Opportunity& o);
void to_json(nlohmann::json& j, const OpportunityFeatures& f);
void to_json(nlohmann::json& j, const DynamicParameters& p);
void to_json(nlohmann::json& j, const OutcomeRecord& r);
void to_json(nlohmann::json& j, const HistoricalStats& s);

} // namespace sentinel
