#include "types.hpp"
#include <algorithm>

namespace sentinel {

std::string PoolSnapshot::asset_pair_key() const {
    return asset_a < asset_b ? asset_a + "/" + asset_b : asset_b + "/" + asset_a;
}

double PoolSnapshot::price_of(const std::string& asset) const {
    if (asset == asset_a) {
        return price_a;
    }
    return asset == asset_b ? price_b : 0.0;
}

double PoolSnapshot::liquidity_of(const std::string& asset) const {
    if (asset == asset_a) {
        return liquidity_a;
    }
    return asset == asset_b ? liquidity_b : 0.0;
}

std::chrono::milliseconds Opportunity::age(Timestamp now) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - created_at);
}

double Opportunity::comparable_price_b() const {
    return pool_b.price_of(pool_a.asset_a);
}

double Opportunity::min_liquidity() const {
    return std::min(pool_a.liquidity_a, pool_b.liquidity_of(pool_a.asset_a));
}

double Opportunity::min_liquidity_any_side() const {
    return std::min({pool_a.liquidity_a, pool_a.liquidity_b, pool_b.liquidity_a, pool_b.liquidity_b});
}

std::string Opportunity::asset_pair() const {
    return pool_a.asset_pair_key();
}

bool OutcomeRecord::involves_pools(const std::string& first, const std::string& second) const {
    return (pool_a_id == first && pool_b_id == second) ||
           (pool_a_id == second && pool_b_id == first);
}

std::string to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCEEDED: return "Succeeded";
        case ExecutionStatus::SAFETY_REJECTED: return "SafetyRejected";
        case ExecutionStatus::SIMULATION_FAILED: return "SimulationFailed";
        case ExecutionStatus::UNPROFITABLE_SIMULATION: return "UnprofitableSimulation";
        case ExecutionStatus::EXECUTION_FAILED: return "ExecutionFailed";
        case ExecutionStatus::CONCURRENCY_REJECTED: return "ConcurrencyRejected";
    }
    return "Unknown";
}

void to_json(nlohmann::json& j, const PoolSnapshot& s) {
    j = nlohmann::json{
        {"pool_id", s.pool_id},
        {"asset_a", s.asset_a},
        {"asset_b", s.asset_b},
        {"price_a", s.price_a},
        {"price_b", s.price_b},
        {"liquidity_a", s.liquidity_a},
        {"liquidity_b", s.liquidity_b},
        {"observed_at", to_epoch_ms(s.observed_at)}
    };
}

void from_json(const nlohmann::json& j, PoolSnapshot& s) {
    j.at("pool_id").get_to(s.pool_id);
    j.at("asset_a").get_to(s.asset_a);
    j.at("asset_b").get_to(s.asset_b);
    j.at("price_a").get_to(s.price_a);
    s.price_b = j.value("price_b", s.price_a > 0.0 ? 1.0 / s.price_a : 0.0);
    j.at("liquidity_a").get_to(s.liquidity_a);
    s.liquidity_b = j.value("liquidity_b", s.liquidity_a);
    if (j.contains("observed_at")) {
        s.observed_at = from_epoch_ms(j.at("observed_at").get<int64_t>());
    }
}

void to_json(nlohmann::json& j, const Opportunity& o) {
    j = nlohmann::json{
        {"id", o.id},
        {"pool_a", o.pool_a.pool_id},
        {"pool_b", o.pool_b.pool_id},
        {"asset_pair", o.asset_pair()},
        {"buy_price", o.buy_price},
        {"sell_price", o.sell_price},
        {"spread", o.spread},
        {"spread_percentage", o.spread_percentage},
        {"estimated_profit", o.estimated_profit},
        {"gas_estimate", o.gas_estimate},
        {"trade_amount", o.trade_amount},
        {"approved", o.approved},
        {"created_at", to_epoch_ms(o.created_at)},
        {"expires_at", to_epoch_ms(o.expires_at)}
    };
}

void to_json(nlohmann::json& j, const OpportunityFeatures& f) {
    j = nlohmann::json{
        {"spread_percentage", f.spread_percentage},
        {"estimated_profit", f.estimated_profit},
        {"liquidity", f.liquidity},
        {"volatility", f.volatility},
        {"profit_to_gas_ratio", f.profit_to_gas_ratio},
        {"age_ms", f.age_ms}
    };
}

void to_json(nlohmann::json& j, const DynamicParameters& p) {
    j = nlohmann::json{
        {"min_spread_threshold", p.min_spread_threshold},
        {"min_profit_threshold", p.min_profit_threshold},
        {"max_slippage", p.max_slippage},
        {"target_trade_size", p.target_trade_size},
        {"risk_tolerance", p.risk_tolerance}
    };
}

void to_json(nlohmann::json& j, const OutcomeRecord& r) {
    j = nlohmann::json{
        {"timestamp", to_epoch_ms(r.timestamp)},
        {"opportunity_id", r.opportunity_id},
        {"pool_a", r.pool_a_id},
        {"pool_b", r.pool_b_id},
        {"asset_a", r.asset_a},
        {"asset_b", r.asset_b},
        {"score", r.score},
        {"predicted_profit", r.predicted_profit},
        {"simulated_profit", r.simulated_profit},
        {"realized_profit", r.realized_profit},
        {"gas_cost", r.gas_cost},
        {"trade_size", r.trade_size},
        {"success", r.success},
        {"status", to_string(r.status)},
        {"error", r.error},
        {"reference_id", r.reference_id},
        {"features", r.features},
        {"elapsed_ms", r.elapsed_ms}
    };
}

void to_json(nlohmann::json& j, const HistoricalStats& s) {
    j = nlohmann::json{
        {"total_count", s.total_count},
        {"success_count", s.success_count},
        {"avg_profit", s.avg_profit}
    };
}

} // namespace sentinel
