#include "parameter_store.hpp"

namespace sentinel {

ParameterStore::ParameterStore(DynamicParameters initial)
    : current_(initial) {}

DynamicParameters ParameterStore::defaults_from(const EngineConfig& config) {
    DynamicParameters params;
    params.min_spread_threshold = config.arbitrage.min_spread_threshold;
    params.min_profit_threshold = config.arbitrage.min_profit_threshold;
    params.max_slippage = config.arbitrage.max_slippage;
    params.target_trade_size = config.arbitrage.default_trade_amount;
    params.risk_tolerance = config.risk.initial_risk_tolerance;
    return params;
}

DynamicParameters ParameterStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void ParameterStore::replace(const DynamicParameters& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = params;
}

} // namespace sentinel
