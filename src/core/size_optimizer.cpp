#include "size_optimizer.hpp"
#include <algorithm>
#include <cmath>

namespace sentinel {

SizeOptimizer::SizeOptimizer(const SizingConfig& config)
    : config_(config) {}

double SizeOptimizer::liquidity_cap(const Opportunity& opportunity) const {
    return std::max(0.0, opportunity.min_liquidity_any_side() * config_.liquidity_cap_fraction);
}

double SizeOptimizer::optimize(const Opportunity& opportunity,
                               const DynamicParameters& params,
                               const HistorySnapshot& history) const {
    double size = std::min(params.target_trade_size, liquidity_cap(opportunity));

    const double historical = history.historical_optimal_size(opportunity.pool_a.asset_a,
                                                              opportunity.pool_a.asset_b);
    if (historical > 0.0) {
        size = (size + historical) / 2.0;
    }

    return std::max(0.0, std::floor(size));
}

} // namespace sentinel
