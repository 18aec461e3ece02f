#pragma once

#include "outcome_history.hpp"
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace sentinel {

class SizeOptimizer {
public:
    explicit SizeOptimizer(const SizingConfig& config);

    // Target size, capped by pool depth and blended with the historical optimum;
    // floored to whole units and never negative
    double optimize(const Opportunity& opportunity,
                    const DynamicParameters& params,
                    const HistorySnapshot& history) const;

    double liquidity_cap(const Opportunity& opportunity) const;

private:
    SizingConfig config_;
};

} // namespace sentinel
