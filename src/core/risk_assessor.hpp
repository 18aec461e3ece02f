#pragma once

#include "types.hpp"
#include "../utils/config_types.hpp"

namespace sentinel {

class RiskAssessor {
public:
    explicit RiskAssessor(const RiskConfig& config);

    // optimized_trade_size is the size the optimizer would send for this opportunity
    RiskProfile assess(const Opportunity& opportunity,
                       const Score& score,
                       const DynamicParameters& params,
                       double optimized_trade_size) const;

    double assess_liquidity_risk(const Opportunity& opportunity, double optimized_trade_size) const;
    double assess_slippage_risk(const Opportunity& opportunity) const;
    double assess_gas_risk(const Opportunity& opportunity) const;
    double assess_execution_risk(int64_t age_ms) const;

private:
    std::vector<std::string> generate_warnings(const RiskProfile& profile) const;

    RiskConfig config_;
};

} // namespace sentinel
