#include "risk_assessor.hpp"
#include <algorithm>
#include <cmath>

namespace sentinel {

namespace {

constexpr double kMaxRisk = 100.0;

double cap_risk(double value) {
    if (std::isnan(value)) {
        return kMaxRisk;
    }
    return std::clamp(value, 0.0, kMaxRisk);
}

} // namespace

RiskAssessor::RiskAssessor(const RiskConfig& config)
    : config_(config) {}

RiskProfile RiskAssessor::assess(const Opportunity& opportunity,
                                 const Score& score,
                                 const DynamicParameters& params,
                                 double optimized_trade_size) const {
    RiskProfile profile;
    profile.liquidity_risk = assess_liquidity_risk(opportunity, optimized_trade_size);
    profile.slippage_risk = assess_slippage_risk(opportunity);
    profile.gas_risk = assess_gas_risk(opportunity);
    profile.execution_risk = assess_execution_risk(score.features.age_ms);

    profile.overall = (profile.liquidity_risk + profile.slippage_risk +
                       profile.gas_risk + profile.execution_risk) / 4.0;
    profile.acceptable = profile.overall <= params.risk_tolerance * 100.0;
    profile.warnings = generate_warnings(profile);
    return profile;
}

double RiskAssessor::assess_liquidity_risk(const Opportunity& opportunity, double optimized_trade_size) const {
    const double min_liquidity = opportunity.min_liquidity();
    if (min_liquidity <= 0.0) {
        return kMaxRisk;
    }
    const double utilization = optimized_trade_size / min_liquidity;
    return cap_risk(utilization * config_.liquidity_utilization_scale);
}

double RiskAssessor::assess_slippage_risk(const Opportunity& opportunity) const {
    const double min_liquidity = opportunity.min_liquidity();
    if (min_liquidity <= 0.0) {
        return kMaxRisk;
    }
    const double impact = opportunity.trade_amount / min_liquidity;
    return cap_risk(impact * config_.slippage_impact_scale);
}

double RiskAssessor::assess_gas_risk(const Opportunity& opportunity) const {
    // Zero or negative profit means gas eats everything
    if (opportunity.estimated_profit <= 0.0) {
        return kMaxRisk;
    }
    return cap_risk(opportunity.gas_estimate / opportunity.estimated_profit * config_.gas_ratio_scale);
}

double RiskAssessor::assess_execution_risk(int64_t age_ms) const {
    const double age_seconds = static_cast<double>(std::max<int64_t>(0, age_ms)) / 1000.0;
    const double age_risk = std::min(config_.max_age_risk, age_seconds);
    return cap_risk(config_.base_execution_risk + age_risk);
}

std::vector<std::string> RiskAssessor::generate_warnings(const RiskProfile& profile) const {
    std::vector<std::string> warnings;

    if (profile.overall > config_.overall_risk_warning_threshold) {
        warnings.emplace_back("High overall risk");
    }
    if (profile.liquidity_risk > config_.sub_risk_warning_threshold) {
        warnings.emplace_back("Insufficient liquidity");
    }
    if (profile.slippage_risk > config_.sub_risk_warning_threshold) {
        warnings.emplace_back("High slippage expected");
    }
    if (profile.gas_risk > config_.sub_risk_warning_threshold) {
        warnings.emplace_back("Gas costs may exceed profits");
    }

    return warnings;
}

} // namespace sentinel
