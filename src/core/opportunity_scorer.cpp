#include "opportunity_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include "exceptions.hpp"

namespace sentinel {

namespace {

double clip_score(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 100.0);
}

} // namespace

OpportunityScorer::OpportunityScorer(const ScoringConfig& config, std::shared_ptr<Clock> clock)
    : config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        throw ConfigurationError("opportunity scorer requires a clock");
    }
}

Score OpportunityScorer::score(const Opportunity& opportunity,
                               const DynamicParameters& params,
                               const HistorySnapshot& history) const {
    Score result;
    result.features = extract_features(opportunity);
    const auto& f = result.features;

    result.spread = score_spread(f.spread_percentage, params);
    result.liquidity = score_liquidity(f.liquidity, params);
    result.profit = score_profit(f.estimated_profit, params);
    result.volatility = score_volatility(f.volatility);
    result.gas_efficiency = score_gas_efficiency(f.profit_to_gas_ratio);
    result.historical = score_historical(opportunity, history);

    const auto& w = config_.weights;
    const double total =
        result.spread * w.spread +
        result.liquidity * w.liquidity +
        result.profit * w.profit +
        result.volatility * w.volatility +
        result.gas_efficiency * w.gas_efficiency +
        result.historical * w.historical;

    result.overall = static_cast<int>(std::lround(clip_score(total)));
    result.confidence = calculate_confidence(f, params);
    return result;
}

OpportunityFeatures OpportunityScorer::extract_features(const Opportunity& opportunity) const {
    OpportunityFeatures f;
    f.spread_percentage = opportunity.spread_percentage;
    f.estimated_profit = opportunity.estimated_profit;
    f.liquidity = opportunity.min_liquidity();

    // Normalised divergence between the two quotes
    f.volatility = opportunity.pool_a.price_a > 0.0
        ? std::fabs(opportunity.pool_a.price_a - opportunity.comparable_price_b()) / opportunity.pool_a.price_a
        : 0.0;

    f.profit_to_gas_ratio = opportunity.gas_estimate > 0.0
        ? opportunity.estimated_profit / opportunity.gas_estimate
        : std::numeric_limits<double>::infinity();

    f.age_ms = std::max<int64_t>(0, opportunity.age(clock_->now()).count());
    return f;
}

double OpportunityScorer::score_spread(double spread_percentage, const DynamicParameters& params) const {
    const double saturation = params.min_spread_threshold * config_.spread_saturation_multiple;
    if (saturation <= 0.0) {
        return spread_percentage > 0.0 ? 100.0 : 0.0;
    }
    return clip_score(spread_percentage / saturation * 100.0);
}

double OpportunityScorer::score_liquidity(double liquidity, const DynamicParameters& params) const {
    const double optimal_liquidity = params.target_trade_size * config_.liquidity_depth_multiple;
    if (optimal_liquidity <= 0.0) {
        return liquidity > 0.0 ? 100.0 : 0.0;
    }
    return clip_score(liquidity / optimal_liquidity * 100.0);
}

double OpportunityScorer::score_profit(double profit, const DynamicParameters& params) const {
    if (params.min_profit_threshold <= 0.0) {
        return profit > 0.0 ? 100.0 : 0.0;
    }
    const double multiple = profit / params.min_profit_threshold;
    return clip_score(multiple * config_.profit_score_per_multiple);
}

double OpportunityScorer::score_volatility(double volatility) const {
    return clip_score(100.0 - volatility * config_.volatility_penalty_scale);
}

double OpportunityScorer::score_gas_efficiency(double profit_to_gas_ratio) const {
    if (std::isinf(profit_to_gas_ratio) && profit_to_gas_ratio > 0.0) {
        return 100.0;
    }
    return clip_score(profit_to_gas_ratio * config_.gas_efficiency_scale);
}

double OpportunityScorer::score_historical(const Opportunity& opportunity, const HistorySnapshot& history) const {
    auto rate = history.success_rate_for_pools(opportunity.pool_a.pool_id, opportunity.pool_b.pool_id);
    if (!rate) {
        return clip_score(config_.neutral_historical_score);
    }
    return clip_score(*rate * 100.0);
}

double OpportunityScorer::calculate_confidence(const OpportunityFeatures& features,
                                               const DynamicParameters& params) const {
    double confidence = 1.0;

    if (features.liquidity < params.target_trade_size) {
        confidence *= config_.low_liquidity_confidence_factor;
    }

    if (features.age_ms > config_.stale_age_ms) {
        confidence *= config_.stale_confidence_factor;
    }

    return std::clamp(confidence, 0.0, 1.0);
}

} // namespace sentinel
