#pragma once

#include <memory>
#include "clock.hpp"
#include "outcome_history.hpp"
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace sentinel {

// Multi-factor desirability model. Pure function of the opportunity, the
// parameter snapshot and the history snapshot handed in by the caller.
class OpportunityScorer {
public:
    OpportunityScorer(const ScoringConfig& config, std::shared_ptr<Clock> clock);

    Score score(const Opportunity& opportunity,
                const DynamicParameters& params,
                const HistorySnapshot& history) const;

    OpportunityFeatures extract_features(const Opportunity& opportunity) const;

    // Individual sub-scores, each clipped to [0, 100]
    double score_spread(double spread_percentage, const DynamicParameters& params) const;
    double score_liquidity(double liquidity, const DynamicParameters& params) const;
    double score_profit(double profit, const DynamicParameters& params) const;
    double score_volatility(double volatility) const;
    double score_gas_efficiency(double profit_to_gas_ratio) const;
    double score_historical(const Opportunity& opportunity, const HistorySnapshot& history) const;

    double calculate_confidence(const OpportunityFeatures& features, const DynamicParameters& params) const;

    const ScoringConfig& config() const { return config_; }

private:
    ScoringConfig config_;
    std::shared_ptr<Clock> clock_;
};

} // namespace sentinel
