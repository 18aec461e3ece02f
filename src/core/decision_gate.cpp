#include "decision_gate.hpp"

namespace sentinel {

std::string to_string(DecisionRejection rejection) {
    switch (rejection) {
        case DecisionRejection::NONE: return "approved";
        case DecisionRejection::SCORE_TOO_LOW: return "score below minimum";
        case DecisionRejection::RISK_UNACCEPTABLE: return "risk above tolerance";
        case DecisionRejection::LOW_CONFIDENCE: return "confidence below minimum";
        case DecisionRejection::PROFIT_BELOW_THRESHOLD: return "profit below threshold";
    }
    return "unknown";
}

DecisionGate::DecisionGate(const DecisionConfig& config)
    : config_(config) {}

Decision DecisionGate::evaluate(const Score& score, const RiskProfile& risk,
                                const DynamicParameters& params) const {
    Decision decision;

    if (score.overall < config_.min_score) {
        decision.rejection = DecisionRejection::SCORE_TOO_LOW;
        return decision;
    }

    if (!risk.acceptable) {
        decision.rejection = DecisionRejection::RISK_UNACCEPTABLE;
        return decision;
    }

    if (score.confidence < config_.min_confidence) {
        decision.rejection = DecisionRejection::LOW_CONFIDENCE;
        return decision;
    }

    if (score.features.estimated_profit < params.min_profit_threshold) {
        decision.rejection = DecisionRejection::PROFIT_BELOW_THRESHOLD;
        return decision;
    }

    decision.approved = true;
    return decision;
}

} // namespace sentinel
