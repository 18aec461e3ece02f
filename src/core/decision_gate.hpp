#pragma once

#include <string>
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace sentinel {

enum class DecisionRejection {
    NONE,
    SCORE_TOO_LOW,
    RISK_UNACCEPTABLE,
    LOW_CONFIDENCE,
    PROFIT_BELOW_THRESHOLD
};

std::string to_string(DecisionRejection rejection);

struct Decision {
    bool approved = false;
    DecisionRejection rejection = DecisionRejection::NONE;

    std::string reason() const { return to_string(rejection); }
};

// Accept/reject policy. Checks run in a fixed order and stop at the first failure.
class DecisionGate {
public:
    explicit DecisionGate(const DecisionConfig& config);

    Decision evaluate(const Score& score, const RiskProfile& risk, const DynamicParameters& params) const;

    bool should_execute(const Score& score, const RiskProfile& risk, const DynamicParameters& params) const {
        return evaluate(score, risk, params).approved;
    }

private:
    DecisionConfig config_;
};

} // namespace sentinel
