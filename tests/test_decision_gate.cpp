#include <gtest/gtest.h>
#include "core/decision_gate.hpp"

namespace {

struct GateInputs {
    sentinel::Score score;
    sentinel::RiskProfile risk;
};

GateInputs make_inputs(bool score_ok, bool risk_ok, bool confidence_ok, bool profit_ok) {
    GateInputs inputs;
    inputs.score.overall = score_ok ? 75 : 40;
    inputs.score.confidence = confidence_ok ? 0.9 : 0.5;
    inputs.score.features.estimated_profit = profit_ok ? 1.0 : 0.05;
    inputs.risk.acceptable = risk_ok;
    return inputs;
}

} // namespace

class DecisionGateTest : public ::testing::Test {
protected:
    sentinel::DecisionConfig config_;
    sentinel::DecisionGate gate_{config_};
    sentinel::DynamicParameters params_;
};

TEST_F(DecisionGateTest, FullTruthTable) {
    for (int mask = 0; mask < 16; ++mask) {
        const bool score_ok = mask & 1;
        const bool risk_ok = mask & 2;
        const bool confidence_ok = mask & 4;
        const bool profit_ok = mask & 8;
        auto inputs = make_inputs(score_ok, risk_ok, confidence_ok, profit_ok);

        auto decision = gate_.evaluate(inputs.score, inputs.risk, params_);

        sentinel::DecisionRejection expected = sentinel::DecisionRejection::NONE;
        if (!score_ok) {
            expected = sentinel::DecisionRejection::SCORE_TOO_LOW;
        } else if (!risk_ok) {
            expected = sentinel::DecisionRejection::RISK_UNACCEPTABLE;
        } else if (!confidence_ok) {
            expected = sentinel::DecisionRejection::LOW_CONFIDENCE;
        } else if (!profit_ok) {
            expected = sentinel::DecisionRejection::PROFIT_BELOW_THRESHOLD;
        }

        SCOPED_TRACE("mask " + std::to_string(mask));
        EXPECT_EQ(decision.approved, score_ok && risk_ok && confidence_ok && profit_ok);
        EXPECT_EQ(decision.rejection, expected);
        EXPECT_EQ(gate_.should_execute(inputs.score, inputs.risk, params_), decision.approved);
    }
}

TEST_F(DecisionGateTest, ThresholdsAreInclusive) {
    auto inputs = make_inputs(true, true, true, true);
    inputs.score.overall = 60;
    inputs.score.confidence = 0.7;
    inputs.score.features.estimated_profit = params_.min_profit_threshold;

    EXPECT_TRUE(gate_.evaluate(inputs.score, inputs.risk, params_).approved);

    inputs.score.overall = 59;
    EXPECT_EQ(gate_.evaluate(inputs.score, inputs.risk, params_).rejection,
              sentinel::DecisionRejection::SCORE_TOO_LOW);
}

TEST_F(DecisionGateTest, ProfitThresholdComesFromDynamicParameters) {
    auto inputs = make_inputs(true, true, true, true);
    params_.min_profit_threshold = 5.0;

    auto decision = gate_.evaluate(inputs.score, inputs.risk, params_);

    EXPECT_FALSE(decision.approved);
    EXPECT_EQ(decision.reason(), "profit below threshold");
}

TEST_F(DecisionGateTest, ApprovedDecisionReason) {
    auto inputs = make_inputs(true, true, true, true);
    EXPECT_EQ(gate_.evaluate(inputs.score, inputs.risk, params_).reason(), "approved");
}
