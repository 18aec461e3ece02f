#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include "core/opportunity_scorer.hpp"
#include "mocks/manual_clock.hpp"
#include "test_fixtures.hpp"

using sentinel::testing::make_opportunity;
using sentinel::testing::make_outcome;
using namespace std::chrono_literals;

class OpportunityScorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sentinel::testing::ManualClock>();
        scorer_ = std::make_unique<sentinel::OpportunityScorer>(config_, clock_);
    }

    sentinel::ScoringConfig config_;
    sentinel::DynamicParameters params_;
    sentinel::HistorySnapshot empty_history_;
    std::shared_ptr<sentinel::testing::ManualClock> clock_;
    std::unique_ptr<sentinel::OpportunityScorer> scorer_;
};

TEST_F(OpportunityScorerTest, ScoresReferenceOpportunity) {
    auto opportunity = make_opportunity(clock_->now());

    auto score = scorer_->score(opportunity, params_, empty_history_);

    EXPECT_DOUBLE_EQ(score.spread, 100.0);
    EXPECT_DOUBLE_EQ(score.liquidity, 100.0);
    EXPECT_DOUBLE_EQ(score.profit, 100.0);
    EXPECT_NEAR(score.volatility, 70.0, 1e-6);
    EXPECT_DOUBLE_EQ(score.gas_efficiency, 100.0);
    EXPECT_DOUBLE_EQ(score.historical, 50.0);
    EXPECT_EQ(score.overall, 92);
    EXPECT_DOUBLE_EQ(score.confidence, 1.0);
}

TEST_F(OpportunityScorerTest, ExtractsFeatures) {
    auto opportunity = make_opportunity(clock_->now());
    clock_->advance(1500ms);

    auto features = scorer_->extract_features(opportunity);

    EXPECT_NEAR(features.spread_percentage, 0.03, 1e-9);
    EXPECT_NEAR(features.estimated_profit, 29.099, 1e-6);
    EXPECT_DOUBLE_EQ(features.liquidity, 100000.0);
    EXPECT_NEAR(features.volatility, 0.03, 1e-9);
    EXPECT_NEAR(features.profit_to_gas_ratio, 29099.0, 1e-3);
    EXPECT_EQ(features.age_ms, 1500);
}

TEST_F(OpportunityScorerTest, ReversedPoolFeaturesUseComparableQuote) {
    auto opportunity = make_opportunity(clock_->now());
    opportunity.pool_b = sentinel::testing::make_pool("P2", 1.0 / 1.03, 100000, "USDC", "ETH");
    opportunity.pool_b.liquidity_a = 250000.0;

    auto features = scorer_->extract_features(opportunity);

    EXPECT_NEAR(features.volatility, 0.03, 1e-9);
    EXPECT_DOUBLE_EQ(features.liquidity, 100000.0);
}

TEST_F(OpportunityScorerTest, ZeroGasGivesFullGasEfficiency) {
    auto opportunity = make_opportunity(clock_->now());
    opportunity.gas_estimate = 0.0;

    auto features = scorer_->extract_features(opportunity);
    EXPECT_TRUE(std::isinf(features.profit_to_gas_ratio));
    EXPECT_DOUBLE_EQ(scorer_->score_gas_efficiency(features.profit_to_gas_ratio), 100.0);
}

TEST_F(OpportunityScorerTest, SubScoresAreMonotonic) {
    double previous = -1.0;
    for (double spread = 0.0; spread <= 0.05; spread += 0.001) {
        double current = scorer_->score_spread(spread, params_);
        EXPECT_GE(current, previous);
        previous = current;
    }

    previous = -1.0;
    for (double liquidity = 0.0; liquidity <= 40000.0; liquidity += 1000.0) {
        double current = scorer_->score_liquidity(liquidity, params_);
        EXPECT_GE(current, previous);
        previous = current;
    }

    previous = -1.0;
    for (double profit = -1.0; profit <= 1.0; profit += 0.05) {
        double current = scorer_->score_profit(profit, params_);
        EXPECT_GE(current, previous);
        previous = current;
    }

    previous = 101.0;
    for (double volatility = 0.0; volatility <= 0.2; volatility += 0.01) {
        double current = scorer_->score_volatility(volatility);
        EXPECT_LE(current, previous);
        previous = current;
    }
}

TEST_F(OpportunityScorerTest, ScoresStayWithinBounds) {
    for (double price_b : {1.001, 1.005, 1.03, 1.2, 3.0}) {
        for (double liquidity : {0.0, 500.0, 20000.0, 1e7}) {
            auto opportunity = make_opportunity(clock_->now(), 1.0, price_b, liquidity);
            auto score = scorer_->score(opportunity, params_, empty_history_);

            EXPECT_GE(score.overall, 0);
            EXPECT_LE(score.overall, 100);
            for (double sub : {score.spread, score.liquidity, score.profit,
                               score.volatility, score.gas_efficiency, score.historical}) {
                EXPECT_GE(sub, 0.0);
                EXPECT_LE(sub, 100.0);
            }
            EXPECT_GT(score.confidence, 0.0);
            EXPECT_LE(score.confidence, 1.0);
        }
    }
}

TEST_F(OpportunityScorerTest, SpreadSaturatesAtThreeTimesThreshold) {
    EXPECT_NEAR(scorer_->score_spread(0.0075, params_), 50.0, 1e-9);
    EXPECT_NEAR(scorer_->score_spread(0.015, params_), 100.0, 1e-9);
    EXPECT_DOUBLE_EQ(scorer_->score_spread(0.5, params_), 100.0);
}

TEST_F(OpportunityScorerTest, LowLiquidityReducesConfidence) {
    auto opportunity = make_opportunity(clock_->now(), 1.0, 1.03, 500.0);

    auto score = scorer_->score(opportunity, params_, empty_history_);

    EXPECT_DOUBLE_EQ(score.confidence, 0.8);
}

TEST_F(OpportunityScorerTest, StaleOpportunityReducesConfidence) {
    auto opportunity = make_opportunity(clock_->now());
    clock_->advance(10s);
    EXPECT_DOUBLE_EQ(scorer_->score(opportunity, params_, empty_history_).confidence, 1.0);

    clock_->advance(1ms);
    EXPECT_DOUBLE_EQ(scorer_->score(opportunity, params_, empty_history_).confidence, 0.9);
}

TEST_F(OpportunityScorerTest, ConfidencePenaltiesCompound) {
    auto opportunity = make_opportunity(clock_->now(), 1.0, 1.03, 500.0);
    clock_->advance(11s);

    EXPECT_NEAR(scorer_->score(opportunity, params_, empty_history_).confidence, 0.72, 1e-9);
}

TEST_F(OpportunityScorerTest, HistoricalScoreUsesSuccessRateForSamePools) {
    sentinel::HistorySnapshot history;
    history.records.push_back(make_outcome(clock_->now(), true, 1.0, 1000.0, "P1", "P2"));
    history.records.push_back(make_outcome(clock_->now(), false, 0.0, 1000.0, "P2", "P1"));
    history.records.push_back(make_outcome(clock_->now(), true, 1.0, 1000.0, "P1", "P2"));
    history.records.push_back(make_outcome(clock_->now(), false, 0.0, 1000.0, "P1", "P9"));

    auto opportunity = make_opportunity(clock_->now());

    EXPECT_NEAR(scorer_->score_historical(opportunity, history), 200.0 / 3.0, 1e-9);
}

TEST_F(OpportunityScorerTest, HistoricalScoreIsNeutralWithoutMatchingHistory) {
    sentinel::HistorySnapshot history;
    history.records.push_back(make_outcome(clock_->now(), true, 1.0, 1000.0, "P7", "P8"));

    auto opportunity = make_opportunity(clock_->now());

    EXPECT_DOUBLE_EQ(scorer_->score_historical(opportunity, history), 50.0);
}

TEST_F(OpportunityScorerTest, ScoringIsDeterministicForFixedInputs) {
    auto opportunity = make_opportunity(clock_->now(), 1.0, 1.012, 30000.0);

    auto first = scorer_->score(opportunity, params_, empty_history_);
    auto second = scorer_->score(opportunity, params_, empty_history_);

    EXPECT_EQ(first.overall, second.overall);
    EXPECT_DOUBLE_EQ(first.confidence, second.confidence);
}
