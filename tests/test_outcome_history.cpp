#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include "core/exceptions.hpp"
#include "core/outcome_history.hpp"
#include "mocks/manual_clock.hpp"
#include "test_fixtures.hpp"

using sentinel::testing::make_outcome;
using namespace std::chrono_literals;

class OutcomeHistoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sentinel::testing::ManualClock>();
    }

    std::shared_ptr<sentinel::testing::ManualClock> clock_;
};

TEST_F(OutcomeHistoryTest, EvictsOldestBeyondCapacity) {
    sentinel::OutcomeHistory history(3, clock_);

    for (int i = 0; i < 5; ++i) {
        auto record = make_outcome(clock_->now(), true);
        record.opportunity_id = "op" + std::to_string(i);
        EXPECT_EQ(history.append(record), static_cast<size_t>(i + 1));
    }

    EXPECT_EQ(history.size(), 3u);
    EXPECT_EQ(history.total_recorded(), 5u);
    auto records = history.snapshot().records;
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records.front().opportunity_id, "op2");
    EXPECT_EQ(records.back().opportunity_id, "op4");
}

TEST_F(OutcomeHistoryTest, RecentReturnsNewestInOrder) {
    sentinel::OutcomeHistory history(10, clock_);
    for (int i = 0; i < 4; ++i) {
        auto record = make_outcome(clock_->now(), true);
        record.opportunity_id = "op" + std::to_string(i);
        history.append(record);
    }

    auto recent = history.recent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].opportunity_id, "op2");
    EXPECT_EQ(recent[1].opportunity_id, "op3");
    EXPECT_EQ(history.recent(100).size(), 4u);
}

TEST_F(OutcomeHistoryTest, StatsCoverOnlyTheWindow) {
    sentinel::OutcomeHistory history(10, clock_);
    history.append(make_outcome(clock_->now(), true, 5.0));
    clock_->advance(25h);
    history.append(make_outcome(clock_->now(), true, 2.0));
    history.append(make_outcome(clock_->now(), true, 4.0));
    history.append(make_outcome(clock_->now(), false, 0.0));

    auto stats = history.get_historical_stats(24);

    EXPECT_EQ(stats.total_count, 3u);
    EXPECT_EQ(stats.success_count, 2u);
    EXPECT_DOUBLE_EQ(stats.avg_profit, 3.0);
}

TEST_F(OutcomeHistoryTest, HistoricalOptimalSizeIgnoresOtherPairsAndFailures) {
    sentinel::HistorySnapshot snapshot;
    snapshot.records.push_back(make_outcome(clock_->now(), true, 1.0, 200.0));
    snapshot.records.push_back(make_outcome(clock_->now(), false, 0.0, 900.0));
    auto other = make_outcome(clock_->now(), true, 1.0, 5000.0);
    other.asset_a = "WBTC";
    snapshot.records.push_back(other);

    EXPECT_DOUBLE_EQ(snapshot.historical_optimal_size("ETH", "USDC"), 200.0);
    EXPECT_DOUBLE_EQ(snapshot.historical_optimal_size("USDC", "ETH"), 200.0);
    EXPECT_DOUBLE_EQ(snapshot.historical_optimal_size("DAI", "USDC"), 0.0);
}

TEST_F(OutcomeHistoryTest, SnapshotIsIndependentOfLaterAppends) {
    sentinel::OutcomeHistory history(10, clock_);
    history.append(make_outcome(clock_->now(), true));

    auto snapshot = history.snapshot();
    history.append(make_outcome(clock_->now(), false));

    EXPECT_EQ(snapshot.records.size(), 1u);
    EXPECT_EQ(history.size(), 2u);
}

TEST_F(OutcomeHistoryTest, RejectsZeroCapacity) {
    EXPECT_THROW(std::make_unique<sentinel::OutcomeHistory>(0, clock_), sentinel::ConfigurationError);
}
