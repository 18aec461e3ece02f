#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "core/arbitrage_engine.hpp"
#include "core/exceptions.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/mock_execution_venue.hpp"
#include "mocks/mock_outcome_sink.hpp"
#include "mocks/mock_snapshot_source.hpp"
#include "test_fixtures.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using sentinel::testing::make_pool;

namespace {

sentinel::ExecutionAction build_test_action(const sentinel::Opportunity& opportunity, double trade_size) {
    sentinel::ExecutionAction action;
    action.opportunity_id = opportunity.id;
    action.trade_size = trade_size;
    return action;
}

} // namespace

class ArbitrageEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sentinel::testing::ManualClock>();
        source_ = std::make_shared<NiceMock<sentinel::testing::MockSnapshotSource>>();
        builder_ = std::make_shared<NiceMock<sentinel::testing::MockActionBuilder>>();
        venue_ = std::make_shared<NiceMock<sentinel::testing::MockExecutionVenue>>();
        sink_ = std::make_shared<NiceMock<sentinel::testing::MockOutcomeSink>>();

        sentinel::SimulationResult simulation;
        simulation.success = true;
        simulation.estimated_profit = 28.8;
        simulation.estimated_gas = 0.001;
        sentinel::SubmissionResult submission;
        submission.success = true;
        submission.reference_id = "0xfeed";
        submission.realized_profit = 28.8;
        submission.gas_cost = 0.001;

        ON_CALL(*source_, get_snapshots()).WillByDefault(Return(std::vector<sentinel::PoolSnapshot>{
            make_pool("P1", 1.00, 100000), make_pool("P2", 1.03, 100000)
        }));
        ON_CALL(*builder_, build_action(_, _)).WillByDefault(Invoke(&build_test_action));
        ON_CALL(*venue_, simulate(_)).WillByDefault(Return(simulation));
        ON_CALL(*venue_, submit(_)).WillByDefault(Return(submission));
    }

    std::unique_ptr<sentinel::ArbitrageEngine> make_engine() {
        context_ = sentinel::make_engine_context(config_, clock_);
        return std::make_unique<sentinel::ArbitrageEngine>(context_, source_, builder_, venue_, sink_);
    }

    sentinel::EngineConfig config_;
    std::shared_ptr<sentinel::testing::ManualClock> clock_;
    std::shared_ptr<sentinel::EngineContext> context_;
    std::shared_ptr<NiceMock<sentinel::testing::MockSnapshotSource>> source_;
    std::shared_ptr<NiceMock<sentinel::testing::MockActionBuilder>> builder_;
    std::shared_ptr<NiceMock<sentinel::testing::MockExecutionVenue>> venue_;
    std::shared_ptr<NiceMock<sentinel::testing::MockOutcomeSink>> sink_;
};

TEST_F(ArbitrageEngineTest, ObserveModeApprovesButDoesNotExecute) {
    auto engine = make_engine();
    EXPECT_CALL(*venue_, simulate(_)).Times(0);
    EXPECT_CALL(*venue_, submit(_)).Times(0);

    auto report = engine->tick();

    EXPECT_FALSE(report.snapshot_error);
    EXPECT_EQ(report.snapshot_count, 2u);
    EXPECT_EQ(report.detected, 1u);
    EXPECT_EQ(report.approved, 1u);
    EXPECT_TRUE(report.executions.empty());
    ASSERT_EQ(report.evaluations.size(), 1u);
    EXPECT_DOUBLE_EQ(report.evaluations[0].trade_size, 1000.0);
    EXPECT_TRUE(report.evaluations[0].opportunity.approved);

    auto stored = engine->detector().find(report.evaluations[0].opportunity.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->approved);
}

TEST_F(ArbitrageEngineTest, AutonomousModeExecutesApprovedOpportunities) {
    config_.app.autonomous_mode = true;
    auto engine = make_engine();
    EXPECT_CALL(*venue_, submit(_)).Times(1);
    EXPECT_CALL(*sink_, emit(_)).Times(1);

    auto report = engine->tick();

    ASSERT_EQ(report.executions.size(), 1u);
    EXPECT_EQ(report.executions[0].status, sentinel::ExecutionStatus::SUCCEEDED);
    EXPECT_EQ(context_->history->size(), 1u);
}

TEST_F(ArbitrageEngineTest, SnapshotFailureSkipsTick) {
    auto engine = make_engine();
    EXPECT_CALL(*source_, get_snapshots())
        .WillOnce(Throw(sentinel::CollaboratorError("rpc unavailable")));

    sentinel::TickReport report;
    EXPECT_NO_THROW(report = engine->tick());

    EXPECT_TRUE(report.snapshot_error);
    EXPECT_EQ(report.detected, 0u);
    EXPECT_EQ(engine->detector().get_stats().detection_runs, 0u);

    EXPECT_FALSE(engine->tick().snapshot_error);
}

TEST_F(ArbitrageEngineTest, RejectedCandidatesAreNotExecuted) {
    config_.app.autonomous_mode = true;
    auto engine = make_engine();
    context_->parameters->update([](sentinel::DynamicParameters& params) {
        params.min_profit_threshold = 50.0;
    });
    EXPECT_CALL(*builder_, build_action(_, _)).Times(0);
    EXPECT_CALL(*sink_, emit(_)).Times(0);

    auto report = engine->tick();

    EXPECT_EQ(report.detected, 1u);
    EXPECT_EQ(report.approved, 0u);
    ASSERT_EQ(report.evaluations.size(), 1u);
    EXPECT_EQ(report.evaluations[0].decision.rejection, sentinel::DecisionRejection::PROFIT_BELOW_THRESHOLD);
    EXPECT_TRUE(report.executions.empty());
    EXPECT_EQ(context_->history->size(), 0u);
}

TEST_F(ArbitrageEngineTest, OperatorShutdownBlocksExecutionUntilRestart) {
    config_.app.autonomous_mode = true;
    auto engine = make_engine();
    engine->shutdown();

    auto report = engine->tick();
    ASSERT_EQ(report.executions.size(), 1u);
    EXPECT_EQ(report.executions[0].status, sentinel::ExecutionStatus::SAFETY_REJECTED);
    EXPECT_EQ(engine->status().safety.circuit_state, sentinel::CircuitState::OPEN);

    engine->restart();
    clock_->advance(std::chrono::milliseconds(1));

    report = engine->tick();
    ASSERT_EQ(report.executions.size(), 1u);
    EXPECT_EQ(report.executions[0].status, sentinel::ExecutionStatus::SUCCEEDED);
}

TEST_F(ArbitrageEngineTest, StatusReportsEngineState) {
    config_.app.autonomous_mode = true;
    auto engine = make_engine();
    engine->tick();

    auto status = engine->status();
    EXPECT_FALSE(status.running);
    EXPECT_TRUE(status.autonomous_mode);
    EXPECT_EQ(status.ticks, 1u);
    EXPECT_EQ(status.open_opportunities.size(), 1u);
    EXPECT_EQ(status.pipeline.succeeded, 1u);
    EXPECT_EQ(status.historical.total_count, 1u);

    auto j = engine->status_json();
    for (const char* key : {"running", "autonomous_mode", "ticks", "queued_tasks", "parameters", "safety",
                            "open_opportunities", "open_opportunity_count", "detection",
                            "pipeline", "historical_24h"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["open_opportunity_count"], 1);
    EXPECT_EQ(j["safety"]["circuit_state"], "Closed");
}

TEST_F(ArbitrageEngineTest, ControlLoopTicksUntilStopped) {
    config_.monitoring.poll_interval_ms = 10;
    auto engine = make_engine();

    engine->start();
    EXPECT_TRUE(engine->is_running());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (engine->status().ticks < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    engine->stop();

    EXPECT_FALSE(engine->is_running());
    EXPECT_GE(engine->status().ticks, 3u);
    EXPECT_EQ(engine->status().queued_tasks, 0u);
}

TEST_F(ArbitrageEngineTest, ControlLoopSurvivesNonStandardSourceFailures) {
    config_.monitoring.poll_interval_ms = 10;
    auto engine = make_engine();
    ON_CALL(*source_, get_snapshots()).WillByDefault(Throw(7));

    EXPECT_TRUE(engine->tick().snapshot_error);

    engine->start();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (engine->status().ticks < 4 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    engine->stop();

    EXPECT_GE(engine->status().ticks, 4u);
    EXPECT_EQ(engine->detector().get_stats().detection_runs, 0u);
}

TEST_F(ArbitrageEngineTest, RequiresSnapshotSource) {
    context_ = sentinel::make_engine_context(config_, clock_);

    EXPECT_THROW(std::make_unique<sentinel::ArbitrageEngine>(context_, nullptr, builder_, venue_, sink_),
                 sentinel::ConfigurationError);
}
