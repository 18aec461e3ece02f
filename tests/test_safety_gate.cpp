#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "core/safety_gate.hpp"
#include "mocks/manual_clock.hpp"

using namespace std::chrono_literals;

class SafetyGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sentinel::testing::ManualClock>();
        gate_ = std::make_unique<sentinel::SafetyGate>(config_, clock_);
    }

    sentinel::SafetyConfig config_;
    std::shared_ptr<sentinel::testing::ManualClock> clock_;
    std::unique_ptr<sentinel::SafetyGate> gate_;
};

TEST_F(SafetyGateTest, FreshGateIsClosedAndPasses) {
    auto check = gate_->check(1000.0);

    EXPECT_TRUE(check.passed);
    EXPECT_EQ(check.reason, sentinel::SafetyTrip::NONE);
    EXPECT_TRUE(check.warnings.empty());
    EXPECT_EQ(gate_->circuit_state(), sentinel::CircuitState::CLOSED);
}

TEST_F(SafetyGateTest, OpensAfterMaxConsecutiveFailures) {
    for (int i = 0; i < 4; ++i) {
        gate_->record_failure("simulation failed");
    }
    EXPECT_EQ(gate_->circuit_state(), sentinel::CircuitState::CLOSED);
    EXPECT_TRUE(gate_->check(100.0).passed);

    gate_->record_failure("simulation failed");
    EXPECT_EQ(gate_->circuit_state(), sentinel::CircuitState::OPEN);

    auto check = gate_->check(100.0);
    EXPECT_FALSE(check.passed);
    EXPECT_EQ(check.reason, sentinel::SafetyTrip::CONSECUTIVE_FAILURES);
}

TEST_F(SafetyGateTest, SuccessClosesCircuitOpenedByFailures) {
    for (int i = 0; i < 5; ++i) {
        gate_->record_failure("simulation failed");
    }
    ASSERT_EQ(gate_->circuit_state(), sentinel::CircuitState::OPEN);

    gate_->record_success(2.5);

    EXPECT_EQ(gate_->circuit_state(), sentinel::CircuitState::CLOSED);
    EXPECT_EQ(gate_->snapshot().consecutive_failures, 0);
}

TEST_F(SafetyGateTest, SubmissionFailuresOpenAndOneSuccessResets) {
    config_.max_daily_loss = 100.0;
    gate_ = std::make_unique<sentinel::SafetyGate>(config_, clock_);

    for (int i = 0; i < 5; ++i) {
        gate_->record_execution_failure(1.5, "reverted");
    }
    EXPECT_EQ(gate_->snapshot().consecutive_failures, 5);
    EXPECT_EQ(gate_->circuit_state(), sentinel::CircuitState::OPEN);
    EXPECT_EQ(gate_->check(100.0).reason, sentinel::SafetyTrip::CONSECUTIVE_FAILURES);

    gate_->record_success(3.0);

    EXPECT_EQ(gate_->snapshot().consecutive_failures, 0);
    EXPECT_EQ(gate_->circuit_state(), sentinel::CircuitState::CLOSED);
    EXPECT_DOUBLE_EQ(gate_->snapshot().loss_since_reset, 7.5);
    EXPECT_TRUE(gate_->check(100.0).passed);
}

TEST_F(SafetyGateTest, RepeatedFailuresWhileOpenKeepItOpen) {
    for (int i = 0; i < 8; ++i) {
        gate_->record_failure("simulation failed");
    }
    EXPECT_EQ(gate_->circuit_state(), sentinel::CircuitState::OPEN);
    EXPECT_EQ(gate_->snapshot().consecutive_failures, 8);
}

TEST_F(SafetyGateTest, ExecutionFailuresAccrueLoss) {
    gate_->record_execution_failure(4.0, "reverted");
    gate_->record_success(10.0);
    gate_->record_execution_failure(5.0, "reverted");
    EXPECT_TRUE(gate_->check(100.0).passed);

    gate_->record_execution_failure(1.0, "reverted");

    auto check = gate_->check(100.0);
    EXPECT_FALSE(check.passed);
    EXPECT_EQ(check.reason, sentinel::SafetyTrip::DAILY_LOSS_LIMIT);
    EXPECT_DOUBLE_EQ(gate_->snapshot().loss_since_reset, 10.0);
    EXPECT_EQ(gate_->circuit_state(), sentinel::CircuitState::OPEN);
}

TEST_F(SafetyGateTest, NegativeNetSuccessAccruesLoss) {
    gate_->record_success(-3.0);

    EXPECT_DOUBLE_EQ(gate_->snapshot().loss_since_reset, 3.0);
    EXPECT_EQ(gate_->snapshot().consecutive_failures, 0);
}

TEST_F(SafetyGateTest, LossWindowRollsAfterConfiguredHours) {
    gate_->record_execution_failure(10.0, "reverted");
    ASSERT_FALSE(gate_->check(100.0).passed);

    clock_->advance(23h);
    EXPECT_FALSE(gate_->check(100.0).passed);

    clock_->advance(1h);
    auto check = gate_->check(100.0);
    EXPECT_TRUE(check.passed);
    EXPECT_DOUBLE_EQ(gate_->snapshot().loss_since_reset, 0.0);
    EXPECT_EQ(gate_->snapshot().last_reset, clock_->now());
}

TEST_F(SafetyGateTest, PositionLimitRejectsWithoutOpeningCircuit) {
    auto check = gate_->check(2000.0);

    EXPECT_FALSE(check.passed);
    EXPECT_EQ(check.reason, sentinel::SafetyTrip::POSITION_TOO_LARGE);
    EXPECT_EQ(gate_->circuit_state(), sentinel::CircuitState::CLOSED);
    EXPECT_TRUE(gate_->check(1000.0).passed);
}

TEST_F(SafetyGateTest, ReportsFirstTripAndEveryWarning) {
    gate_->shutdown();
    for (int i = 0; i < 5; ++i) {
        gate_->record_failure("simulation failed");
    }

    auto check = gate_->check(5000.0);

    EXPECT_FALSE(check.passed);
    EXPECT_EQ(check.reason, sentinel::SafetyTrip::SHUTDOWN);
    EXPECT_EQ(check.warnings.size(), 3u);
}

TEST_F(SafetyGateTest, RestartClearsShutdownAndFailuresButNotLoss) {
    gate_->record_execution_failure(3.0, "reverted");
    for (int i = 0; i < 5; ++i) {
        gate_->record_failure("simulation failed");
    }
    gate_->shutdown();
    ASSERT_EQ(gate_->circuit_state(), sentinel::CircuitState::OPEN);

    gate_->restart();

    auto state = gate_->snapshot();
    EXPECT_FALSE(state.shutdown);
    EXPECT_EQ(state.consecutive_failures, 0);
    EXPECT_DOUBLE_EQ(state.loss_since_reset, 3.0);
    EXPECT_EQ(state.circuit_state, sentinel::CircuitState::CLOSED);
}

TEST_F(SafetyGateTest, ConcurrentFailuresAreAllCounted) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 100; ++i) {
                gate_->record_execution_failure(0.001, "reverted");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto state = gate_->snapshot();
    EXPECT_EQ(state.consecutive_failures, 800);
    EXPECT_NEAR(state.loss_since_reset, 0.8, 1e-9);
}

TEST_F(SafetyGateTest, StateSerializesToJson) {
    gate_->record_failure("simulation failed");

    nlohmann::json j = gate_->snapshot();

    EXPECT_EQ(j["consecutive_failures"], 1);
    EXPECT_EQ(j["circuit_state"], "Closed");
    EXPECT_FALSE(j["shutdown"].get<bool>());
}
