#include "safety_gate.hpp"
#include <cmath>
#include <fmt/format.h>
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace sentinel {

std::string to_string(CircuitState state) {
    return state == CircuitState::OPEN ? "Open" : "Closed";
}

std::string to_string(SafetyTrip trip) {
    switch (trip) {
        case SafetyTrip::NONE: return "None";
        case SafetyTrip::SHUTDOWN: return "Shutdown";
        case SafetyTrip::CONSECUTIVE_FAILURES: return "ConsecutiveFailures";
        case SafetyTrip::DAILY_LOSS_LIMIT: return "DailyLossLimit";
        case SafetyTrip::POSITION_TOO_LARGE: return "PositionTooLarge";
    }
    return "Unknown";
}

void to_json(nlohmann::json& j, const SafetyState& s) {
    j = nlohmann::json{
        {"shutdown", s.shutdown},
        {"consecutive_failures", s.consecutive_failures},
        {"loss_since_reset", s.loss_since_reset},
        {"last_reset", to_epoch_ms(s.last_reset)},
        {"circuit_state", to_string(s.circuit_state)}
    };
}

SafetyGate::SafetyGate(const SafetyConfig& config, std::shared_ptr<Clock> clock)
    : config_(config),
      clock_(std::move(clock)),
      loss_window_(config.loss_window_hours) {
    if (!clock_) {
        throw ConfigurationError("safety gate requires a clock");
    }
    last_reset_ = clock_->now();
}

SafetyCheck SafetyGate::check(double trade_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Timestamp now = clock_->now();
    roll_loss_window_locked(now);

    SafetyCheck result;
    auto trip = [&result](SafetyTrip reason, std::string warning) {
        if (result.passed) {
            result.passed = false;
            result.reason = reason;
        }
        result.warnings.push_back(std::move(warning));
    };

    if (shutdown_) {
        trip(SafetyTrip::SHUTDOWN, "Engine is shut down");
    }
    if (consecutive_failures_ >= config_.max_consecutive_failures) {
        trip(SafetyTrip::CONSECUTIVE_FAILURES,
             fmt::format("Circuit breaker active: {} consecutive failures", consecutive_failures_));
    }
    if (loss_since_reset_ >= config_.max_daily_loss) {
        trip(SafetyTrip::DAILY_LOSS_LIMIT,
             fmt::format("Daily loss limit exceeded: {:.2f}", loss_since_reset_));
    }
    if (trade_size > config_.max_position_size) {
        trip(SafetyTrip::POSITION_TOO_LARGE,
             fmt::format("Position size {:.2f} exceeds maximum {:.2f}", trade_size, config_.max_position_size));
    }

    return result;
}

void SafetyGate::record_failure(const std::string& cause) {
    CircuitState before;
    CircuitState after;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Timestamp now = clock_->now();
        roll_loss_window_locked(now);
        before = state_locked(now);
        ++consecutive_failures_;
        after = state_locked(now);
    }
    log_transition(before, after, cause);
}

void SafetyGate::record_execution_failure(double realized_cost, const std::string& cause) {
    CircuitState before;
    CircuitState after;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Timestamp now = clock_->now();
        roll_loss_window_locked(now);
        before = state_locked(now);
        ++consecutive_failures_;
        if (realized_cost > 0.0 && std::isfinite(realized_cost)) {
            loss_since_reset_ += realized_cost;
        }
        after = state_locked(now);
    }
    log_transition(before, after, cause);
}

void SafetyGate::record_success(double net_profit) {
    CircuitState before;
    CircuitState after;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Timestamp now = clock_->now();
        roll_loss_window_locked(now);
        before = state_locked(now);
        consecutive_failures_ = 0;
        if (net_profit < 0.0 && std::isfinite(net_profit)) {
            loss_since_reset_ += -net_profit;
        }
        after = state_locked(now);
    }
    log_transition(before, after, "successful execution");
}

void SafetyGate::shutdown() {
    CircuitState before;
    CircuitState after;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Timestamp now = clock_->now();
        before = state_locked(now);
        shutdown_ = true;
        after = state_locked(now);
    }
    SENTINEL_LOG_WARN("Operator shutdown requested");
    log_transition(before, after, "operator shutdown");
}

void SafetyGate::restart() {
    CircuitState before;
    CircuitState after;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Timestamp now = clock_->now();
        roll_loss_window_locked(now);
        before = state_locked(now);
        shutdown_ = false;
        consecutive_failures_ = 0;
        after = state_locked(now);
    }
    SENTINEL_LOG_INFO("Operator restart requested");
    log_transition(before, after, "operator restart");
}

CircuitState SafetyGate::circuit_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_locked(clock_->now());
}

SafetyState SafetyGate::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Timestamp now = clock_->now();
    SafetyState state;
    state.shutdown = shutdown_;
    state.consecutive_failures = consecutive_failures_;
    state.loss_since_reset = effective_loss_locked(now);
    state.last_reset = (now - last_reset_ >= loss_window_) ? now : last_reset_;
    state.circuit_state = state_locked(now);
    return state;
}

void SafetyGate::roll_loss_window_locked(Timestamp now) {
    if (now - last_reset_ >= loss_window_) {
        if (loss_since_reset_ > 0.0) {
            SENTINEL_LOG_INFO("Loss window elapsed, resetting loss counter from {:.4f}", loss_since_reset_);
        }
        loss_since_reset_ = 0.0;
        last_reset_ = now;
    }
}

double SafetyGate::effective_loss_locked(Timestamp now) const {
    return (now - last_reset_ >= loss_window_) ? 0.0 : loss_since_reset_;
}

CircuitState SafetyGate::state_locked(Timestamp now) const {
    if (shutdown_ ||
        consecutive_failures_ >= config_.max_consecutive_failures ||
        effective_loss_locked(now) >= config_.max_daily_loss) {
        return CircuitState::OPEN;
    }
    return CircuitState::CLOSED;
}

void SafetyGate::log_transition(CircuitState before, CircuitState after, const std::string& reason) const {
    if (before != after) {
        TradingLogger::log_circuit_transition(to_string(before), to_string(after), reason);
    }
}

} // namespace sentinel
