#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "clock.hpp"
#include "../utils/config_types.hpp"

namespace sentinel {

enum class CircuitState {
    CLOSED,
    OPEN
};

enum class SafetyTrip {
    NONE,
    SHUTDOWN,
    CONSECUTIVE_FAILURES,
    DAILY_LOSS_LIMIT,
    POSITION_TOO_LARGE
};

std::string to_string(CircuitState state);
std::string to_string(SafetyTrip trip);

struct SafetyCheck {
    bool passed = true;
    SafetyTrip reason = SafetyTrip::NONE;   // first guard that tripped
    std::vector<std::string> warnings;      // every guard that tripped
};

struct SafetyState {
    bool shutdown = false;
    int consecutive_failures = 0;
    double loss_since_reset = 0.0;
    Timestamp last_reset{};
    CircuitState circuit_state = CircuitState::CLOSED;
};

void to_json(nlohmann::json& j, const SafetyState& s);

// Circuit breaker consulted before every execution attempt. All state lives
// behind one mutex so concurrent outcomes cannot under-count failures or losses.
class SafetyGate {
public:
    SafetyGate(const SafetyConfig& config, std::shared_ptr<Clock> clock);

    SafetyCheck check(double trade_size);

    // Simulation failures and internal faults: no funds were at risk
    void record_failure(const std::string& cause);
    // Submission failures: counts as a failure and the realised cost is a loss
    void record_execution_failure(double realized_cost, const std::string& cause);
    // Resets the failure streak; a negative net result still accrues to the loss counter
    void record_success(double net_profit);

    void shutdown();
    void restart();

    CircuitState circuit_state() const;
    SafetyState snapshot() const;
    const SafetyConfig& config() const { return config_; }

private:
    void roll_loss_window_locked(Timestamp now);
    double effective_loss_locked(Timestamp now) const;
    CircuitState state_locked(Timestamp now) const;
    void log_transition(CircuitState before, CircuitState after, const std::string& reason) const;

    SafetyConfig config_;
    std::shared_ptr<Clock> clock_;
    std::chrono::hours loss_window_;

    mutable std::mutex mutex_;
    bool shutdown_ = false;
    int consecutive_failures_ = 0;
    double loss_since_reset_ = 0.0;
    Timestamp last_reset_{};
};

} // namespace sentinel
