#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "types.hpp"

namespace sentinel {

// Opaque action handed from the builder to the venue. The payload belongs to the collaborators.
struct ExecutionAction {
    std::string opportunity_id;
    std::string buy_pool_id;
    std::string sell_pool_id;
    double trade_size = 0.0;
    nlohmann::json payload;
};

struct SimulationResult {
    bool success = false;
    double estimated_profit = 0.0;
    double estimated_gas = 0.0;
    double estimated_slippage = 0.0;
    std::string error;
};

struct SubmissionResult {
    bool success = false;
    std::string reference_id;
    double realized_profit = 0.0;
    double gas_cost = 0.0;
    std::string error;
};

class ActionBuilder {
public:
    virtual ~ActionBuilder() = default;
    virtual ExecutionAction build_action(const Opportunity& opportunity, double trade_size) = 0;
};

class ExecutionVenue {
public:
    virtual ~ExecutionVenue() = default;
    virtual SimulationResult simulate(const ExecutionAction& action) = 0;
    virtual SubmissionResult submit(const ExecutionAction& action) = 0;
};

class SnapshotSource {
public:
    virtual ~SnapshotSource() = default;
    virtual std::vector<PoolSnapshot> get_snapshots() = 0;
};

// Fire-and-forget persistence hook. Called once per outcome, in completion order.
class OutcomeSink {
public:
    virtual ~OutcomeSink() = default;
    virtual void emit(const OutcomeRecord& record) = 0;
};

} // namespace sentinel
