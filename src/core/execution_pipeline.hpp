#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include "engine_context.hpp"
#include "execution_venue.hpp"
#include "types.hpp"

namespace sentinel {

enum class SingleFlightScope {
    GLOBAL,             // one attempt in flight process-wide
    PER_OPPORTUNITY     // one attempt in flight per opportunity id
};

SingleFlightScope parse_single_flight_scope(const std::string& value);
std::string to_string(SingleFlightScope scope);

enum class PipelineStage {
    IDLE,
    GATING,
    BUILDING,
    SIMULATING,
    VERIFYING,
    SUBMITTING,
    RECORDING
};

std::string to_string(PipelineStage stage);

struct PipelineStatistics {
    uint64_t attempts = 0;
    uint64_t succeeded = 0;
    uint64_t safety_rejected = 0;
    uint64_t simulation_failed = 0;
    uint64_t unprofitable_simulation = 0;
    uint64_t execution_failed = 0;
    uint64_t concurrency_rejected = 0;
    double total_realized_profit = 0.0;
};

void to_json(nlohmann::json& j, const PipelineStatistics& s);

// Gating -> Building -> Simulating -> Verifying -> Submitting -> Recording.
// Never throws: every call returns a structured result and produces exactly one OutcomeRecord.
class ExecutionPipeline {
public:
    ExecutionPipeline(std::shared_ptr<EngineContext> context,
                      std::shared_ptr<ActionBuilder> action_builder,
                      std::shared_ptr<ExecutionVenue> venue,
                      std::shared_ptr<OutcomeSink> sink);

    // Executes with opportunity.trade_amount as the resolved size
    ExecutionResult execute(const Opportunity& opportunity, const Score& score);

    SingleFlightScope scope() const { return scope_; }
    size_t in_flight() const;
    PipelineStatistics get_statistics() const;

private:
    class FlightGuard {
    public:
        FlightGuard(ExecutionPipeline& pipeline, std::string key);
        ~FlightGuard();

        FlightGuard(const FlightGuard&) = delete;
        FlightGuard& operator=(const FlightGuard&) = delete;

        bool acquired() const { return acquired_; }

    private:
        ExecutionPipeline& pipeline_;
        std::string key_;
        bool acquired_;
    };

    ExecutionResult run_attempt(const Opportunity& opportunity);
    ExecutionResult run_stages(const Opportunity& opportunity, PipelineStage& stage);
    void record(const Opportunity& opportunity, const Score& score, const ExecutionResult& result);

    std::string flight_key(const std::string& opportunity_id) const;
    bool already_executed(const std::string& opportunity_id, Timestamp now);
    void mark_executed(const Opportunity& opportunity);

    std::shared_ptr<EngineContext> context_;
    std::shared_ptr<ActionBuilder> action_builder_;
    std::shared_ptr<ExecutionVenue> venue_;
    std::shared_ptr<OutcomeSink> sink_;
    SingleFlightScope scope_;

    mutable std::mutex flight_mutex_;
    std::unordered_set<std::string> in_flight_;
    std::unordered_map<std::string, Timestamp> executed_;   // id -> expiry

    mutable std::mutex record_mutex_;
    PipelineStatistics stats_;
};

} // namespace sentinel
