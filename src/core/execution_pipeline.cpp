#include "execution_pipeline.hpp"
#include <chrono>
#include <fmt/format.h>
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace sentinel {

namespace {

const char* kGlobalFlightKey = "*";

std::string join_warnings(const std::vector<std::string>& warnings) {
    std::string joined;
    for (const auto& warning : warnings) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += warning;
    }
    return joined;
}

ExecutionResult make_result(ExecutionStatus status, std::string reason) {
    ExecutionResult result;
    result.status = status;
    result.reason = std::move(reason);
    return result;
}

} // namespace

SingleFlightScope parse_single_flight_scope(const std::string& value) {
    if (value == "global") {
        return SingleFlightScope::GLOBAL;
    }
    if (value == "per_opportunity") {
        return SingleFlightScope::PER_OPPORTUNITY;
    }
    throw ConfigurationError("unknown single-flight scope '" + value + "'");
}

std::string to_string(SingleFlightScope scope) {
    return scope == SingleFlightScope::GLOBAL ? "global" : "per_opportunity";
}

std::string to_string(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::IDLE: return "Idle";
        case PipelineStage::GATING: return "Gating";
        case PipelineStage::BUILDING: return "Building";
        case PipelineStage::SIMULATING: return "Simulating";
        case PipelineStage::VERIFYING: return "Verifying";
        case PipelineStage::SUBMITTING: return "Submitting";
        case PipelineStage::RECORDING: return "Recording";
    }
    return "Unknown";
}

void to_json(nlohmann::json& j, const PipelineStatistics& s) {
    j = nlohmann::json{
        {"attempts", s.attempts},
        {"succeeded", s.succeeded},
        {"safety_rejected", s.safety_rejected},
        {"simulation_failed", s.simulation_failed},
        {"unprofitable_simulation", s.unprofitable_simulation},
        {"execution_failed", s.execution_failed},
        {"concurrency_rejected", s.concurrency_rejected},
        {"total_realized_profit", s.total_realized_profit}
    };
}

ExecutionPipeline::FlightGuard::FlightGuard(ExecutionPipeline& pipeline, std::string key)
    : pipeline_(pipeline), key_(std::move(key)), acquired_(false) {
    std::lock_guard<std::mutex> lock(pipeline_.flight_mutex_);
    acquired_ = pipeline_.in_flight_.insert(key_).second;
}

ExecutionPipeline::FlightGuard::~FlightGuard() {
    if (acquired_) {
        std::lock_guard<std::mutex> lock(pipeline_.flight_mutex_);
        pipeline_.in_flight_.erase(key_);
    }
}

ExecutionPipeline::ExecutionPipeline(std::shared_ptr<EngineContext> context,
                                     std::shared_ptr<ActionBuilder> action_builder,
                                     std::shared_ptr<ExecutionVenue> venue,
                                     std::shared_ptr<OutcomeSink> sink)
    : context_(std::move(context)),
      action_builder_(std::move(action_builder)),
      venue_(std::move(venue)),
      sink_(std::move(sink)),
      scope_(SingleFlightScope::GLOBAL) {
    if (!context_ || !context_->clock || !context_->safety || !context_->history) {
        throw ConfigurationError("execution pipeline requires a complete engine context");
    }
    if (!action_builder_ || !venue_) {
        throw ConfigurationError("execution pipeline requires an action builder and a venue");
    }
    scope_ = parse_single_flight_scope(context_->config.execution.single_flight_scope);
}

ExecutionResult ExecutionPipeline::execute(const Opportunity& opportunity, const Score& score) {
    const auto started = std::chrono::steady_clock::now();

    ExecutionResult result = run_attempt(opportunity);

    result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    record(opportunity, score, result);
    return result;
}

ExecutionResult ExecutionPipeline::run_attempt(const Opportunity& opportunity) {
    FlightGuard guard(*this, flight_key(opportunity.id));
    if (!guard.acquired()) {
        return make_result(ExecutionStatus::CONCURRENCY_REJECTED, "execution already in progress");
    }

    PipelineStage stage = PipelineStage::GATING;
    try {
        return run_stages(opportunity, stage);
    } catch (const std::exception& e) {
        // Boundary for collaborator and internal faults; the control loop must keep running
        const std::string cause = fmt::format("internal: {}", e.what());
        SENTINEL_LOG_ERROR("Execution of {} aborted in stage {}: {}", opportunity.id, to_string(stage), e.what());
        context_->safety->record_failure(cause);
        return make_result(ExecutionStatus::EXECUTION_FAILED, cause);
    } catch (...) {
        const std::string cause = "internal: unknown";
        SENTINEL_LOG_ERROR("Execution of {} aborted in stage {} by a non-standard exception",
                           opportunity.id, to_string(stage));
        context_->safety->record_failure(cause);
        return make_result(ExecutionStatus::EXECUTION_FAILED, cause);
    }
}

ExecutionResult ExecutionPipeline::run_stages(const Opportunity& opportunity, PipelineStage& stage) {
    const double trade_size = opportunity.trade_amount;
    const Timestamp now = context_->clock->now();

    // Gating
    stage = PipelineStage::GATING;
    if (already_executed(opportunity.id, now)) {
        return make_result(ExecutionStatus::CONCURRENCY_REJECTED, "already executed");
    }
    if (opportunity.is_expired(now)) {
        TradingLogger::log_safety_rejected(opportunity.id, "opportunity expired");
        return make_result(ExecutionStatus::SAFETY_REJECTED, "opportunity expired");
    }
    if (!(trade_size > 0.0)) {
        TradingLogger::log_safety_rejected(opportunity.id, "non-positive trade size");
        return make_result(ExecutionStatus::SAFETY_REJECTED, "non-positive trade size");
    }
    SafetyCheck safety = context_->safety->check(trade_size);
    if (!safety.passed) {
        std::string reason = fmt::format("{}: {}", to_string(safety.reason), join_warnings(safety.warnings));
        TradingLogger::log_safety_rejected(opportunity.id, reason);
        return make_result(ExecutionStatus::SAFETY_REJECTED, reason);
    }

    // Building
    stage = PipelineStage::BUILDING;
    SENTINEL_LOG_DEBUG("Building action for {} (size {})", opportunity.id, trade_size);
    ExecutionAction action = action_builder_->build_action(opportunity, trade_size);

    // Simulating
    stage = PipelineStage::SIMULATING;
    SimulationResult simulation = venue_->simulate(action);
    if (!simulation.success) {
        std::string cause = fmt::format("Simulation failed: {}", simulation.error);
        context_->safety->record_failure(cause);
        return make_result(ExecutionStatus::SIMULATION_FAILED, cause);
    }

    // Verifying
    stage = PipelineStage::VERIFYING;
    if (simulation.estimated_profit <= 0.0) {
        ExecutionResult result = make_result(
            ExecutionStatus::UNPROFITABLE_SIMULATION,
            fmt::format("Simulation shows no profit: {:.4f}", simulation.estimated_profit));
        result.simulated_profit = simulation.estimated_profit;
        return result;
    }

    // Submitting
    stage = PipelineStage::SUBMITTING;
    mark_executed(opportunity);
    SENTINEL_LOG_INFO("Submitting {} (size {}, simulated profit {:.4f})",
                      opportunity.id, trade_size, simulation.estimated_profit);
    SubmissionResult submission = venue_->submit(action);

    ExecutionResult result;
    result.simulated_profit = simulation.estimated_profit;
    result.gas_cost = submission.gas_cost;
    result.reference_id = submission.reference_id;

    if (!submission.success) {
        result.status = ExecutionStatus::EXECUTION_FAILED;
        result.reason = fmt::format("Execution failed: {}", submission.error);
        result.realized_profit = -submission.gas_cost;
        context_->safety->record_execution_failure(submission.gas_cost, result.reason);
        return result;
    }

    result.status = ExecutionStatus::SUCCEEDED;
    result.realized_profit = submission.realized_profit - submission.gas_cost;
    context_->safety->record_success(result.realized_profit);
    return result;
}

void ExecutionPipeline::record(const Opportunity& opportunity, const Score& score, const ExecutionResult& result) {
    OutcomeRecord record;
    record.timestamp = context_->clock->now();
    record.opportunity_id = opportunity.id;
    record.pool_a_id = opportunity.pool_a.pool_id;
    record.pool_b_id = opportunity.pool_b.pool_id;
    record.asset_a = opportunity.pool_a.asset_a;
    record.asset_b = opportunity.pool_a.asset_b;
    record.score = score.overall;
    record.predicted_profit = opportunity.estimated_profit;
    record.simulated_profit = result.simulated_profit;
    record.realized_profit = result.realized_profit;
    record.gas_cost = result.gas_cost;
    record.trade_size = opportunity.trade_amount;
    record.success = result.success();
    record.status = result.status;
    record.error = result.success() ? std::string() : result.reason;
    record.reference_id = result.reference_id;
    record.features = score.features;
    record.elapsed_ms = result.elapsed_ms;

    size_t total_recorded = 0;
    {
        // History and sink observe the same completion order
        std::lock_guard<std::mutex> lock(record_mutex_);
        total_recorded = context_->history->append(record);
        if (sink_) {
            try {
                sink_->emit(record);
            } catch (const std::exception& e) {
                SENTINEL_LOG_ERROR("Outcome sink failed for {}: {}", record.opportunity_id, e.what());
            } catch (...) {
                SENTINEL_LOG_ERROR("Outcome sink failed for {} with a non-standard exception", record.opportunity_id);
            }
        }

        ++stats_.attempts;
        switch (result.status) {
            case ExecutionStatus::SUCCEEDED:
                ++stats_.succeeded;
                stats_.total_realized_profit += result.realized_profit;
                break;
            case ExecutionStatus::SAFETY_REJECTED: ++stats_.safety_rejected; break;
            case ExecutionStatus::SIMULATION_FAILED: ++stats_.simulation_failed; break;
            case ExecutionStatus::UNPROFITABLE_SIMULATION: ++stats_.unprofitable_simulation; break;
            case ExecutionStatus::EXECUTION_FAILED: ++stats_.execution_failed; break;
            case ExecutionStatus::CONCURRENCY_REJECTED: ++stats_.concurrency_rejected; break;
        }
    }

    TradingLogger::log_execution_outcome(record.opportunity_id, to_string(record.status),
                                         record.predicted_profit, record.realized_profit,
                                         static_cast<long long>(record.elapsed_ms));

    if (context_->tuner) {
        context_->tuner->on_outcome_recorded(total_recorded);
    }
}

std::string ExecutionPipeline::flight_key(const std::string& opportunity_id) const {
    return scope_ == SingleFlightScope::GLOBAL ? std::string(kGlobalFlightKey) : opportunity_id;
}

bool ExecutionPipeline::already_executed(const std::string& opportunity_id, Timestamp now) {
    std::lock_guard<std::mutex> lock(flight_mutex_);
    for (auto it = executed_.begin(); it != executed_.end();) {
        if (now > it->second) {
            it = executed_.erase(it);
        } else {
            ++it;
        }
    }
    return executed_.count(opportunity_id) > 0;
}

void ExecutionPipeline::mark_executed(const Opportunity& opportunity) {
    std::lock_guard<std::mutex> lock(flight_mutex_);
    executed_[opportunity.id] = opportunity.expires_at;
}

size_t ExecutionPipeline::in_flight() const {
    std::lock_guard<std::mutex> lock(flight_mutex_);
    return in_flight_.size();
}

PipelineStatistics ExecutionPipeline::get_statistics() const {
    std::lock_guard<std::mutex> lock(record_mutex_);
    return stats_;
}

} // namespace sentinel
