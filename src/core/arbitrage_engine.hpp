#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "decision_gate.hpp"
#include "engine_context.hpp"
#include "execution_pipeline.hpp"
#include "execution_venue.hpp"
#include "opportunity_detector.hpp"
#include "opportunity_scorer.hpp"
#include "risk_assessor.hpp"
#include "size_optimizer.hpp"
#include "../utils/thread_pool.hpp"

namespace sentinel {

struct Evaluation {
    Opportunity opportunity;
    Score score;
    RiskProfile risk;
    Decision decision;
    double trade_size = 0.0;
};

struct TickReport {
    uint64_t tick = 0;
    size_t snapshot_count = 0;
    bool snapshot_error = false;
    size_t detected = 0;
    size_t approved = 0;
    std::vector<Evaluation> evaluations;
    std::vector<ExecutionResult> executions;
};

struct EngineStatus {
    bool running = false;
    bool autonomous_mode = false;
    uint64_t ticks = 0;
    size_t queued_tasks = 0;
    DynamicParameters parameters;
    SafetyState safety;
    std::vector<Opportunity> open_opportunities;
    DetectionStats detection;
    PipelineStatistics pipeline;
    HistoricalStats historical;
};

void to_json(nlohmann::json& j, const EngineStatus& s);

// Control loop: pulls snapshots once per tick, detects, evaluates every
// candidate in parallel and, in autonomous mode, executes the approved ones.
class ArbitrageEngine {
public:
    ArbitrageEngine(std::shared_ptr<EngineContext> context,
                    std::shared_ptr<SnapshotSource> snapshot_source,
                    std::shared_ptr<ActionBuilder> action_builder,
                    std::shared_ptr<ExecutionVenue> venue,
                    std::shared_ptr<OutcomeSink> sink);
    ~ArbitrageEngine();

    ArbitrageEngine(const ArbitrageEngine&) = delete;
    ArbitrageEngine& operator=(const ArbitrageEngine&) = delete;

    TickReport tick();

    // Score -> risk -> gate -> size for one opportunity against fixed snapshots
    Evaluation evaluate(const Opportunity& opportunity,
                        const DynamicParameters& params,
                        const HistorySnapshot& history) const;

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Operator actions
    void shutdown();
    void restart();

    EngineStatus status() const;
    nlohmann::json status_json() const;

    OpportunityDetector& detector() { return detector_; }
    ExecutionPipeline& pipeline() { return pipeline_; }
    const EngineContext& context() const { return *context_; }

private:
    void run();
    std::vector<Evaluation> evaluate_all(const std::vector<Opportunity>& opportunities,
                                         const DynamicParameters& params,
                                         const HistorySnapshot& history);
    std::vector<ExecutionResult> execute_approved(const std::vector<Evaluation>& evaluations);

    std::shared_ptr<EngineContext> context_;
    std::shared_ptr<SnapshotSource> snapshot_source_;

    OpportunityDetector detector_;
    OpportunityScorer scorer_;
    RiskAssessor risk_assessor_;
    DecisionGate decision_gate_;
    SizeOptimizer size_optimizer_;
    ExecutionPipeline pipeline_;
    ThreadPool workers_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::thread thread_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::mutex tick_mutex_;
};

} // namespace sentinel
