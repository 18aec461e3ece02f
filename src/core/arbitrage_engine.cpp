#include "arbitrage_engine.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace sentinel {

namespace {

std::shared_ptr<EngineContext> require_context(std::shared_ptr<EngineContext> context) {
    if (!context || !context->clock || !context->parameters || !context->safety || !context->history) {
        throw ConfigurationError("arbitrage engine requires a complete engine context");
    }
    return context;
}

} // namespace

void to_json(nlohmann::json& j, const EngineStatus& s) {
    j = nlohmann::json{
        {"running", s.running},
        {"autonomous_mode", s.autonomous_mode},
        {"ticks", s.ticks},
        {"queued_tasks", s.queued_tasks},
        {"parameters", s.parameters},
        {"safety", s.safety},
        {"open_opportunities", s.open_opportunities},
        {"open_opportunity_count", s.open_opportunities.size()},
        {"detection", s.detection},
        {"pipeline", s.pipeline},
        {"historical_24h", s.historical}
    };
}

ArbitrageEngine::ArbitrageEngine(std::shared_ptr<EngineContext> context,
                                 std::shared_ptr<SnapshotSource> snapshot_source,
                                 std::shared_ptr<ActionBuilder> action_builder,
                                 std::shared_ptr<ExecutionVenue> venue,
                                 std::shared_ptr<OutcomeSink> sink)
    : context_(require_context(std::move(context))),
      snapshot_source_(std::move(snapshot_source)),
      detector_(context_->config.arbitrage, context_->clock),
      scorer_(context_->config.scoring, context_->clock),
      risk_assessor_(context_->config.risk),
      decision_gate_(context_->config.decision),
      size_optimizer_(context_->config.sizing),
      pipeline_(context_, std::move(action_builder), std::move(venue), std::move(sink)),
      workers_(static_cast<size_t>(std::max(1, context_->config.monitoring.worker_threads))) {
    if (!snapshot_source_) {
        throw ConfigurationError("arbitrage engine requires a snapshot source");
    }
}

ArbitrageEngine::~ArbitrageEngine() {
    stop();
    workers_.shutdown();
}

TickReport ArbitrageEngine::tick() {
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);
    SENTINEL_SCOPED_TIMER("ArbitrageEngine::tick");

    TickReport report;
    report.tick = ++ticks_;

    std::vector<PoolSnapshot> snapshots;
    try {
        snapshots = snapshot_source_->get_snapshots();
    } catch (const std::exception& e) {
        SENTINEL_LOG_ERROR("Snapshot source failed on tick {}: {}", report.tick, e.what());
        report.snapshot_error = true;
        return report;
    } catch (...) {
        SENTINEL_LOG_ERROR("Snapshot source failed on tick {} with a non-standard exception", report.tick);
        report.snapshot_error = true;
        return report;
    }
    report.snapshot_count = snapshots.size();

    // Fixed inputs for the whole tick
    const HistorySnapshot history = context_->history->snapshot();
    const DynamicParameters params = context_->parameters->snapshot();

    auto opportunities = detector_.detect(snapshots, params);
    report.detected = opportunities.size();
    if (opportunities.empty()) {
        return report;
    }

    report.evaluations = evaluate_all(opportunities, params, history);
    for (const auto& evaluation : report.evaluations) {
        if (evaluation.decision.approved) {
            ++report.approved;
        }
    }

    if (context_->config.app.autonomous_mode && report.approved > 0) {
        report.executions = execute_approved(report.evaluations);
    }

    SENTINEL_LOG_DEBUG("Tick {}: {} snapshots, {} detected, {} approved, {} executed",
                       report.tick, report.snapshot_count, report.detected,
                       report.approved, report.executions.size());
    return report;
}

Evaluation ArbitrageEngine::evaluate(const Opportunity& opportunity,
                                     const DynamicParameters& params,
                                     const HistorySnapshot& history) const {
    Evaluation evaluation;
    evaluation.opportunity = opportunity;
    evaluation.score = scorer_.score(opportunity, params, history);
    evaluation.trade_size = size_optimizer_.optimize(opportunity, params, history);
    evaluation.risk = risk_assessor_.assess(opportunity, evaluation.score, params, evaluation.trade_size);
    evaluation.decision = decision_gate_.evaluate(evaluation.score, evaluation.risk, params);

    if (evaluation.decision.approved) {
        evaluation.opportunity.approved = true;
        evaluation.opportunity.trade_amount = evaluation.trade_size;
    }
    return evaluation;
}

std::vector<Evaluation> ArbitrageEngine::evaluate_all(const std::vector<Opportunity>& opportunities,
                                                      const DynamicParameters& params,
                                                      const HistorySnapshot& history) {
    std::vector<std::future<Evaluation>> futures;
    futures.reserve(opportunities.size());
    for (const auto& opportunity : opportunities) {
        futures.push_back(workers_.submit([this, &opportunity, &params, &history]() {
            return evaluate(opportunity, params, history);
        }));
    }

    std::vector<Evaluation> evaluations;
    evaluations.reserve(futures.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            evaluations.push_back(futures[i].get());
        } catch (const std::exception& e) {
            SENTINEL_LOG_ERROR("Evaluation of {} failed: {}", opportunities[i].id, e.what());
            continue;
        }

        const auto& evaluation = evaluations.back();
        if (evaluation.decision.approved) {
            if (!detector_.mark_approved(evaluation.opportunity.id, evaluation.trade_size)) {
                SENTINEL_LOG_DEBUG("Approved {} is no longer in the active set", evaluation.opportunity.id);
            }
            SENTINEL_LOG_INFO("Approved {} score={} risk={:.1f} confidence={:.2f} size={}",
                              evaluation.opportunity.id, evaluation.score.overall,
                              evaluation.risk.overall, evaluation.score.confidence,
                              evaluation.trade_size);
        } else {
            TradingLogger::log_decision_rejected(evaluation.opportunity.id,
                                                 evaluation.decision.reason(),
                                                 evaluation.score.overall,
                                                 evaluation.score.confidence);
        }
    }
    return evaluations;
}

std::vector<ExecutionResult> ArbitrageEngine::execute_approved(const std::vector<Evaluation>& evaluations) {
    std::vector<ExecutionResult> results;

    if (pipeline_.scope() == SingleFlightScope::GLOBAL) {
        for (const auto& evaluation : evaluations) {
            if (evaluation.decision.approved) {
                results.push_back(pipeline_.execute(evaluation.opportunity, evaluation.score));
            }
        }
        return results;
    }

    std::vector<std::future<ExecutionResult>> futures;
    for (const auto& evaluation : evaluations) {
        if (evaluation.decision.approved) {
            futures.push_back(workers_.submit([this, &evaluation]() {
                return pipeline_.execute(evaluation.opportunity, evaluation.score);
            }));
        }
    }
    for (auto& future : futures) {
        try {
            results.push_back(future.get());
        } catch (const std::exception& e) {
            SENTINEL_LOG_ERROR("Concurrent execution task failed: {}", e.what());
        }
    }
    return results;
}

void ArbitrageEngine::start() {
    if (running_.exchange(true)) {
        return;
    }
    SENTINEL_LOG_INFO("Arbitrage engine starting (poll interval {}ms, autonomous={})",
                      context_->config.monitoring.poll_interval_ms,
                      context_->config.app.autonomous_mode);
    thread_ = std::thread(&ArbitrageEngine::run, this);
}

void ArbitrageEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        running_ = false;
    }
    loop_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        workers_.wait_for_all();
        SENTINEL_LOG_INFO("Arbitrage engine stopped after {} ticks", ticks_.load());
    }
}

void ArbitrageEngine::run() {
    const auto interval = std::chrono::milliseconds(context_->config.monitoring.poll_interval_ms);
    while (running_) {
        try {
            tick();
        } catch (const std::exception& e) {
            SENTINEL_LOG_ERROR("Tick failed: {}", e.what());
        } catch (...) {
            SENTINEL_LOG_ERROR("Tick {} failed with a non-standard exception", ticks_.load());
        }

        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_cv_.wait_for(lock, interval, [this] { return !running_; });
    }
}

void ArbitrageEngine::shutdown() {
    context_->safety->shutdown();
}

void ArbitrageEngine::restart() {
    context_->safety->restart();
}

EngineStatus ArbitrageEngine::status() const {
    EngineStatus s;
    s.running = running_;
    s.autonomous_mode = context_->config.app.autonomous_mode;
    s.ticks = ticks_;
    s.queued_tasks = workers_.pending_tasks();
    s.parameters = context_->parameters->snapshot();
    s.safety = context_->safety->snapshot();
    s.open_opportunities = detector_.active_opportunities();
    s.detection = detector_.get_stats();
    s.pipeline = pipeline_.get_statistics();
    s.historical = context_->history->get_historical_stats(context_->config.history.stats_window_hours);
    return s;
}

nlohmann::json ArbitrageEngine::status_json() const {
    nlohmann::json j = status();
    return j;
}

} // namespace sentinel
