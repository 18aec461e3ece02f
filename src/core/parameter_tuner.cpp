#include "parameter_tuner.hpp"
#include <algorithm>
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace sentinel {

void to_json(nlohmann::json& j, const TuningReport& r) {
    j = nlohmann::json{
        {"before", r.before},
        {"after", r.after},
        {"success_rate", r.success_rate},
        {"avg_profit", r.avg_profit},
        {"sample_size", r.sample_size}
    };
}

ParameterTuner::ParameterTuner(const TunerConfig& config,
                               std::shared_ptr<ParameterStore> parameters,
                               std::shared_ptr<OutcomeHistory> history)
    : config_(config),
      parameters_(std::move(parameters)),
      history_(std::move(history)) {
    if (!parameters_ || !history_) {
        throw ConfigurationError("parameter tuner requires a parameter store and outcome history");
    }
    if (config_.interval <= 0 || config_.window <= 0) {
        throw ConfigurationError("tuner interval and window must be positive");
    }
}

std::optional<TuningReport> ParameterTuner::on_outcome_recorded(size_t total_recorded) {
    if (total_recorded == 0 || total_recorded % static_cast<size_t>(config_.interval) != 0) {
        return std::nullopt;
    }
    return tune();
}

TuningReport ParameterTuner::tune() {
    const auto recent = history_->recent(static_cast<size_t>(config_.window));

    TuningReport report;
    report.sample_size = recent.size();

    size_t successes = 0;
    double profit_sum = 0.0;
    size_t profitable = 0;
    for (const auto& record : recent) {
        if (record.success) {
            ++successes;
            if (record.realized_profit > 0.0) {
                profit_sum += record.realized_profit;
                ++profitable;
            }
        }
    }
    report.success_rate = recent.empty() ? 0.0 : static_cast<double>(successes) / static_cast<double>(recent.size());
    report.avg_profit = profitable == 0 ? 0.0 : profit_sum / static_cast<double>(profitable);

    if (recent.empty()) {
        report.before = parameters_->snapshot();
        report.after = report.before;
        return report;
    }

    // Before/after are captured inside the same critical section as the swap
    parameters_->update([&report, this](DynamicParameters& params) {
        report.before = params;
        params = adjust(params, report.success_rate, report.avg_profit, config_);
        report.after = params;
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_report_ = report;
        ++tuning_runs_;
    }

    TradingLogger::log_parameter_adjustment(report.success_rate, report.avg_profit,
                                            report.after.risk_tolerance,
                                            report.after.min_profit_threshold);
    return report;
}

DynamicParameters ParameterTuner::adjust(const DynamicParameters& current,
                                         double success_rate,
                                         double avg_profit,
                                         const TunerConfig& config) {
    DynamicParameters next = current;

    if (success_rate > config.high_success_rate) {
        next.risk_tolerance = std::min(config.max_risk_tolerance,
                                       current.risk_tolerance + config.risk_tolerance_step);
    } else if (success_rate < config.low_success_rate) {
        next.risk_tolerance = std::max(config.min_risk_tolerance,
                                       current.risk_tolerance - config.risk_tolerance_step);
    }

    if (avg_profit > current.min_profit_threshold * config.raise_profit_multiple) {
        next.min_profit_threshold = current.min_profit_threshold * config.raise_factor;
    } else if (avg_profit < current.min_profit_threshold * config.lower_profit_multiple) {
        next.min_profit_threshold = current.min_profit_threshold * config.lower_factor;
    }

    return next;
}

std::optional<TuningReport> ParameterTuner::last_report() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_report_;
}

size_t ParameterTuner::tuning_runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tuning_runs_;
}

} // namespace sentinel
