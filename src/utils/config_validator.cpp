#include "config_validator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include "logger.hpp"

namespace sentinel {

ConfigValidator::ValidationIssues ConfigValidator::issues_;

namespace {

std::string to_string_value(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // namespace

ConfigValidator::ValidationResult ConfigValidator::validate(const EngineConfig& config) {
    clear_issues();

    // Run every section so the caller sees all problems at once
    validate_app_config(config.app);
    validate_logging_config(config.logging);
    validate_monitoring_config(config.monitoring);
    validate_arbitrage_config(config.arbitrage);
    validate_scoring_config(config.scoring);
    validate_risk_config(config.risk, config.tuner);
    validate_decision_config(config.decision);
    validate_sizing_config(config.sizing);
    validate_safety_config(config.safety);
    validate_execution_config(config.execution);
    validate_tuner_config(config.tuner);
    validate_history_config(config.history, config.tuner);

    if (!issues_.empty()) {
        for (const auto& issue : issues_) {
            Logger::error("Config issue [{}]: {} (value: {})", issue.field, issue.message, issue.value);
        }
        return Result<bool>::error("Configuration validation failed with " +
                                   std::to_string(issues_.size()) + " issue(s)");
    }
    return Result<bool>::success(true);
}

ConfigValidator::ValidationResult ConfigValidator::validate_app_config(const AppConfig& config) {
    size_t before = issues_.size();
    if (config.name.empty()) {
        add_issue("app.name", "must not be empty");
    }
    check_enum("app.log_level", config.log_level,
               {"TRACE", "DEBUG", "INFO", "WARN", "WARNING", "ERROR", "CRITICAL"});
    return section_result(before, "app");
}

ConfigValidator::ValidationResult ConfigValidator::validate_logging_config(const LoggingConfig& config) {
    size_t before = issues_.size();
    if (config.file_output && config.file_path.empty()) {
        add_issue("logging.file_path", "required when file_output is enabled");
    }
    check_positive("logging.max_file_size_mb", config.max_file_size_mb);
    check_non_negative("logging.max_backup_files", config.max_backup_files);
    return section_result(before, "logging");
}

ConfigValidator::ValidationResult ConfigValidator::validate_monitoring_config(const MonitoringConfig& config) {
    size_t before = issues_.size();
    check_positive("monitoring.poll_interval_ms", config.poll_interval_ms);
    check_positive("monitoring.worker_threads", config.worker_threads);
    return section_result(before, "monitoring");
}

ConfigValidator::ValidationResult ConfigValidator::validate_arbitrage_config(const ArbitrageConfig& config) {
    size_t before = issues_.size();
    check_positive("arbitrage.min_spread_threshold", config.min_spread_threshold);
    check_positive("arbitrage.min_profit_threshold", config.min_profit_threshold);
    check_positive("arbitrage.default_trade_amount", config.default_trade_amount);
    check_probability("arbitrage.max_slippage", config.max_slippage);
    check_non_negative("arbitrage.gas_estimate", config.gas_estimate);
    check_probability("arbitrage.flash_loan_fee", config.flash_loan_fee);
    check_positive("arbitrage.opportunity_ttl_ms", config.opportunity_ttl_ms);
    return section_result(before, "arbitrage");
}

ConfigValidator::ValidationResult ConfigValidator::validate_scoring_config(const ScoringConfig& config) {
    size_t before = issues_.size();
    const auto& w = config.weights;
    check_non_negative("scoring.weights.spread", w.spread);
    check_non_negative("scoring.weights.liquidity", w.liquidity);
    check_non_negative("scoring.weights.profit", w.profit);
    check_non_negative("scoring.weights.volatility", w.volatility);
    check_non_negative("scoring.weights.gas_efficiency", w.gas_efficiency);
    check_non_negative("scoring.weights.historical", w.historical);
    if (std::fabs(w.sum() - 1.0) > 1e-6) {
        add_issue("scoring.weights", "weights must sum to 1", to_string_value(w.sum()));
    }

    check_positive("scoring.spread_saturation_multiple", config.spread_saturation_multiple);
    check_positive("scoring.liquidity_depth_multiple", config.liquidity_depth_multiple);
    check_positive("scoring.profit_score_per_multiple", config.profit_score_per_multiple);
    check_non_negative("scoring.volatility_penalty_scale", config.volatility_penalty_scale);
    check_positive("scoring.gas_efficiency_scale", config.gas_efficiency_scale);
    check_range("scoring.neutral_historical_score", config.neutral_historical_score, 0.0, 100.0);
    check_probability("scoring.low_liquidity_confidence_factor", config.low_liquidity_confidence_factor);
    check_probability("scoring.stale_confidence_factor", config.stale_confidence_factor);
    check_non_negative("scoring.stale_age_ms", config.stale_age_ms);
    return section_result(before, "scoring");
}

ConfigValidator::ValidationResult ConfigValidator::validate_risk_config(const RiskConfig& config,
                                                                       const TunerConfig& tuner) {
    size_t before = issues_.size();
    check_probability("risk.initial_risk_tolerance", config.initial_risk_tolerance);
    if (config.initial_risk_tolerance < tuner.min_risk_tolerance ||
        config.initial_risk_tolerance > tuner.max_risk_tolerance) {
        add_issue("risk.initial_risk_tolerance",
                  "must lie within tuner.min_risk_tolerance and tuner.max_risk_tolerance",
                  to_string_value(config.initial_risk_tolerance));
    }
    check_non_negative("risk.liquidity_utilization_scale", config.liquidity_utilization_scale);
    check_non_negative("risk.slippage_impact_scale", config.slippage_impact_scale);
    check_non_negative("risk.gas_ratio_scale", config.gas_ratio_scale);
    check_range("risk.base_execution_risk", config.base_execution_risk, 0.0, 100.0);
    check_range("risk.max_age_risk", config.max_age_risk, 0.0, 100.0);
    check_range("risk.sub_risk_warning_threshold", config.sub_risk_warning_threshold, 0.0, 100.0);
    check_range("risk.overall_risk_warning_threshold", config.overall_risk_warning_threshold, 0.0, 100.0);
    return section_result(before, "risk");
}

ConfigValidator::ValidationResult ConfigValidator::validate_decision_config(const DecisionConfig& config) {
    size_t before = issues_.size();
    check_range("decision.min_score", config.min_score, 0.0, 100.0);
    check_probability("decision.min_confidence", config.min_confidence);
    return section_result(before, "decision");
}

ConfigValidator::ValidationResult ConfigValidator::validate_sizing_config(const SizingConfig& config) {
    size_t before = issues_.size();
    if (config.liquidity_cap_fraction <= 0.0 || config.liquidity_cap_fraction > 1.0) {
        add_issue("sizing.liquidity_cap_fraction", "must be in (0, 1]",
                  to_string_value(config.liquidity_cap_fraction));
    }
    return section_result(before, "sizing");
}

ConfigValidator::ValidationResult ConfigValidator::validate_safety_config(const SafetyConfig& config) {
    size_t before = issues_.size();
    check_positive("safety.max_consecutive_failures", config.max_consecutive_failures);
    check_positive("safety.max_daily_loss", config.max_daily_loss);
    check_positive("safety.max_position_size", config.max_position_size);
    check_positive("safety.loss_window_hours", config.loss_window_hours);
    return section_result(before, "safety");
}

ConfigValidator::ValidationResult ConfigValidator::validate_execution_config(const ExecutionConfig& config) {
    size_t before = issues_.size();
    check_enum("execution.single_flight_scope", config.single_flight_scope, {"global", "per_opportunity"});
    return section_result(before, "execution");
}

ConfigValidator::ValidationResult ConfigValidator::validate_tuner_config(const TunerConfig& config) {
    size_t before = issues_.size();
    check_positive("tuner.interval", config.interval);
    check_positive("tuner.window", config.window);
    check_probability("tuner.high_success_rate", config.high_success_rate);
    check_probability("tuner.low_success_rate", config.low_success_rate);
    if (config.low_success_rate > config.high_success_rate) {
        add_issue("tuner.low_success_rate", "must not exceed tuner.high_success_rate",
                  to_string_value(config.low_success_rate));
    }
    check_non_negative("tuner.risk_tolerance_step", config.risk_tolerance_step);
    check_probability("tuner.min_risk_tolerance", config.min_risk_tolerance);
    check_probability("tuner.max_risk_tolerance", config.max_risk_tolerance);
    if (config.min_risk_tolerance > config.max_risk_tolerance) {
        add_issue("tuner.min_risk_tolerance", "must not exceed tuner.max_risk_tolerance",
                  to_string_value(config.min_risk_tolerance));
    }
    check_positive("tuner.raise_profit_multiple", config.raise_profit_multiple);
    check_non_negative("tuner.lower_profit_multiple", config.lower_profit_multiple);
    if (config.lower_profit_multiple > config.raise_profit_multiple) {
        add_issue("tuner.lower_profit_multiple", "must not exceed tuner.raise_profit_multiple",
                  to_string_value(config.lower_profit_multiple));
    }
    if (config.raise_factor < 1.0) {
        add_issue("tuner.raise_factor", "must be >= 1", to_string_value(config.raise_factor));
    }
    if (config.lower_factor <= 0.0 || config.lower_factor > 1.0) {
        add_issue("tuner.lower_factor", "must be in (0, 1]", to_string_value(config.lower_factor));
    }
    return section_result(before, "tuner");
}

ConfigValidator::ValidationResult ConfigValidator::validate_history_config(const HistoryConfig& config,
                                                                          const TunerConfig& tuner) {
    size_t before = issues_.size();
    if (config.capacity == 0) {
        add_issue("history.capacity", "must be positive", "0");
    } else if (tuner.window > 0 && config.capacity < static_cast<size_t>(tuner.window)) {
        add_issue("history.capacity", "must be at least tuner.window",
                  std::to_string(config.capacity));
    }
    check_positive("history.stats_window_hours", config.stats_window_hours);
    return section_result(before, "history");
}

bool ConfigValidator::check_positive(const std::string& field, double value) {
    if (!(value > 0.0)) {
        add_issue(field, "must be positive", to_string_value(value));
        return false;
    }
    return true;
}

bool ConfigValidator::check_non_negative(const std::string& field, double value) {
    if (!(value >= 0.0)) {
        add_issue(field, "must not be negative", to_string_value(value));
        return false;
    }
    return true;
}

bool ConfigValidator::check_range(const std::string& field, double value,
                                  double min_value, double max_value) {
    if (!(value >= min_value && value <= max_value)) {
        add_issue(field, "must be between " + to_string_value(min_value) + " and " +
                         to_string_value(max_value), to_string_value(value));
        return false;
    }
    return true;
}

bool ConfigValidator::check_probability(const std::string& field, double value) {
    return check_range(field, value, 0.0, 1.0);
}

bool ConfigValidator::check_enum(const std::string& field, const std::string& value,
                                 const std::vector<std::string>& valid_values) {
    std::string upper = value;
    bool found = std::find(valid_values.begin(), valid_values.end(), value) != valid_values.end();
    if (!found) {
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        found = std::find(valid_values.begin(), valid_values.end(), upper) != valid_values.end();
    }
    if (!found) {
        add_issue(field, "unrecognised value", value);
    }
    return found;
}

ConfigValidator::ValidationResult ConfigValidator::section_result(size_t issues_before,
                                                                  const std::string& section) {
    return issues_.size() == issues_before
        ? Result<bool>::success(true)
        : Result<bool>::error(section + " configuration validation failed");
}

void ConfigValidator::add_issue(const std::string& field, const std::string& message,
                                const std::string& value) {
    issues_.push_back({field, message, value});
}

} // namespace sentinel
