#include "config_types.hpp"
#include <cstdlib>

namespace sentinel {

std::string get_env_var(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    return val == nullptr ? std::string("") : std::string(val);
}

void from_json(const nlohmann::json& j, AppConfig& c) {
    c.name = j.value("name", c.name);
    c.version = j.value("version", c.version);
    c.log_level = j.value("log_level", c.log_level);
    c.autonomous_mode = j.value("autonomous_mode", c.autonomous_mode);
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.file_path = j.value("file_path", c.file_path);
    c.max_file_size_mb = j.value("max_file_size_mb", c.max_file_size_mb);
    c.max_backup_files = j.value("max_backup_files", c.max_backup_files);
    c.console_output = j.value("console_output", c.console_output);
    c.file_output = j.value("file_output", c.file_output);
}

void from_json(const nlohmann::json& j, MonitoringConfig& c) {
    c.poll_interval_ms = j.value("poll_interval_ms", c.poll_interval_ms);
    c.worker_threads = j.value("worker_threads", c.worker_threads);
}

void from_json(const nlohmann::json& j, ArbitrageConfig& c) {
    c.min_spread_threshold = j.value("min_spread_threshold", c.min_spread_threshold);
    c.min_profit_threshold = j.value("min_profit_threshold", c.min_profit_threshold);
    c.default_trade_amount = j.value("default_trade_amount", c.default_trade_amount);
    c.max_slippage = j.value("max_slippage", c.max_slippage);
    c.gas_estimate = j.value("gas_estimate", c.gas_estimate);
    c.flash_loan_fee = j.value("flash_loan_fee", c.flash_loan_fee);
    c.opportunity_ttl_ms = j.value("opportunity_ttl_ms", c.opportunity_ttl_ms);
}

void from_json(const nlohmann::json& j, ScoringWeights& c) {
    c.spread = j.value("spread", c.spread);
    c.liquidity = j.value("liquidity", c.liquidity);
    c.profit = j.value("profit", c.profit);
    c.volatility = j.value("volatility", c.volatility);
    c.gas_efficiency = j.value("gas_efficiency", c.gas_efficiency);
    c.historical = j.value("historical", c.historical);
}

void to_json(nlohmann::json& j, const ScoringWeights& c) {
    j = nlohmann::json{
        {"spread", c.spread},
        {"liquidity", c.liquidity},
        {"profit", c.profit},
        {"volatility", c.volatility},
        {"gas_efficiency", c.gas_efficiency},
        {"historical", c.historical}
    };
}

void from_json(const nlohmann::json& j, ScoringConfig& c) {
    if (j.contains("weights")) {
        j.at("weights").get_to(c.weights);
    }
    c.spread_saturation_multiple = j.value("spread_saturation_multiple", c.spread_saturation_multiple);
    c.liquidity_depth_multiple = j.value("liquidity_depth_multiple", c.liquidity_depth_multiple);
    c.profit_score_per_multiple = j.value("profit_score_per_multiple", c.profit_score_per_multiple);
    c.volatility_penalty_scale = j.value("volatility_penalty_scale", c.volatility_penalty_scale);
    c.gas_efficiency_scale = j.value("gas_efficiency_scale", c.gas_efficiency_scale);
    c.neutral_historical_score = j.value("neutral_historical_score", c.neutral_historical_score);
    c.low_liquidity_confidence_factor = j.value("low_liquidity_confidence_factor", c.low_liquidity_confidence_factor);
    c.stale_confidence_factor = j.value("stale_confidence_factor", c.stale_confidence_factor);
    c.stale_age_ms = j.value("stale_age_ms", c.stale_age_ms);
}

void from_json(const nlohmann::json& j, RiskConfig& c) {
    c.initial_risk_tolerance = j.value("initial_risk_tolerance", c.initial_risk_tolerance);
    c.liquidity_utilization_scale = j.value("liquidity_utilization_scale", c.liquidity_utilization_scale);
    c.slippage_impact_scale = j.value("slippage_impact_scale", c.slippage_impact_scale);
    c.gas_ratio_scale = j.value("gas_ratio_scale", c.gas_ratio_scale);
    c.base_execution_risk = j.value("base_execution_risk", c.base_execution_risk);
    c.max_age_risk = j.value("max_age_risk", c.max_age_risk);
    c.sub_risk_warning_threshold = j.value("sub_risk_warning_threshold", c.sub_risk_warning_threshold);
    c.overall_risk_warning_threshold = j.value("overall_risk_warning_threshold", c.overall_risk_warning_threshold);
}

void from_json(const nlohmann::json& j, DecisionConfig& c) {
    c.min_score = j.value("min_score", c.min_score);
    c.min_confidence = j.value("min_confidence", c.min_confidence);
}

void from_json(const nlohmann::json& j, SizingConfig& c) {
    c.liquidity_cap_fraction = j.value("liquidity_cap_fraction", c.liquidity_cap_fraction);
}

void from_json(const nlohmann::json& j, SafetyConfig& c) {
    c.max_consecutive_failures = j.value("max_consecutive_failures", c.max_consecutive_failures);
    c.max_daily_loss = j.value("max_daily_loss", c.max_daily_loss);
    c.max_position_size = j.value("max_position_size", c.max_position_size);
    c.loss_window_hours = j.value("loss_window_hours", c.loss_window_hours);
}

void from_json(const nlohmann::json& j, ExecutionConfig& c) {
    c.single_flight_scope = j.value("single_flight_scope", c.single_flight_scope);
}

void from_json(const nlohmann::json& j, TunerConfig& c) {
    c.interval = j.value("interval", c.interval);
    c.window = j.value("window", c.window);
    c.high_success_rate = j.value("high_success_rate", c.high_success_rate);
    c.low_success_rate = j.value("low_success_rate", c.low_success_rate);
    c.risk_tolerance_step = j.value("risk_tolerance_step", c.risk_tolerance_step);
    c.min_risk_tolerance = j.value("min_risk_tolerance", c.min_risk_tolerance);
    c.max_risk_tolerance = j.value("max_risk_tolerance", c.max_risk_tolerance);
    c.raise_profit_multiple = j.value("raise_profit_multiple", c.raise_profit_multiple);
    c.lower_profit_multiple = j.value("lower_profit_multiple", c.lower_profit_multiple);
    c.raise_factor = j.value("raise_factor", c.raise_factor);
    c.lower_factor = j.value("lower_factor", c.lower_factor);
}

void from_json(const nlohmann::json& j, HistoryConfig& c) {
    c.capacity = j.value("capacity", c.capacity);
    c.stats_window_hours = j.value("stats_window_hours", c.stats_window_hours);
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    if (j.contains("app")) j.at("app").get_to(c.app);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("monitoring")) j.at("monitoring").get_to(c.monitoring);
    if (j.contains("arbitrage")) j.at("arbitrage").get_to(c.arbitrage);
    if (j.contains("scoring")) j.at("scoring").get_to(c.scoring);
    if (j.contains("risk")) j.at("risk").get_to(c.risk);
    if (j.contains("decision")) j.at("decision").get_to(c.decision);
    if (j.contains("sizing")) j.at("sizing").get_to(c.sizing);
    if (j.contains("safety")) j.at("safety").get_to(c.safety);
    if (j.contains("execution")) j.at("execution").get_to(c.execution);
    if (j.contains("tuner")) j.at("tuner").get_to(c.tuner);
    if (j.contains("history")) j.at("history").get_to(c.history);
}

} // namespace sentinel
