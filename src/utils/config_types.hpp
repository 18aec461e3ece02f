#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace sentinel {

std::string get_env_var(const std::string& key);

struct AppConfig {
    std::string name = "sentinel";
    std::string version = "1.0.0";
    std::string log_level = "INFO";
    bool autonomous_mode = false;
};

struct LoggingConfig {
    std::string file_path = "logs/sentinel.log";
    int max_file_size_mb = 10;
    int max_backup_files = 5;
    bool console_output = true;
    bool file_output = true;
};

struct MonitoringConfig {
    int poll_interval_ms = 5000;
    int worker_threads = 4;
};

struct ArbitrageConfig {
    double min_spread_threshold = 0.005;
    double min_profit_threshold = 0.1;
    double default_trade_amount = 1000.0;
    double max_slippage = 0.01;
    double gas_estimate = 0.001;
    double flash_loan_fee = 0.0009;       // proportional to trade amount
    int opportunity_ttl_ms = 30000;
};

struct ScoringWeights {
    double spread = 0.20;
    double liquidity = 0.20;
    double profit = 0.25;
    double volatility = 0.10;
    double gas_efficiency = 0.15;
    double historical = 0.10;

    double sum() const {
        return spread + liquidity + profit + volatility + gas_efficiency + historical;
    }
};

struct ScoringConfig {
    ScoringWeights weights;
    double spread_saturation_multiple = 3.0;     // x min spread threshold reaches 100
    double liquidity_depth_multiple = 20.0;      // x target trade size reaches 100
    double profit_score_per_multiple = 25.0;     // per multiple of min profit threshold
    double volatility_penalty_scale = 1000.0;
    double gas_efficiency_scale = 10.0;
    double neutral_historical_score = 50.0;
    double low_liquidity_confidence_factor = 0.8;
    double stale_confidence_factor = 0.9;
    int stale_age_ms = 10000;
};

struct RiskConfig {
    double initial_risk_tolerance = 0.5;
    double liquidity_utilization_scale = 200.0;
    double slippage_impact_scale = 100.0;
    double gas_ratio_scale = 100.0;
    double base_execution_risk = 20.0;
    double max_age_risk = 30.0;                  // one point per second of age
    double sub_risk_warning_threshold = 50.0;
    double overall_risk_warning_threshold = 70.0;
};

struct DecisionConfig {
    int min_score = 60;
    double min_confidence = 0.7;
};

struct SizingConfig {
    double liquidity_cap_fraction = 0.05;
};

struct SafetyConfig {
    int max_consecutive_failures = 5;
    double max_daily_loss = 10.0;
    double max_position_size = 1000.0;
    int loss_window_hours = 24;
};

struct ExecutionConfig {
    std::string single_flight_scope = "global";   // "global" | "per_opportunity"
};

struct TunerConfig {
    int interval = 10;                  // tune after every Nth recorded outcome
    int window = 50;                    // most recent outcomes considered
    double high_success_rate = 0.8;
    double low_success_rate = 0.5;
    double risk_tolerance_step = 0.05;
    double min_risk_tolerance = 0.3;
    double max_risk_tolerance = 0.7;
    double raise_profit_multiple = 2.0;
    double lower_profit_multiple = 0.5;
    double raise_factor = 1.1;
    double lower_factor = 0.9;
};

struct HistoryConfig {
    std::size_t capacity = 100;
    int stats_window_hours = 24;
};

struct EngineConfig {
    AppConfig app;
    LoggingConfig logging;
    MonitoringConfig monitoring;
    ArbitrageConfig arbitrage;
    ScoringConfig scoring;
    RiskConfig risk;
    DecisionConfig decision;
    SizingConfig sizing;
    SafetyConfig safety;
    ExecutionConfig execution;
    TunerConfig tuner;
    HistoryConfig history;
};

// Every field is optional; missing keys keep the defaults above
void from_json(const nlohmann::json& j, AppConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void from_json(const nlohmann::json& j, MonitoringConfig& c);
void from_json(const nlohmann::json& j, ArbitrageConfig& c);
void from_json(const nlohmann::json& j, ScoringWeights& c);
void from_json(const nlohmann::json& j, ScoringConfig& c);
void from_json(const nlohmann::json& j, RiskConfig& c);
void from_json(const nlohmann::json& j, DecisionConfig& c);
void from_json(const nlohmann::json& j, SizingConfig& c);
void from_json(const nlohmann::json& j, SafetyConfig& c);
void from_json(const nlohmann::json& j, ExecutionConfig& c);
void from_json(const nlohmann::json& j, TunerConfig& c);
void from_json(const nlohmann::json& j, HistoryConfig& c);
void from_json(const nlohmann::json& j, EngineConfig& c);

void to_json(nlohmann::json& j, const ScoringWeights& c);

} // namespace sentinel
