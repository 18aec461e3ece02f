#include "config_manager.hpp"
#include <fstream>
#include <stdexcept>
#include "logger.hpp"

namespace sentinel {

namespace {

template<typename T, typename Parse>
void override_from_env(const char* key, T& target, Parse parse) {
    std::string raw = get_env_var(key);
    if (raw.empty()) {
        return;
    }
    try {
        target = parse(raw);
        Logger::info("Config override {}={}", key, raw);
    } catch (const std::invalid_argument&) {
        Logger::warn("Ignoring malformed environment override {}={}", key, raw);
    } catch (const std::out_of_range&) {
        Logger::warn("Ignoring out-of-range environment override {}={}", key, raw);
    }
}

double parse_double(const std::string& raw) {
    return std::stod(raw);
}

int parse_int(const std::string& raw) {
    return std::stoi(raw);
}

} // namespace

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        Logger::error("Failed to open config file: {}", file_path);
        return false;
    }
    try {
        file >> config_data_;
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Error parsing config file {}: {}", file_path, e.what());
        return false;
    }
    return parse(config_data_);
}

bool ConfigManager::load_from_string(const std::string& json_text) {
    try {
        config_data_ = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Error parsing config document: {}", e.what());
        return false;
    }
    return parse(config_data_);
}

bool ConfigManager::parse(const nlohmann::json& document) {
    if (!document.is_object()) {
        Logger::error("Config document must be a JSON object");
        return false;
    }
    try {
        EngineConfig parsed;
        document.get_to(parsed);
        engine_config_ = parsed;
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Error reading config values: {}", e.what());
        return false;
    }
    return true;
}

void ConfigManager::apply_env_overrides() {
    auto& cfg = engine_config_;

    std::string log_level = get_env_var("SENTINEL_LOG_LEVEL");
    if (!log_level.empty()) {
        cfg.app.log_level = log_level;
    }

    override_from_env("SENTINEL_MIN_PROFIT_THRESHOLD", cfg.arbitrage.min_profit_threshold, parse_double);
    override_from_env("SENTINEL_MIN_SPREAD_THRESHOLD", cfg.arbitrage.min_spread_threshold, parse_double);
    override_from_env("SENTINEL_DEFAULT_TRADE_AMOUNT", cfg.arbitrage.default_trade_amount, parse_double);
    override_from_env("SENTINEL_MAX_SLIPPAGE", cfg.arbitrage.max_slippage, parse_double);
    override_from_env("SENTINEL_MAX_DAILY_LOSS", cfg.safety.max_daily_loss, parse_double);
    override_from_env("SENTINEL_MAX_POSITION_SIZE", cfg.safety.max_position_size, parse_double);
    override_from_env("SENTINEL_POLL_INTERVAL_MS", cfg.monitoring.poll_interval_ms, parse_int);

    std::string autonomous = get_env_var("SENTINEL_AUTONOMOUS_MODE");
    if (!autonomous.empty()) {
        cfg.app.autonomous_mode = (autonomous == "true" || autonomous == "1");
    }
}

EngineConfig& ConfigManager::get_engine_config() {
    return engine_config_;
}

const EngineConfig& ConfigManager::get_engine_config() const {
    return engine_config_;
}

AppConfig& ConfigManager::get_app_config() {
    return engine_config_.app;
}

LoggingConfig& ConfigManager::get_logging_config() {
    return engine_config_.logging;
}

MonitoringConfig& ConfigManager::get_monitoring_config() {
    return engine_config_.monitoring;
}

ArbitrageConfig& ConfigManager::get_arbitrage_config() {
    return engine_config_.arbitrage;
}

SafetyConfig& ConfigManager::get_safety_config() {
    return engine_config_.safety;
}

} // namespace sentinel
