#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "config_types.hpp"

namespace sentinel {

class ConfigManager {
public:
    bool load(const std::string& file_path);
    bool load_from_string(const std::string& json_text);

    // Applies SENTINEL_* environment variables on top of the loaded values
    void apply_env_overrides();

    EngineConfig& get_engine_config();
    const EngineConfig& get_engine_config() const;

    AppConfig& get_app_config();
    LoggingConfig& get_logging_config();
    MonitoringConfig& get_monitoring_config();
    ArbitrageConfig& get_arbitrage_config();
    SafetyConfig& get_safety_config();

private:
    bool parse(const nlohmann::json& document);

    nlohmann::json config_data_;
    EngineConfig engine_config_;
};

} // namespace sentinel
