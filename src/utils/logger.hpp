#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "config_types.hpp"

namespace sentinel {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

LogLevel parse_log_level(const std::string& level, LogLevel fallback = LogLevel::INFO);
std::string log_level_to_string(LogLevel level);

class Logger {
public:
    static void initialize(const LoggingConfig& config, LogLevel level = LogLevel::INFO);
    static void shutdown();

    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->critical(fmt, std::forward<Args>(args)...);
    }

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static bool is_enabled(LogLevel level);

private:
    // Falls back to spdlog's default logger until initialize() has run
    static std::shared_ptr<spdlog::logger> get();

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    static std::shared_ptr<spdlog::logger> logger_;
    static LogLevel current_level_;
};

// Structured one-line events for the decision and execution pipeline
class TradingLogger {
public:
    static void log_opportunity_detected(const std::string& opportunity_id,
                                         const std::string& asset_pair,
                                         double spread_percentage,
                                         double estimated_profit);

    static void log_decision_rejected(const std::string& opportunity_id,
                                      const std::string& reason,
                                      int score, double confidence);

    static void log_safety_rejected(const std::string& opportunity_id,
                                    const std::string& reason);

    static void log_execution_outcome(const std::string& opportunity_id,
                                      const std::string& status,
                                      double predicted_profit,
                                      double realized_profit,
                                      long long elapsed_ms);

    static void log_parameter_adjustment(double success_rate, double avg_profit,
                                         double risk_tolerance, double min_profit_threshold);

    static void log_circuit_transition(const std::string& from_state,
                                       const std::string& to_state,
                                       const std::string& reason);
};

// RAII logging scope for performance measurement
class ScopedTimer {
public:
    explicit ScopedTimer(std::string operation_name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

#define SENTINEL_LOG_TRACE(...) ::sentinel::Logger::trace(__VA_ARGS__)
#define SENTINEL_LOG_DEBUG(...) ::sentinel::Logger::debug(__VA_ARGS__)
#define SENTINEL_LOG_INFO(...) ::sentinel::Logger::info(__VA_ARGS__)
#define SENTINEL_LOG_WARN(...) ::sentinel::Logger::warn(__VA_ARGS__)
#define SENTINEL_LOG_ERROR(...) ::sentinel::Logger::error(__VA_ARGS__)
#define SENTINEL_LOG_CRITICAL(...) ::sentinel::Logger::critical(__VA_ARGS__)

#define SENTINEL_SCOPED_TIMER(name) ::sentinel::ScopedTimer sentinel_scoped_timer_(name)

} // namespace sentinel
