#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sentinel {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
LogLevel Logger::current_level_ = LogLevel::INFO;

LogLevel parse_log_level(const std::string& level, LogLevel fallback) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return fallback;
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "INFO";
}

void Logger::initialize(const LoggingConfig& config, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(console_sink);
        }

        if (config.file_output && !config.file_path.empty()) {
            std::filesystem::path log_path(config.file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                static_cast<size_t>(config.max_file_size_mb) * 1024 * 1024,
                static_cast<size_t>(config.max_backup_files));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (logger_) {
            spdlog::drop(logger_->name());
        }

        logger_ = std::make_shared<spdlog::logger>("sentinel", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(level));
        logger_->flush_on(spdlog::level::warn);
        current_level_ = level;

        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);

        logger_->info("Logger initialized (level={})", log_level_to_string(level));
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(logger_->name());
        logger_ = nullptr;
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (logger_) {
        return logger_;
    }
    return spdlog::default_logger();
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    get()->set_level(to_spdlog_level(level));
}

LogLevel Logger::get_level() {
    return current_level_;
}

bool Logger::is_enabled(LogLevel level) {
    return level >= current_level_;
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void TradingLogger::log_opportunity_detected(const std::string& opportunity_id,
                                             const std::string& asset_pair,
                                             double spread_percentage,
                                             double estimated_profit) {
    Logger::info("OPPORTUNITY_DETECTED id={} pair={} spread={:.4f}% est_profit={:.4f}",
                 opportunity_id, asset_pair, spread_percentage * 100.0, estimated_profit);
}

void TradingLogger::log_decision_rejected(const std::string& opportunity_id,
                                          const std::string& reason,
                                          int score, double confidence) {
    Logger::info("DECISION_REJECTED id={} reason=\"{}\" score={} confidence={:.2f}",
                 opportunity_id, reason, score, confidence);
}

void TradingLogger::log_safety_rejected(const std::string& opportunity_id,
                                        const std::string& reason) {
    Logger::warn("SAFETY_REJECTED id={} reason=\"{}\"", opportunity_id, reason);
}

void TradingLogger::log_execution_outcome(const std::string& opportunity_id,
                                          const std::string& status,
                                          double predicted_profit,
                                          double realized_profit,
                                          long long elapsed_ms) {
    Logger::info("EXECUTION_OUTCOME id={} status={} predicted={:.4f} realized={:.4f} elapsed={}ms",
                 opportunity_id, status, predicted_profit, realized_profit, elapsed_ms);
}

void TradingLogger::log_parameter_adjustment(double success_rate, double avg_profit,
                                             double risk_tolerance, double min_profit_threshold) {
    Logger::info("PARAMETERS_TUNED success_rate={:.1f}% avg_profit={:.4f} risk_tolerance={:.2f} min_profit={:.4f}",
                 success_rate * 100.0, avg_profit, risk_tolerance, min_profit_threshold);
}

void TradingLogger::log_circuit_transition(const std::string& from_state,
                                           const std::string& to_state,
                                           const std::string& reason) {
    Logger::warn("CIRCUIT_BREAKER {} -> {} reason=\"{}\"", from_state, to_state, reason);
}

ScopedTimer::ScopedTimer(std::string operation_name)
    : operation_name_(std::move(operation_name)),
      start_time_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time_);
    Logger::debug("{} took {}us", operation_name_, elapsed.count());
}

} // namespace sentinel
