#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "core/arbitrage_engine.hpp"
#include "core/engine_context.hpp"
#include "paper/json_snapshot_source.hpp"
#include "paper/logging_outcome_sink.hpp"
#include "paper/paper_action_builder.hpp"
#include "paper/paper_venue.hpp"
#include "utils/config_manager.hpp"
#include "utils/config_validator.hpp"
#include "utils/logger.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const std::string config_path = argc > 1 ? argv[1] : "config/settings.json";
    const std::string snapshots_path = argc > 2 ? argv[2] : "config/pools.json";

    // Load configuration
    sentinel::ConfigManager config_manager;
    if (!config_manager.load(config_path)) {
        std::cerr << "Failed to load configuration from " << config_path << ". Exiting." << std::endl;
        return 1;
    }
    config_manager.apply_env_overrides();

    const sentinel::EngineConfig& config = config_manager.get_engine_config();
    auto validation = sentinel::ConfigValidator::validate(config);
    if (validation.is_error()) {
        std::cerr << "Invalid configuration: " << validation.error() << std::endl;
        for (const auto& issue : sentinel::ConfigValidator::get_issues()) {
            std::cerr << "  " << issue.field << ": " << issue.message << std::endl;
        }
        return 1;
    }

    try {
        sentinel::Logger::initialize(config.logging,
                                     sentinel::parse_log_level(config.app.log_level));
    } catch (const std::exception& e) {
        std::cerr << "FATAL: logger initialization failed: " << e.what() << std::endl;
        return 1;
    }
    SENTINEL_LOG_INFO("Starting {} {}...", config.app.name, config.app.version);

    int exit_code = 0;
    try {
        auto context = sentinel::make_engine_context(config);
        auto snapshot_source = std::make_shared<sentinel::JsonSnapshotSource>(snapshots_path, context->clock);
        auto action_builder = std::make_shared<sentinel::PaperActionBuilder>();
        auto venue = std::make_shared<sentinel::PaperExecutionVenue>(config.arbitrage, context->parameters);
        auto sink = std::make_shared<sentinel::LoggingOutcomeSink>();

        sentinel::ArbitrageEngine engine(context, snapshot_source, action_builder, venue, sink);
        engine.start();
        SENTINEL_LOG_INFO("{} is running (snapshots from {}).", config.app.name, snapshots_path);

        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        SENTINEL_LOG_INFO("Shutdown signal received. Stopping engine...");
        engine.stop();
        SENTINEL_LOG_INFO("Final status: {}", engine.status_json().dump());
    } catch (const std::exception& e) {
        SENTINEL_LOG_CRITICAL("Fatal error in main: {}", e.what());
        exit_code = 1;
    }

    SENTINEL_LOG_INFO("{} has shut down gracefully.", config.app.name);
    sentinel::Logger::shutdown();
    return exit_code;
}
