#pragma once

#include <limits>
#include <string>
#include <vector>
#include "config_types.hpp"
#include "../core/result.hpp"

namespace sentinel {

struct ValidationIssue {
    std::string field;
    std::string message;
    std::string value;
};

class ConfigValidator {
public:
    using ValidationResult = Result<bool>;
    using ValidationIssues = std::vector<ValidationIssue>;

    // Validate complete configuration; every issue found is recorded
    static ValidationResult validate(const EngineConfig& config);

    // Validate specific sections
    static ValidationResult validate_app_config(const AppConfig& config);
    static ValidationResult validate_logging_config(const LoggingConfig& config);
    static ValidationResult validate_monitoring_config(const MonitoringConfig& config);
    static ValidationResult validate_arbitrage_config(const ArbitrageConfig& config);
    static ValidationResult validate_scoring_config(const ScoringConfig& config);
    static ValidationResult validate_risk_config(const RiskConfig& config, const TunerConfig& tuner);
    static ValidationResult validate_decision_config(const DecisionConfig& config);
    static ValidationResult validate_sizing_config(const SizingConfig& config);
    static ValidationResult validate_safety_config(const SafetyConfig& config);
    static ValidationResult validate_execution_config(const ExecutionConfig& config);
    static ValidationResult validate_tuner_config(const TunerConfig& config);
    static ValidationResult validate_history_config(const HistoryConfig& config, const TunerConfig& tuner);

    static const ValidationIssues& get_issues() { return issues_; }
    static void clear_issues() { issues_.clear(); }

private:
    static ValidationIssues issues_;

    static bool check_positive(const std::string& field, double value);
    static bool check_non_negative(const std::string& field, double value);
    static bool check_range(const std::string& field, double value,
                            double min_value = -std::numeric_limits<double>::infinity(),
                            double max_value = std::numeric_limits<double>::infinity());
    static bool check_probability(const std::string& field, double value);
    static bool check_enum(const std::string& field, const std::string& value,
                           const std::vector<std::string>& valid_values);

    static ValidationResult section_result(size_t issues_before, const std::string& section);

    static void add_issue(const std::string& field, const std::string& message,
                          const std::string& value = "");
};

} // namespace sentinel
