#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "outcome_history.hpp"
#include "parameter_store.hpp"
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace sentinel {

struct TuningReport {
    DynamicParameters before;
    DynamicParameters after;
    double success_rate = 0.0;
    double avg_profit = 0.0;
    size_t sample_size = 0;
};

void to_json(nlohmann::json& j, const TuningReport& r);

// Feedback loop: every Nth recorded outcome, nudges risk tolerance and the
// minimum profit threshold from the recent success rate and realised profit.
class ParameterTuner {
public:
    ParameterTuner(const TunerConfig& config,
                   std::shared_ptr<ParameterStore> parameters,
                   std::shared_ptr<OutcomeHistory> history);

    // Tunes when total_recorded is a multiple of the configured interval
    std::optional<TuningReport> on_outcome_recorded(size_t total_recorded);

    // Unconditional pass over the most recent window
    TuningReport tune();

    // Pure adjustment rule, exposed for tests
    static DynamicParameters adjust(const DynamicParameters& current,
                                    double success_rate,
                                    double avg_profit,
                                    const TunerConfig& config);

    std::optional<TuningReport> last_report() const;
    size_t tuning_runs() const;

private:
    TunerConfig config_;
    std::shared_ptr<ParameterStore> parameters_;
    std::shared_ptr<OutcomeHistory> history_;

    mutable std::mutex mutex_;
    std::optional<TuningReport> last_report_;
    size_t tuning_runs_ = 0;
};

} // namespace sentinel
