#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include "../core/execution_venue.hpp"
#include "../core/parameter_store.hpp"
#include "../utils/config_types.hpp"

namespace sentinel {

// Deterministic dry-run venue. Submission mirrors the simulation and never touches a chain.
// With a parameter store the slippage limit follows the live DynamicParameters.
class PaperExecutionVenue : public ExecutionVenue {
public:
    explicit PaperExecutionVenue(const ArbitrageConfig& config,
                                 std::shared_ptr<ParameterStore> parameters = nullptr);

    SimulationResult simulate(const ExecutionAction& action) override;
    SubmissionResult submit(const ExecutionAction& action) override;

    uint64_t submissions() const { return submissions_; }

private:
    double max_slippage() const;

    ArbitrageConfig config_;
    std::shared_ptr<ParameterStore> parameters_;
    std::atomic<uint64_t> submissions_{0};
};

} // namespace sentinel
