#pragma once

#include <memory>
#include "clock.hpp"
#include "outcome_history.hpp"
#include "parameter_store.hpp"
#include "parameter_tuner.hpp"
#include "safety_gate.hpp"
#include "../utils/config_types.hpp"

namespace sentinel {

// Process-wide shared state, passed explicitly to every component that needs it
struct EngineContext {
    EngineConfig config;
    std::shared_ptr<Clock> clock;
    std::shared_ptr<ParameterStore> parameters;
    std::shared_ptr<SafetyGate> safety;
    std::shared_ptr<OutcomeHistory> history;
    std::shared_ptr<ParameterTuner> tuner;
};

std::shared_ptr<EngineContext> make_engine_context(const EngineConfig& config,
                                                   std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

} // namespace sentinel
