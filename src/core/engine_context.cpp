#include "engine_context.hpp"
#include "exceptions.hpp"

namespace sentinel {

std::shared_ptr<EngineContext> make_engine_context(const EngineConfig& config, std::shared_ptr<Clock> clock) {
    if (!clock) {
        throw ConfigurationError("engine context requires a clock");
    }

    auto context = std::make_shared<EngineContext>();
    context->config = config;
    context->clock = clock;
    context->parameters = std::make_shared<ParameterStore>(ParameterStore::defaults_from(config));
    context->safety = std::make_shared<SafetyGate>(config.safety, clock);
    context->history = std::make_shared<OutcomeHistory>(config.history.capacity, clock);
    context->tuner = std::make_shared<ParameterTuner>(config.tuner, context->parameters, context->history);
    return context;
}

} // namespace sentinel
