#include "logging_outcome_sink.hpp"
#include "../utils/logger.hpp"

namespace sentinel {

void LoggingOutcomeSink::emit(const OutcomeRecord& record) {
    nlohmann::json line = record;
    SENTINEL_LOG_INFO("OUTCOME {}", line.dump());
}

} // namespace sentinel
