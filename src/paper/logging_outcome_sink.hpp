#pragma once

#include "../core/execution_venue.hpp"

namespace sentinel {

// Writes every outcome as one JSON line through the application logger
class LoggingOutcomeSink : public OutcomeSink {
public:
    void emit(const OutcomeRecord& record) override;
};

} // namespace sentinel
