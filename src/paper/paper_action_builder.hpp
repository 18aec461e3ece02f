#pragma once

#include "../core/execution_venue.hpp"

namespace sentinel {

// Describes a flash-loan round trip as a JSON payload: buy on the cheaper pool, sell on the dearer one
class PaperActionBuilder : public ActionBuilder {
public:
    ExecutionAction build_action(const Opportunity& opportunity, double trade_size) override;
};

} // namespace sentinel
