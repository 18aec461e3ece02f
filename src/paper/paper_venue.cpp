#include "paper_venue.hpp"
#include <algorithm>
#include <utility>
#include "../core/exceptions.hpp"

namespace sentinel {

PaperExecutionVenue::PaperExecutionVenue(const ArbitrageConfig& config,
                                         std::shared_ptr<ParameterStore> parameters)
    : config_(config), parameters_(std::move(parameters)) {}

double PaperExecutionVenue::max_slippage() const {
    return parameters_ ? parameters_->snapshot().max_slippage : config_.max_slippage;
}

SimulationResult PaperExecutionVenue::simulate(const ExecutionAction& action) {
    SimulationResult result;
    double buy_price = 0.0;
    double sell_price = 0.0;
    double min_liquidity = 0.0;
    try {
        buy_price = action.payload.at("buy_price").get<double>();
        sell_price = action.payload.at("sell_price").get<double>();
        min_liquidity = action.payload.at("min_liquidity").get<double>();
    } catch (const nlohmann::json::exception& e) {
        throw CollaboratorError(std::string("malformed paper action payload: ") + e.what());
    }

    if (action.trade_size <= 0.0 || buy_price <= 0.0) {
        result.error = "invalid trade size or price";
        return result;
    }

    result.estimated_slippage = min_liquidity > 0.0 ? action.trade_size / min_liquidity : 1.0;
    if (result.estimated_slippage > max_slippage()) {
        result.error = "estimated slippage exceeds maximum";
        return result;
    }

    const double gross = action.trade_size * (sell_price - buy_price) * (1.0 - result.estimated_slippage);
    result.estimated_profit = gross - action.trade_size * config_.flash_loan_fee;
    result.estimated_gas = config_.gas_estimate;
    result.success = true;
    return result;
}

SubmissionResult PaperExecutionVenue::submit(const ExecutionAction& action) {
    SimulationResult simulation = simulate(action);

    SubmissionResult result;
    if (!simulation.success) {
        result.error = simulation.error;
        return result;
    }

    result.success = true;
    result.reference_id = "paper-" + std::to_string(++submissions_);
    result.realized_profit = simulation.estimated_profit;
    result.gas_cost = simulation.estimated_gas;
    return result;
}

} // namespace sentinel
