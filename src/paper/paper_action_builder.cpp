#include "paper_action_builder.hpp"

namespace sentinel {

ExecutionAction PaperActionBuilder::build_action(const Opportunity& opportunity, double trade_size) {
    const bool a_is_cheaper = opportunity.pool_a.price_a <= opportunity.comparable_price_b();
    const PoolSnapshot& buy_pool = a_is_cheaper ? opportunity.pool_a : opportunity.pool_b;
    const PoolSnapshot& sell_pool = a_is_cheaper ? opportunity.pool_b : opportunity.pool_a;

    ExecutionAction action;
    action.opportunity_id = opportunity.id;
    action.buy_pool_id = buy_pool.pool_id;
    action.sell_pool_id = sell_pool.pool_id;
    action.trade_size = trade_size;
    action.payload = {
        {"type", "flash_arbitrage"},
        {"buy_pool", buy_pool.pool_id},
        {"sell_pool", sell_pool.pool_id},
        {"asset", opportunity.pool_a.asset_a},
        {"amount", trade_size},
        {"buy_price", opportunity.buy_price},
        {"sell_price", opportunity.sell_price},
        {"min_liquidity", opportunity.min_liquidity()}
    };
    return action;
}

} // namespace sentinel
