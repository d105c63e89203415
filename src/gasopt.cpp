// =============================================================================
// gasopt.cpp - GasOptimizer assembly
// =============================================================================

#include "gasopt/gasopt.hpp"

namespace gasopt {

GasOptimizer::GasOptimizer(const Config& config,
                           std::shared_ptr<PriceFeedClient> feed,
                           std::shared_ptr<BridgeClient> bridge,
                           TimeSource clock)
    : local_chain_(config.orchestrator.local_chain) {
    config.validate();

    if (!log::set_level(config.general.log_level)) {
        log::get()->warn("unknown log level '{}', keeping current level",
                         config.general.log_level);
    }

    access_ = std::make_shared<AccessControl>(config.access.owner, config.access.keeper);
    registry_ = std::make_shared<ChainRegistry>(access_);

    for (const auto& chain : config.chains) {
        int32_t rc = registry_->register_chain(config.access.owner, chain);
        if (rc != errors::OK) {
            throw ConfigError("cannot register chain " + std::to_string(chain.chain_id) +
                              ": " + errors::to_string(rc));
        }
    }

    oracle_ = std::make_shared<GasPriceOracle>(registry_, access_, std::move(feed),
                                               config.oracle, clock);

    slippage_ = std::make_shared<LiquidityDepthSlippage>(config.cost.default_liquidity_depth_usd_x18);
    for (const auto& [chain_id, depth] : config.cost.liquidity_depths) {
        slippage_->set_depth(chain_id, depth);
    }

    cost_model_ = std::make_shared<CostModel>(registry_, oracle_, access_, slippage_,
                                              config.cost.params, config.cost.fees);

    orchestrator_ = std::make_shared<SwapOrchestrator>(registry_, cost_model_, access_,
                                                       std::move(bridge), config.orchestrator,
                                                       config.thresholds, std::move(clock));

    log::get()->info("gasopt core ready: local chain {}, {} chains registered",
                     local_chain_, config.chains.size());
}

GasOptimizer::GlobalStats GasOptimizer::get_stats() const {
    return GlobalStats{
        oracle_->get_stats(),
        orchestrator_->stats(),
        registry_->chain_ids().size(),
        orchestrator_->is_paused()
    };
}

} // namespace gasopt
