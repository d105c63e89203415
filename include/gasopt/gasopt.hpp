#ifndef GASOPT_GASOPT_HPP
#define GASOPT_GASOPT_HPP

// =============================================================================
// gasopt - Cross-Chain Gas Optimization Core
//
//   AccessControl     administrators and the keeper
//   ChainRegistry     per-chain metadata
//   GasPriceOracle    keeper-fed gas prices, USD conversion, trends
//   CostModel         per-chain total cost and optimal chain search
//   SwapOrchestrator  cross-chain swap state machine
//
// =============================================================================

#include <memory>

#include "types.hpp"
#include "log.hpp"
#include "access.hpp"
#include "chain_registry.hpp"
#include "clients.hpp"
#include "oracle.hpp"
#include "cost_model.hpp"
#include "orchestrator.hpp"
#include "config.hpp"

namespace gasopt {

// =============================================================================
// GasOptimizer - Assembled core sharing one clock
// =============================================================================

class GasOptimizer {
public:
    // Throws ConfigError when the config is invalid or a chain cannot be registered
    GasOptimizer(const Config& config,
                 std::shared_ptr<PriceFeedClient> feed,
                 std::shared_ptr<BridgeClient> bridge,
                 TimeSource clock = system_time);
    ~GasOptimizer() = default;

    // Non-copyable
    GasOptimizer(const GasOptimizer&) = delete;
    GasOptimizer& operator=(const GasOptimizer&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    AccessControl& access() { return *access_; }
    const AccessControl& access() const { return *access_; }

    ChainRegistry& registry() { return *registry_; }
    const ChainRegistry& registry() const { return *registry_; }

    GasPriceOracle& oracle() { return *oracle_; }
    const GasPriceOracle& oracle() const { return *oracle_; }

    LiquidityDepthSlippage& slippage() { return *slippage_; }
    const LiquidityDepthSlippage& slippage() const { return *slippage_; }

    CostModel& cost_model() { return *cost_model_; }
    const CostModel& cost_model() const { return *cost_model_; }

    SwapOrchestrator& orchestrator() { return *orchestrator_; }
    const SwapOrchestrator& orchestrator() const { return *orchestrator_; }

    ChainId local_chain() const { return local_chain_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct GlobalStats {
        GasPriceOracle::Stats oracle_stats;
        SwapStats swap_stats;
        uint64_t registered_chains;
        bool paused;
    };
    GlobalStats get_stats() const;

private:
    ChainId local_chain_;

    std::shared_ptr<AccessControl> access_;
    std::shared_ptr<ChainRegistry> registry_;
    std::shared_ptr<GasPriceOracle> oracle_;
    std::shared_ptr<LiquidityDepthSlippage> slippage_;
    std::shared_ptr<CostModel> cost_model_;
    std::shared_ptr<SwapOrchestrator> orchestrator_;
};

} // namespace gasopt

#endif // GASOPT_GASOPT_HPP
