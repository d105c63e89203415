#ifndef GASOPT_COST_MODEL_HPP
#define GASOPT_COST_MODEL_HPP

#include <map>
#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <vector>

#include "types.hpp"
#include "access.hpp"
#include "chain_registry.hpp"
#include "oracle.hpp"

namespace gasopt {

// =============================================================================
// Cost Breakdown (ephemeral, recomputed per quote)
// =============================================================================

struct CostBreakdown {
    ChainId chain_id;
    I128 gas_cost_usd_x18;
    I128 bridge_fee_usd_x18;
    I128 slippage_cost_usd_x18;
    I128 total_cost_usd_x18;
    uint32_t estimated_execution_time_seconds;

    bool operator==(const CostBreakdown& other) const {
        return chain_id == other.chain_id &&
               gas_cost_usd_x18 == other.gas_cost_usd_x18 &&
               bridge_fee_usd_x18 == other.bridge_fee_usd_x18 &&
               slippage_cost_usd_x18 == other.slippage_cost_usd_x18 &&
               total_cost_usd_x18 == other.total_cost_usd_x18 &&
               estimated_execution_time_seconds == other.estimated_execution_time_seconds;
    }
};

struct CostResult {
    int32_t status;
    CostBreakdown breakdown;

    bool ok() const { return status == errors::OK; }
};

struct OptimalChain {
    int32_t status;
    ChainId chain_id;          // Source chain when not worth optimizing
    I128 savings_usd_x18;      // 0 when not worth optimizing
    uint32_t savings_bps;
    CostBreakdown baseline;
    CostBreakdown best;        // Cheapest candidate found, even below thresholds

    bool ok() const { return status == errors::OK; }
    bool should_optimize(ChainId source_chain) const {
        return ok() && chain_id != source_chain;
    }
};

// =============================================================================
// Fee & Model Parameters
// =============================================================================

struct BridgeFeeSchedule {
    I128 base_fee_usd_x18 = 2 * X18_ONE;  // $2 flat
    uint32_t fee_bps = 5;                 // 0.05% of amount
};

struct CostParams {
    uint64_t swap_gas_units = 150000;     // Raw estimate for one swap
    uint32_t safety_margin_bps = 12000;   // 1.2x
    uint32_t max_slippage_bps = 300;      // 3% cap
};

// =============================================================================
// Slippage Estimation
// =============================================================================

class SlippageEstimator {
public:
    virtual ~SlippageEstimator() = default;

    // Expected slippage in bps for trading `amount_usd_x18` on `chain_id`
    virtual uint32_t estimate_bps(ChainId chain_id, const Token& token_in,
                                  const Token& token_out, I128 amount_usd_x18) const = 0;
};

// bps = amount / depth * 10000, where depth is the USD liquidity available
// for the pair on that chain
class LiquidityDepthSlippage : public SlippageEstimator {
public:
    explicit LiquidityDepthSlippage(I128 default_depth_usd_x18 = x18::from_int(10000000));

    void set_depth(ChainId chain_id, I128 depth_usd_x18);
    I128 depth(ChainId chain_id) const;

    uint32_t estimate_bps(ChainId chain_id, const Token& token_in,
                          const Token& token_out, I128 amount_usd_x18) const override;

private:
    I128 default_depth_x18_;
    std::unordered_map<ChainId, I128> depths_;
    mutable std::shared_mutex mutex_;
};

// =============================================================================
// CostModel - Total cost per chain and optimal chain selection
// =============================================================================

class CostModel {
public:
    CostModel(std::shared_ptr<const ChainRegistry> registry,
              std::shared_ptr<const GasPriceOracle> oracle,
              std::shared_ptr<const AccessControl> access,
              std::shared_ptr<const SlippageEstimator> slippage,
              CostParams params = {},
              BridgeFeeSchedule fees = {});
    ~CostModel() = default;

    // Non-copyable
    CostModel(const CostModel&) = delete;
    CostModel& operator=(const CostModel&) = delete;

    // =========================================================================
    // Cost Queries
    // =========================================================================

    // amount_in is the USD-equivalent notional of the swap
    CostResult total_cost(ChainId source_chain, ChainId chain_id, uint64_t gas_units,
                          const Token& token_in, const Token& token_out,
                          I128 amount_in_x18) const;

    OptimalChain find_optimal_chain(ChainId source_chain,
                                    const Token& token_in, const Token& token_out,
                                    I128 amount_in_x18,
                                    uint32_t min_savings_bps,
                                    I128 min_absolute_savings_usd_x18,
                                    uint32_t max_bridge_time_seconds,
                                    const std::vector<ChainId>& exclude_chains = {}) const;

    // =========================================================================
    // Administration
    // =========================================================================

    int32_t set_bridge_fee_schedule(const Address& caller, const BridgeFeeSchedule& fees);
    int32_t set_params(const Address& caller, const CostParams& params);

    BridgeFeeSchedule bridge_fee_schedule() const;
    CostParams params() const;

private:
    std::shared_ptr<const ChainRegistry> registry_;
    std::shared_ptr<const GasPriceOracle> oracle_;
    std::shared_ptr<const AccessControl> access_;
    std::shared_ptr<const SlippageEstimator> slippage_;

    CostParams params_;
    BridgeFeeSchedule fees_;
    mutable std::shared_mutex params_mutex_;

    // Everything one computation reads, taken before computing
    struct Snapshot {
        CostParams params;
        BridgeFeeSchedule fees;
        std::map<ChainId, ChainConfig> chains;
        std::map<ChainId, UsdGasPrice> prices;
    };
    Snapshot take_snapshot(const std::vector<ChainId>& chain_ids) const;

    CostResult compute(const Snapshot& snap, ChainId source_chain, ChainId chain_id,
                       uint64_t gas_units, const Token& token_in, const Token& token_out,
                       I128 amount_in_x18) const;

    // Lower total wins, then shorter time, then lower chain id
    static bool cheaper(const CostBreakdown& a, const CostBreakdown& b);
};

} // namespace gasopt

#endif // GASOPT_COST_MODEL_HPP
