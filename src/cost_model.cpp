// =============================================================================
// cost_model.cpp - Per-chain cost breakdown and optimal chain search
// =============================================================================

#include "gasopt/cost_model.hpp"
#include "gasopt/log.hpp"
#include <algorithm>
#include <optional>

namespace gasopt {

// =============================================================================
// LiquidityDepthSlippage
// =============================================================================

LiquidityDepthSlippage::LiquidityDepthSlippage(I128 default_depth_usd_x18)
    : default_depth_x18_(default_depth_usd_x18) {}

void LiquidityDepthSlippage::set_depth(ChainId chain_id, I128 depth_usd_x18) {
    std::unique_lock lock(mutex_);
    depths_[chain_id] = depth_usd_x18;
}

I128 LiquidityDepthSlippage::depth(ChainId chain_id) const {
    std::shared_lock lock(mutex_);
    auto it = depths_.find(chain_id);
    return it != depths_.end() ? it->second : default_depth_x18_;
}

uint32_t LiquidityDepthSlippage::estimate_bps(ChainId chain_id, const Token&,
                                              const Token&, I128 amount_usd_x18) const {
    if (amount_usd_x18 <= 0) return 0;

    I128 d = depth(chain_id);
    if (d <= 0) return BPS_DENOMINATOR;

    I128 bps = amount_usd_x18 * BPS_DENOMINATOR / d;
    return bps >= BPS_DENOMINATOR ? BPS_DENOMINATOR : static_cast<uint32_t>(bps);
}

// =============================================================================
// Constructor
// =============================================================================

CostModel::CostModel(std::shared_ptr<const ChainRegistry> registry,
                     std::shared_ptr<const GasPriceOracle> oracle,
                     std::shared_ptr<const AccessControl> access,
                     std::shared_ptr<const SlippageEstimator> slippage,
                     CostParams params,
                     BridgeFeeSchedule fees)
    : registry_(std::move(registry)),
      oracle_(std::move(oracle)),
      access_(std::move(access)),
      slippage_(std::move(slippage)),
      params_(params),
      fees_(fees) {}

// =============================================================================
// Cost Queries
// =============================================================================

CostResult CostModel::total_cost(ChainId source_chain, ChainId chain_id, uint64_t gas_units,
                                 const Token& token_in, const Token& token_out,
                                 I128 amount_in_x18) const {
    Snapshot snap = take_snapshot({chain_id});
    return compute(snap, source_chain, chain_id, gas_units, token_in, token_out, amount_in_x18);
}

OptimalChain CostModel::find_optimal_chain(ChainId source_chain,
                                           const Token& token_in, const Token& token_out,
                                           I128 amount_in_x18,
                                           uint32_t min_savings_bps,
                                           I128 min_absolute_savings_usd_x18,
                                           uint32_t max_bridge_time_seconds,
                                           const std::vector<ChainId>& exclude_chains) const {
    OptimalChain result{errors::OK, source_chain, 0, 0, {}, {}};

    // Candidate set: enabled, not excluded, not the source, fast enough
    std::vector<ChainId> ids{source_chain};
    for (const auto& chain : registry_->enabled_chains()) {
        if (chain.chain_id == source_chain) continue;
        if (std::find(exclude_chains.begin(), exclude_chains.end(), chain.chain_id) !=
            exclude_chains.end()) {
            continue;
        }
        if (chain.arrival_time_seconds() > max_bridge_time_seconds) continue;
        ids.push_back(chain.chain_id);
    }

    Snapshot snap = take_snapshot(ids);
    uint64_t gas_units = snap.params.swap_gas_units;

    CostResult baseline = compute(snap, source_chain, source_chain, gas_units,
                                  token_in, token_out, amount_in_x18);
    if (!baseline.ok()) {
        log::get()->debug("no baseline for chain {}: {}",
                          source_chain, errors::to_string(baseline.status));
        result.status = baseline.status;
        return result;
    }
    result.baseline = baseline.breakdown;
    result.best = baseline.breakdown;

    std::optional<CostBreakdown> best;
    for (size_t i = 1; i < ids.size(); ++i) {
        ChainId id = ids[i];

        // Re-check against the snapshot; the registry may have moved on
        const ChainConfig& config = snap.chains.at(id);
        if (!config.enabled) continue;

        const UsdGasPrice& price = snap.prices.at(id);
        if (price.ok() && config.max_acceptable_gas_price != 0 &&
            price.gas_price > config.max_acceptable_gas_price) {
            log::get()->debug("chain {} skipped: gas price {} above limit {}",
                              id, price.gas_price, config.max_acceptable_gas_price);
            continue;
        }

        CostResult candidate = compute(snap, source_chain, id, gas_units,
                                       token_in, token_out, amount_in_x18);
        if (!candidate.ok()) {
            log::get()->debug("chain {} skipped: {}", id, errors::to_string(candidate.status));
            continue;
        }

        if (!best || cheaper(candidate.breakdown, *best)) {
            best = candidate.breakdown;
        }
    }

    if (!best) {
        return result;
    }
    result.best = *best;

    const I128 baseline_total = result.baseline.total_cost_usd_x18;
    if (best->total_cost_usd_x18 >= baseline_total) {
        return result;
    }

    I128 savings = baseline_total - best->total_cost_usd_x18;
    I128 savings_bps = savings * BPS_DENOMINATOR / baseline_total;

    if (savings_bps < static_cast<I128>(min_savings_bps) ||
        savings < min_absolute_savings_usd_x18) {
        log::get()->debug("chain {} saves ${} ({} bps), below thresholds ({} bps, ${})",
                          best->chain_id, x18::to_string(savings),
                          static_cast<int64_t>(savings_bps), min_savings_bps,
                          x18::to_string(min_absolute_savings_usd_x18));
        return result;
    }

    result.chain_id = best->chain_id;
    result.savings_usd_x18 = savings;
    result.savings_bps = static_cast<uint32_t>(savings_bps);
    return result;
}

// =============================================================================
// Administration
// =============================================================================

int32_t CostModel::set_bridge_fee_schedule(const Address& caller, const BridgeFeeSchedule& fees) {
    if (!access_->is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }
    if (fees.base_fee_usd_x18 < 0 || fees.fee_bps > BPS_DENOMINATOR) {
        return errors::INVALID_PARAMETER;
    }

    std::unique_lock lock(params_mutex_);
    fees_ = fees;
    log::get()->info("bridge fee schedule updated: base=${} fee={}bps",
                     x18::to_string(fees.base_fee_usd_x18), fees.fee_bps);
    return errors::OK;
}

int32_t CostModel::set_params(const Address& caller, const CostParams& params) {
    if (!access_->is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }
    // A margin below 1.0x would underestimate gas
    if (params.safety_margin_bps < BPS_DENOMINATOR ||
        params.max_slippage_bps > BPS_DENOMINATOR ||
        params.swap_gas_units == 0) {
        return errors::INVALID_PARAMETER;
    }

    std::unique_lock lock(params_mutex_);
    params_ = params;
    log::get()->info("cost params updated: gas_units={} margin={}bps max_slippage={}bps",
                     params.swap_gas_units, params.safety_margin_bps, params.max_slippage_bps);
    return errors::OK;
}

BridgeFeeSchedule CostModel::bridge_fee_schedule() const {
    std::shared_lock lock(params_mutex_);
    return fees_;
}

CostParams CostModel::params() const {
    std::shared_lock lock(params_mutex_);
    return params_;
}

// =============================================================================
// Internal Helpers
// =============================================================================

CostModel::Snapshot CostModel::take_snapshot(const std::vector<ChainId>& chain_ids) const {
    Snapshot snap;
    {
        std::shared_lock lock(params_mutex_);
        snap.params = params_;
        snap.fees = fees_;
    }

    for (ChainId id : chain_ids) {
        if (snap.prices.find(id) != snap.prices.end()) continue;

        auto config = registry_->get_chain(id);
        if (config) {
            snap.chains.emplace(id, *config);
        } else {
            ChainConfig missing;
            missing.chain_id = id;
            missing.enabled = false;
            snap.chains.emplace(id, missing);
        }
        snap.prices.emplace(id, oracle_->get_usd(id));
    }
    return snap;
}

CostResult CostModel::compute(const Snapshot& snap, ChainId source_chain, ChainId chain_id,
                              uint64_t gas_units, const Token& token_in, const Token& token_out,
                              I128 amount_in_x18) const {
    CostResult result{errors::OK, CostBreakdown{chain_id, 0, 0, 0, 0, 0}};

    auto price_it = snap.prices.find(chain_id);
    if (price_it == snap.prices.end()) {
        result.status = errors::UNKNOWN_CHAIN;
        return result;
    }
    if (!price_it->second.ok()) {
        result.status = price_it->second.status;
        return result;
    }
    const ChainConfig& config = snap.chains.at(chain_id);
    const bool local = chain_id == source_chain;

    CostBreakdown& b = result.breakdown;

    // gas_units * margin * usd_per_gas
    b.gas_cost_usd_x18 = x18::apply_bps(
        static_cast<I128>(gas_units) * price_it->second.usd_per_gas_x18,
        snap.params.safety_margin_bps);

    b.bridge_fee_usd_x18 = local ? 0 :
        snap.fees.base_fee_usd_x18 + x18::apply_bps(amount_in_x18, snap.fees.fee_bps);

    uint32_t slippage_bps = slippage_ ?
        slippage_->estimate_bps(chain_id, token_in, token_out, amount_in_x18) : 0;
    slippage_bps = std::min(slippage_bps, snap.params.max_slippage_bps);
    b.slippage_cost_usd_x18 = x18::apply_bps(amount_in_x18, slippage_bps);

    b.total_cost_usd_x18 = b.gas_cost_usd_x18 + b.bridge_fee_usd_x18 + b.slippage_cost_usd_x18;
    b.estimated_execution_time_seconds = local ? 0 : config.arrival_time_seconds();

    return result;
}

bool CostModel::cheaper(const CostBreakdown& a, const CostBreakdown& b) {
    if (a.total_cost_usd_x18 != b.total_cost_usd_x18) {
        return a.total_cost_usd_x18 < b.total_cost_usd_x18;
    }
    if (a.estimated_execution_time_seconds != b.estimated_execution_time_seconds) {
        return a.estimated_execution_time_seconds < b.estimated_execution_time_seconds;
    }
    return a.chain_id < b.chain_id;
}

} // namespace gasopt
