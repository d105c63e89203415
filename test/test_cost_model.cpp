// gasopt - CostModel Tests

#include <catch2/catch_test_macros.hpp>
#include "test_mocks.hpp"

using namespace gasopt;
using namespace gasopt::testing;

namespace {

const I128 AMOUNT = x18::from_int(1000);

OptimalChain search(const Core& core, uint32_t min_bps = 500,
                    I128 min_abs = x18::from_int(10), uint32_t max_time = 1800,
                    const std::vector<ChainId>& exclude = {}) {
    return core.cost_model->find_optimal_chain(chains::ETHEREUM, token(0x01), token(0x02),
                                               AMOUNT, min_bps, min_abs, max_time, exclude);
}

}  // namespace

TEST_CASE("CostModel breakdown", "[cost]") {
    Core core;
    core.post(chains::ETHEREUM, 250);
    core.post(chains::ARBITRUM, 5);

    SECTION("Local chain pays gas only") {
        auto r = core.cost_model->total_cost(chains::ETHEREUM, chains::ETHEREUM, 100000,
                                             token(0x01), token(0x02), AMOUNT);
        REQUIRE(r.ok());
        REQUIRE(r.breakdown.gas_cost_usd_x18 == x18::from_int(50));
        REQUIRE(r.breakdown.bridge_fee_usd_x18 == 0);
        REQUIRE(r.breakdown.slippage_cost_usd_x18 == 0);
        REQUIRE(r.breakdown.total_cost_usd_x18 == x18::from_int(50));
        REQUIRE(r.breakdown.estimated_execution_time_seconds == 0);
    }

    SECTION("Remote chain adds the bridge fee and latency") {
        auto r = core.cost_model->total_cost(chains::ETHEREUM, chains::ARBITRUM, 100000,
                                             token(0x01), token(0x02), AMOUNT);
        REQUIRE(r.ok());
        REQUIRE(r.breakdown.gas_cost_usd_x18 == x18::from_int(1));
        REQUIRE(r.breakdown.bridge_fee_usd_x18 == x18::from_int(1));
        REQUIRE(r.breakdown.total_cost_usd_x18 == x18::from_int(2));
        REQUIRE(r.breakdown.estimated_execution_time_seconds == 600);
    }

    SECTION("Destination finality adds to the estimated time") {
        ChainConfig arb = make_chain(chains::ARBITRUM, "arbitrum", 600);
        arb.block_time_seconds = 1;
        arb.finality_time_seconds = 300;
        REQUIRE(core.registry->update_chain(core.owner, arb) == errors::OK);

        auto r = core.cost_model->total_cost(chains::ETHEREUM, chains::ARBITRUM, 100000,
                                             token(0x01), token(0x02), AMOUNT);
        REQUIRE(r.breakdown.estimated_execution_time_seconds == 900);

        // 600s of bridging alone would fit, 900s in total does not
        REQUIRE_FALSE(search(core, 500, x18::from_int(10), 800).should_optimize(chains::ETHEREUM));
        REQUIRE(search(core, 500, x18::from_int(10), 900).chain_id == chains::ARBITRUM);
    }

    SECTION("Safety margin scales gas") {
        CostParams p = core.cost_model->params();
        p.safety_margin_bps = 12000;
        REQUIRE(core.cost_model->set_params(core.owner, p) == errors::OK);

        auto r = core.cost_model->total_cost(chains::ETHEREUM, chains::ETHEREUM, 100000,
                                             token(0x01), token(0x02), AMOUNT);
        REQUIRE(r.breakdown.gas_cost_usd_x18 == x18::from_int(60));
    }

    SECTION("Proportional bridge fee") {
        BridgeFeeSchedule fees{x18::from_int(2), 50};
        REQUIRE(core.cost_model->set_bridge_fee_schedule(core.owner, fees) == errors::OK);

        auto r = core.cost_model->total_cost(chains::ETHEREUM, chains::ARBITRUM, 100000,
                                             token(0x01), token(0x02), AMOUNT);
        // $2 + 0.5% of $1000
        REQUIRE(r.breakdown.bridge_fee_usd_x18 == x18::from_int(7));
    }

    SECTION("Missing or stale prices propagate") {
        auto r = core.cost_model->total_cost(chains::ETHEREUM, chains::OPTIMISM, 100000,
                                             token(0x01), token(0x02), AMOUNT);
        REQUIRE(r.status == errors::UNKNOWN_CHAIN);

        core.clock.advance(601);
        r = core.cost_model->total_cost(chains::ETHEREUM, chains::ETHEREUM, 100000,
                                        token(0x01), token(0x02), AMOUNT);
        REQUIRE(r.status == errors::STALE_PRICE);
    }
}

TEST_CASE("Liquidity depth slippage", "[cost][slippage]") {
    LiquidityDepthSlippage slippage(x18::from_int(1000000));
    slippage.set_depth(chains::ARBITRUM, x18::from_int(100000));

    REQUIRE(slippage.estimate_bps(chains::ETHEREUM, token(1), token(2), x18::from_int(10000)) == 100);
    REQUIRE(slippage.estimate_bps(chains::ARBITRUM, token(1), token(2), x18::from_int(10000)) == 1000);
    REQUIRE(slippage.estimate_bps(chains::ARBITRUM, token(1), token(2), x18::from_int(500000)) ==
            BPS_DENOMINATOR);
    REQUIRE(slippage.estimate_bps(chains::ETHEREUM, token(1), token(2), 0) == 0);

    SECTION("Slippage cost is capped by max_slippage_bps") {
        Core core;
        auto estimator = std::make_shared<LiquidityDepthSlippage>(x18::from_int(1000000));
        estimator->set_depth(chains::ARBITRUM, x18::from_int(100000));

        CostParams params;
        params.swap_gas_units = 100000;
        params.safety_margin_bps = BPS_DENOMINATOR;
        params.max_slippage_bps = 300;
        CostModel model(core.registry, core.oracle, core.access, estimator, params,
                        BridgeFeeSchedule{X18_ONE, 0});

        core.post(chains::ETHEREUM, 250);
        core.post(chains::ARBITRUM, 5);

        auto local = model.total_cost(chains::ETHEREUM, chains::ETHEREUM, 100000,
                                      token(1), token(2), x18::from_int(10000));
        REQUIRE(local.breakdown.slippage_cost_usd_x18 == x18::from_int(100));

        auto remote = model.total_cost(chains::ETHEREUM, chains::ARBITRUM, 100000,
                                       token(1), token(2), x18::from_int(10000));
        REQUIRE(remote.breakdown.slippage_cost_usd_x18 == x18::from_int(300));
    }
}

TEST_CASE("Optimal chain thresholds", "[cost][optimal]") {
    Core core;
    core.post(chains::ETHEREUM, 250);

    SECTION("$50 local against $2 remote is worth bridging") {
        core.post(chains::ARBITRUM, 5);

        auto opt = search(core);
        REQUIRE(opt.ok());
        REQUIRE(opt.should_optimize(chains::ETHEREUM));
        REQUIRE(opt.chain_id == chains::ARBITRUM);
        REQUIRE(opt.savings_usd_x18 == x18::from_int(48));
        REQUIRE(opt.savings_bps == 9600);
        REQUIRE(opt.baseline.total_cost_usd_x18 == x18::from_int(50));
        REQUIRE(opt.best.total_cost_usd_x18 == x18::from_int(2));
    }

    SECTION("$50 local against $46 remote is not") {
        core.post(chains::ARBITRUM, 225);

        auto opt = search(core);
        REQUIRE(opt.ok());
        REQUIRE_FALSE(opt.should_optimize(chains::ETHEREUM));
        REQUIRE(opt.chain_id == chains::ETHEREUM);
        REQUIRE(opt.savings_usd_x18 == 0);
        REQUIRE(opt.best.chain_id == chains::ARBITRUM);
        REQUIRE(opt.best.total_cost_usd_x18 == x18::from_int(46));
    }

    SECTION("Both thresholds must hold") {
        core.post(chains::ARBITRUM, 5);

        // $48 saved but 9600 bps < 9700 bps
        REQUIRE_FALSE(search(core, 9700).should_optimize(chains::ETHEREUM));
        // 9600 bps but $48 < $49
        REQUIRE_FALSE(search(core, 500, x18::from_int(49)).should_optimize(chains::ETHEREUM));
        REQUIRE(search(core, 9600, x18::from_int(48)).should_optimize(chains::ETHEREUM));
    }

    SECTION("Bridge time limit and exclusions narrow the candidates") {
        core.post(chains::ARBITRUM, 5);

        REQUIRE_FALSE(search(core, 500, x18::from_int(10), 599).should_optimize(chains::ETHEREUM));
        REQUIRE_FALSE(search(core, 500, x18::from_int(10), 1800, {chains::ARBITRUM})
                          .should_optimize(chains::ETHEREUM));
    }

    SECTION("No fresh baseline means no decision") {
        core.post(chains::ARBITRUM, 5);
        core.clock.advance(601);
        auto opt = search(core);
        REQUIRE(opt.status == errors::STALE_PRICE);
        REQUIRE_FALSE(opt.should_optimize(chains::ETHEREUM));
    }
}

TEST_CASE("Optimal chain candidate filtering", "[cost][optimal]") {
    Core core;
    core.post(chains::ETHEREUM, 250);
    core.post(chains::ARBITRUM, 10);
    core.post(chains::OPTIMISM, 5);

    SECTION("Cheapest candidate wins") {
        REQUIRE(search(core).chain_id == chains::OPTIMISM);
    }

    SECTION("Disabled chains are never chosen") {
        REQUIRE(core.registry->set_chain_enabled(core.owner, chains::OPTIMISM, false) == errors::OK);
        REQUIRE(search(core).chain_id == chains::ARBITRUM);
    }

    SECTION("Gas above the chain's acceptable maximum is skipped") {
        ChainConfig op = make_chain(chains::OPTIMISM, "optimism", 900);
        op.max_acceptable_gas_price = 4 * GWEI;
        REQUIRE(core.registry->update_chain(core.owner, op) == errors::OK);
        REQUIRE(search(core).chain_id == chains::ARBITRUM);
    }

    SECTION("Stale candidates are skipped") {
        core.clock.advance(300);
        core.post(chains::ETHEREUM, 250);
        core.post(chains::ARBITRUM, 10);
        core.clock.advance(301);
        // Optimism is now 601s old, the others 301s
        REQUIRE(search(core).chain_id == chains::ARBITRUM);
    }

    SECTION("Ties go to the faster chain") {
        core.post(chains::ARBITRUM, 5);
        // Same cost, Arbitrum bridges in 600s against 900s
        REQUIRE(search(core).chain_id == chains::ARBITRUM);
    }

    SECTION("Full ties go to the lower chain id") {
        core.post(chains::ARBITRUM, 5);
        ChainConfig arb = make_chain(chains::ARBITRUM, "arbitrum", 900);
        REQUIRE(core.registry->update_chain(core.owner, arb) == errors::OK);
        REQUIRE(search(core).chain_id == chains::OPTIMISM);
    }

    SECTION("Identical inputs give identical answers") {
        auto a = search(core);
        auto b = search(core);
        REQUIRE(a.chain_id == b.chain_id);
        REQUIRE(a.savings_usd_x18 == b.savings_usd_x18);
        REQUIRE(a.savings_bps == b.savings_bps);
        REQUIRE(a.baseline == b.baseline);
        REQUIRE(a.best == b.best);
    }
}

TEST_CASE("CostModel administration", "[cost]") {
    Core core;

    CostParams p = core.cost_model->params();
    REQUIRE(core.cost_model->set_params(core.user, p) == errors::UNAUTHORIZED);

    p.safety_margin_bps = 9000;
    REQUIRE(core.cost_model->set_params(core.owner, p) == errors::INVALID_PARAMETER);

    p.safety_margin_bps = 10000;
    p.swap_gas_units = 0;
    REQUIRE(core.cost_model->set_params(core.owner, p) == errors::INVALID_PARAMETER);

    BridgeFeeSchedule fees{-X18_ONE, 0};
    REQUIRE(core.cost_model->set_bridge_fee_schedule(core.owner, fees) == errors::INVALID_PARAMETER);
    REQUIRE(core.cost_model->set_bridge_fee_schedule(core.user, BridgeFeeSchedule{}) ==
            errors::UNAUTHORIZED);
}
