// gasopt - Configuration Tests

#include <catch2/catch_test_macros.hpp>
#include "test_mocks.hpp"

#include <string>

using namespace gasopt;
using namespace gasopt::testing;

namespace {

const char* MINIMAL = R"({
  "access": {
    "owner": "0x00000000000000000000000000000000000000a1",
    "keeper": "0x00000000000000000000000000000000000000b2"
  },
  "orchestrator": { "local_chain": 1 },
  "chains": [
    { "chain_id": 1, "name": "ethereum", "native_asset_id": 1 },
    { "chain_id": 42161, "name": "arbitrum", "bridge_time_seconds": 600, "native_asset_id": 1 }
  ]
})";

}  // namespace

TEST_CASE("Config from the example file", "[config]") {
    Config config = Config::from_file(std::string(GASOPT_CONFIG_DIR) + "/gasopt.example.json");

    REQUIRE(config.general.log_level == "info");
    REQUIRE(config.access.owner == addr(0xA1));
    REQUIRE(config.access.keeper == addr(0xB2));
    REQUIRE(config.orchestrator.local_chain == chains::ETHEREUM);
    REQUIRE(config.orchestrator.escrow == addr(0xE5));
    REQUIRE(config.orchestrator.recovery_timeout == 3600);

    REQUIRE(config.oracle.staleness_threshold == 600);
    REQUIRE(config.oracle.history_capacity == 24);

    REQUIRE(config.cost.params.safety_margin_bps == 12000);
    REQUIRE(config.cost.fees.base_fee_usd_x18 == x18::from_int(2));
    REQUIRE(config.cost.fees.fee_bps == 5);
    REQUIRE(config.cost.liquidity_depths.at(chains::ETHEREUM) == x18::from_int(50000000));

    REQUIRE(config.thresholds.min_savings_bps == 500);
    REQUIRE(config.thresholds.min_absolute_savings_usd_x18 == x18::from_int(10));
    REQUIRE(config.thresholds.max_bridge_time_seconds == 1800);

    REQUIRE(config.chains.size() == 5);
    REQUIRE(config.chains[1].chain_id == chains::ARBITRUM);
    REQUIRE(config.chains[1].bridge_time_seconds == 600);
    REQUIRE(config.chains[4].chain_id == chains::BASE);
    REQUIRE_FALSE(config.chains[4].enabled);
}

TEST_CASE("Config defaults and overrides", "[config]") {
    Config config = Config::from_json(MINIMAL);

    REQUIRE(config.general.log_level == "info");
    REQUIRE(config.cost.params.swap_gas_units == 150000);
    REQUIRE(config.thresholds.min_absolute_savings_usd_x18 == x18::from_int(10));
    REQUIRE(is_zero(config.orchestrator.escrow));
    REQUIRE(config.chains.size() == 2);
    REQUIRE(config.chains[0].enabled);
}

TEST_CASE("Config rejects bad input", "[config]") {
    SECTION("Unreadable file") {
        REQUIRE_THROWS_AS(Config::from_file("/nonexistent/gasopt.json"), ConfigError);
    }

    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(Config::from_json("{ not json"), ConfigError);
    }

    SECTION("Wrong field types") {
        REQUIRE_THROWS_AS(Config::from_json(R"({"oracle": {"staleness_threshold": "soon"}})"),
                          ConfigError);
        REQUIRE_THROWS_AS(Config::from_json(R"({"chains": {}})"), ConfigError);
    }

    SECTION("Missing owner") {
        REQUIRE_THROWS_AS(Config::from_json(R"({"orchestrator": {"local_chain": 1}})"), ConfigError);
    }

    SECTION("Bad address") {
        REQUIRE_THROWS_AS(Config::from_json(R"({"access": {"owner": "0x12"}})"), ConfigError);
    }

    SECTION("Bad decimal") {
        REQUIRE_THROWS_AS(Config::from_json(R"({"thresholds": {"min_absolute_savings_usd": "ten"}})"),
                          ConfigError);
    }

    SECTION("Local chain must be configured") {
        Config config = Config::from_json(MINIMAL);
        config.orchestrator.local_chain = chains::POLYGON;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Duplicate chains") {
        Config config = Config::from_json(MINIMAL);
        config.with_chain(make_chain(chains::ETHEREUM, "again", 0));
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }
}

TEST_CASE("GasOptimizer assembly", "[config][facade]") {
    ManualClock clock;
    auto feed = std::make_shared<MockPriceFeed>();
    auto bridge = std::make_shared<MockBridge>();
    feed->set_price(ETH_ASSET, x18::from_int(2000), clock.now());

    SECTION("From a parsed file") {
        Config config = Config::from_json(MINIMAL);
        GasOptimizer core(config, feed, bridge, clock.source());

        REQUIRE(core.local_chain() == chains::ETHEREUM);
        REQUIRE(core.registry().chain_ids() == std::vector<ChainId>{chains::ETHEREUM, chains::ARBITRUM});
        REQUIRE(core.access().is_admin(addr(0xA1)));
        REQUIRE(core.access().is_keeper(addr(0xB2)));

        REQUIRE(core.oracle().update(addr(0xB2), chains::ETHEREUM, 250 * GWEI) == errors::OK);
        REQUIRE(core.oracle().update(addr(0xB2), chains::ARBITRUM, 1 * GWEI) == errors::OK);

        SwapIntent intent;
        intent.user = addr(0x11);
        intent.token_in = token(0x01);
        intent.token_out = token(0x02);
        intent.amount_in_x18 = x18::from_int(1000);
        intent.min_amount_out_x18 = x18::from_int(990);
        intent.deadline = clock.now() + 600;

        auto q = core.orchestrator().quote(intent);
        REQUIRE(q.ok());
        REQUIRE(q.should_optimize);
        REQUIRE(q.optimized_chain == chains::ARBITRUM);

        auto stats = core.get_stats();
        REQUIRE(stats.registered_chains == 2);
        REQUIRE(stats.oracle_stats.total_updates == 2);
        REQUIRE_FALSE(stats.paused);
    }

    SECTION("Built in code") {
        Config config;
        config.with_owner(addr(0xA1))
              .with_keeper(addr(0xB2))
              .with_local_chain(chains::ETHEREUM)
              .with_log_level("warn")
              .with_chain(make_chain(chains::ETHEREUM, "ethereum", 0))
              .with_chain(make_chain(chains::OPTIMISM, "optimism", 900))
              .with_liquidity_depth(chains::OPTIMISM, x18::from_int(100000));

        GasOptimizer core(config, feed, bridge, clock.source());
        REQUIRE(core.slippage().depth(chains::OPTIMISM) == x18::from_int(100000));
        REQUIRE(core.slippage().depth(chains::ETHEREUM) == x18::from_int(10000000));
        REQUIRE(core.orchestrator().params().local_chain == chains::ETHEREUM);
    }

    SECTION("Invalid configs are refused") {
        Config config;
        config.with_owner(addr(0xA1)).with_keeper(addr(0xB2)).with_local_chain(chains::ETHEREUM);
        REQUIRE_THROWS_AS(GasOptimizer(config, feed, bridge, clock.source()), ConfigError);

        ChainConfig bad = make_chain(chains::ETHEREUM, "ethereum", 0);
        bad.congestion_low = 10;
        bad.congestion_medium = 5;
        bad.congestion_high = 20;
        config.with_chain(bad);
        REQUIRE_THROWS_AS(GasOptimizer(config, feed, bridge, clock.source()), ConfigError);
    }
}
