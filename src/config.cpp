// =============================================================================
// config.cpp - JSON configuration loading
// =============================================================================

#include "gasopt/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <set>
#include <sstream>

namespace gasopt {

namespace {

using json = nlohmann::json;

json section(const json& root, const char* name) {
    if (!root.contains(name)) return json::object();
    const json& s = root.at(name);
    if (!s.is_object()) {
        throw ConfigError(std::string("section '") + name + "' must be an object");
    }
    return s;
}

// USD amounts are decimal strings ("2.5"); whole numbers may be plain integers
I128 read_usd(const json& j, const char* key, I128 fallback) {
    if (!j.contains(key)) return fallback;

    const json& v = j.at(key);
    std::string text;
    if (v.is_string()) {
        text = v.get<std::string>();
    } else if (v.is_number_integer()) {
        text = std::to_string(v.get<int64_t>());
    } else {
        throw ConfigError(std::string("'") + key + "' must be a decimal string");
    }

    I128 out = 0;
    if (!x18::from_string(text, out)) {
        throw ConfigError(std::string("'") + key + "' is not a decimal: " + text);
    }
    return out;
}

Address read_address(const json& j, const char* key) {
    if (!j.contains(key)) return ZERO_ADDRESS;

    std::string text = j.at(key).get<std::string>();
    Address addr{};
    if (!address_from_hex(text, addr)) {
        throw ConfigError(std::string("'") + key + "' is not an address: " + text);
    }
    return addr;
}

ChainConfig parse_chain(const json& j, CostConfig& cost) {
    if (!j.is_object() || !j.contains("chain_id")) {
        throw ConfigError("every chains[] entry needs a chain_id");
    }

    ChainConfig c;
    c.chain_id = j.at("chain_id").get<ChainId>();
    c.name = j.value("name", std::string{});
    c.enabled = j.value("enabled", true);
    c.block_time_seconds = j.value("block_time_seconds", c.block_time_seconds);
    c.finality_time_seconds = j.value("finality_time_seconds", c.finality_time_seconds);
    c.bridge_time_seconds = j.value("bridge_time_seconds", c.bridge_time_seconds);
    c.max_acceptable_gas_price = j.value("max_acceptable_gas_price", c.max_acceptable_gas_price);
    c.congestion_low = j.value("congestion_low", c.congestion_low);
    c.congestion_medium = j.value("congestion_medium", c.congestion_medium);
    c.congestion_high = j.value("congestion_high", c.congestion_high);
    c.native_asset_id = j.value("native_asset_id", c.native_asset_id);

    if (j.contains("liquidity_depth_usd")) {
        cost.liquidity_depths[c.chain_id] = read_usd(j, "liquidity_depth_usd", 0);
    }
    return c;
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;

    try {
        json root = json::parse(content.begin(), content.end());
        if (!root.is_object()) {
            throw ConfigError("config root must be an object");
        }

        json general = section(root, "general");
        config.general.log_level = general.value("log_level", config.general.log_level);

        json access = section(root, "access");
        config.access.owner = read_address(access, "owner");
        config.access.keeper = read_address(access, "keeper");

        json oracle = section(root, "oracle");
        OracleParams& op = config.oracle;
        op.min_gas_price = oracle.value("min_gas_price", op.min_gas_price);
        op.max_gas_price = oracle.value("max_gas_price", op.max_gas_price);
        op.staleness_threshold = oracle.value("staleness_threshold", op.staleness_threshold);
        op.feed_max_age = oracle.value("feed_max_age", op.feed_max_age);
        op.history_capacity = oracle.value("history_capacity", op.history_capacity);

        json cost = section(root, "cost");
        CostConfig& cc = config.cost;
        cc.params.swap_gas_units = cost.value("swap_gas_units", cc.params.swap_gas_units);
        cc.params.safety_margin_bps = cost.value("safety_margin_bps", cc.params.safety_margin_bps);
        cc.params.max_slippage_bps = cost.value("max_slippage_bps", cc.params.max_slippage_bps);
        cc.fees.base_fee_usd_x18 = read_usd(cost, "bridge_base_fee_usd", cc.fees.base_fee_usd_x18);
        cc.fees.fee_bps = cost.value("bridge_fee_bps", cc.fees.fee_bps);
        cc.default_liquidity_depth_usd_x18 =
            read_usd(cost, "default_liquidity_depth_usd", cc.default_liquidity_depth_usd_x18);

        json thresholds = section(root, "thresholds");
        Thresholds& t = config.thresholds;
        t.min_savings_bps = thresholds.value("min_savings_bps", t.min_savings_bps);
        t.min_absolute_savings_usd_x18 =
            read_usd(thresholds, "min_absolute_savings_usd", t.min_absolute_savings_usd_x18);
        t.max_bridge_time_seconds =
            thresholds.value("max_bridge_time_seconds", t.max_bridge_time_seconds);

        json orchestrator = section(root, "orchestrator");
        OrchestratorParams& o = config.orchestrator;
        o.local_chain = orchestrator.value("local_chain", o.local_chain);
        o.recovery_timeout = orchestrator.value("recovery_timeout", o.recovery_timeout);
        o.escrow = read_address(orchestrator, "escrow");

        if (root.contains("chains")) {
            const json& chains = root.at("chains");
            if (!chains.is_array()) {
                throw ConfigError("'chains' must be an array");
            }
            for (const auto& entry : chains) {
                config.chains.push_back(parse_chain(entry, config.cost));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config: ") + e.what());
    }

    config.validate();
    return config;
}

void Config::validate() const {
    if (is_zero(access.owner)) {
        throw ConfigError("access.owner is required");
    }
    if (is_zero(access.keeper)) {
        throw ConfigError("access.keeper is required");
    }
    if (oracle.min_gas_price > oracle.max_gas_price || oracle.history_capacity == 0) {
        throw ConfigError("oracle bounds or history capacity invalid");
    }
    if (cost.params.safety_margin_bps < BPS_DENOMINATOR ||
        cost.params.max_slippage_bps > BPS_DENOMINATOR ||
        cost.params.swap_gas_units == 0) {
        throw ConfigError("cost parameters invalid");
    }
    if (cost.fees.base_fee_usd_x18 < 0 || cost.fees.fee_bps > BPS_DENOMINATOR) {
        throw ConfigError("bridge fee schedule invalid");
    }
    if (thresholds.min_savings_bps > BPS_DENOMINATOR ||
        thresholds.min_absolute_savings_usd_x18 < 0) {
        throw ConfigError("thresholds invalid");
    }

    std::set<ChainId> seen;
    for (const auto& chain : chains) {
        if (!seen.insert(chain.chain_id).second) {
            throw ConfigError("duplicate chain " + std::to_string(chain.chain_id));
        }
    }
    if (seen.find(orchestrator.local_chain) == seen.end()) {
        throw ConfigError("orchestrator.local_chain " +
                          std::to_string(orchestrator.local_chain) + " is not in chains");
    }
}

} // namespace gasopt
