#ifndef GASOPT_CONFIG_HPP
#define GASOPT_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "chain_registry.hpp"
#include "oracle.hpp"
#include "cost_model.hpp"
#include "orchestrator.hpp"

namespace gasopt {

// Malformed file, bad field type, or an invalid value
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Sections
// =============================================================================

struct GeneralConfig {
    std::string log_level = "info";
};

struct AccessConfig {
    Address owner{};
    Address keeper{};
};

struct CostConfig {
    CostParams params;
    BridgeFeeSchedule fees;
    I128 default_liquidity_depth_usd_x18 = x18::from_int(10000000);
    std::unordered_map<ChainId, I128> liquidity_depths;  // per-chain override
};

// =============================================================================
// Config - Everything needed to assemble a GasOptimizer
// =============================================================================

class Config {
public:
    GeneralConfig general;
    AccessConfig access;
    OracleParams oracle;
    CostConfig cost;
    Thresholds thresholds;
    OrchestratorParams orchestrator;
    std::vector<ChainConfig> chains;

    Config() = default;

    // Load from JSON file
    static Config from_file(std::string_view path);

    // Load from JSON string
    static Config from_json(std::string_view content);

    // Builder methods
    Config& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& with_owner(const Address& owner) {
        access.owner = owner;
        return *this;
    }

    Config& with_keeper(const Address& keeper) {
        access.keeper = keeper;
        return *this;
    }

    Config& with_local_chain(ChainId chain_id) {
        orchestrator.local_chain = chain_id;
        return *this;
    }

    Config& with_chain(ChainConfig chain) {
        chains.push_back(std::move(chain));
        return *this;
    }

    Config& with_liquidity_depth(ChainId chain_id, I128 depth_usd_x18) {
        cost.liquidity_depths[chain_id] = depth_usd_x18;
        return *this;
    }

    Config& with_thresholds(const Thresholds& t) {
        thresholds = t;
        return *this;
    }

    // Throws ConfigError describing the first problem found
    void validate() const;
};

} // namespace gasopt

#endif // GASOPT_CONFIG_HPP
