#ifndef GASOPT_CHAIN_REGISTRY_HPP
#define GASOPT_CHAIN_REGISTRY_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "access.hpp"

namespace gasopt {

// =============================================================================
// Chain Configuration
// =============================================================================

struct ChainConfig {
    ChainId chain_id = 0;
    std::string name;
    bool enabled = true;
    uint32_t block_time_seconds = 0;
    uint32_t finality_time_seconds = 0;
    uint32_t bridge_time_seconds = 0;       // Observed bridge latency to this chain
    uint64_t max_acceptable_gas_price = 0;  // wei, 0 = no limit
    uint64_t congestion_low = 0;            // wei
    uint64_t congestion_medium = 0;         // wei
    uint64_t congestion_high = 0;           // wei
    uint64_t native_asset_id = 0;           // Price feed asset for USD conversion

    // Bridge transfer plus destination finality
    uint32_t arrival_time_seconds() const {
        return bridge_time_seconds + finality_time_seconds;
    }
};

// =============================================================================
// ChainRegistry - Per-chain metadata, read-mostly
// =============================================================================

class ChainRegistry {
public:
    explicit ChainRegistry(std::shared_ptr<const AccessControl> access);
    ~ChainRegistry() = default;

    // Non-copyable
    ChainRegistry(const ChainRegistry&) = delete;
    ChainRegistry& operator=(const ChainRegistry&) = delete;

    // =========================================================================
    // Administration
    // =========================================================================

    int32_t register_chain(const Address& caller, const ChainConfig& config);
    int32_t update_chain(const Address& caller, const ChainConfig& config);
    int32_t set_chain_enabled(const Address& caller, ChainId chain_id, bool enabled);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<ChainConfig> get_chain(ChainId chain_id) const;
    bool chain_exists(ChainId chain_id) const;
    bool is_enabled(ChainId chain_id) const;

    // Ascending chain id order
    std::vector<ChainId> chain_ids() const;
    std::vector<ChainConfig> enabled_chains() const;

private:
    std::shared_ptr<const AccessControl> access_;

    // Ordered so every listing is deterministic
    std::map<ChainId, ChainConfig> chains_;
    mutable std::shared_mutex mutex_;

    static bool validate(const ChainConfig& config);
};

} // namespace gasopt

#endif // GASOPT_CHAIN_REGISTRY_HPP
