// =============================================================================
// chain_registry.cpp - ChainRegistry
// =============================================================================

#include "gasopt/chain_registry.hpp"
#include "gasopt/log.hpp"

namespace gasopt {

ChainRegistry::ChainRegistry(std::shared_ptr<const AccessControl> access)
    : access_(std::move(access)) {}

// =============================================================================
// Administration
// =============================================================================

int32_t ChainRegistry::register_chain(const Address& caller, const ChainConfig& config) {
    if (!access_->is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }
    if (!validate(config)) {
        return errors::INVALID_CHAIN_CONFIG;
    }

    std::unique_lock lock(mutex_);

    if (chains_.find(config.chain_id) != chains_.end()) {
        return errors::CHAIN_ALREADY_REGISTERED;
    }

    chains_[config.chain_id] = config;

    log::get()->info("chain registered: {} ({}) enabled={}",
                     config.chain_id, config.name, config.enabled);
    return errors::OK;
}

int32_t ChainRegistry::update_chain(const Address& caller, const ChainConfig& config) {
    if (!access_->is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }
    if (!validate(config)) {
        return errors::INVALID_CHAIN_CONFIG;
    }

    std::unique_lock lock(mutex_);

    auto it = chains_.find(config.chain_id);
    if (it == chains_.end()) {
        return errors::UNKNOWN_CHAIN;
    }

    it->second = config;
    log::get()->info("chain updated: {}", config.chain_id);
    return errors::OK;
}

int32_t ChainRegistry::set_chain_enabled(const Address& caller, ChainId chain_id, bool enabled) {
    if (!access_->is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }

    std::unique_lock lock(mutex_);

    auto it = chains_.find(chain_id);
    if (it == chains_.end()) {
        return errors::UNKNOWN_CHAIN;
    }

    it->second.enabled = enabled;
    log::get()->info("chain {} {}", chain_id, enabled ? "enabled" : "disabled");
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<ChainConfig> ChainRegistry::get_chain(ChainId chain_id) const {
    std::shared_lock lock(mutex_);
    auto it = chains_.find(chain_id);
    if (it == chains_.end()) return std::nullopt;
    return it->second;
}

bool ChainRegistry::chain_exists(ChainId chain_id) const {
    std::shared_lock lock(mutex_);
    return chains_.find(chain_id) != chains_.end();
}

bool ChainRegistry::is_enabled(ChainId chain_id) const {
    std::shared_lock lock(mutex_);
    auto it = chains_.find(chain_id);
    return it != chains_.end() && it->second.enabled;
}

std::vector<ChainId> ChainRegistry::chain_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<ChainId> ids;
    ids.reserve(chains_.size());
    for (const auto& [id, config] : chains_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<ChainConfig> ChainRegistry::enabled_chains() const {
    std::shared_lock lock(mutex_);
    std::vector<ChainConfig> result;
    for (const auto& [id, config] : chains_) {
        if (config.enabled) result.push_back(config);
    }
    return result;
}

bool ChainRegistry::validate(const ChainConfig& config) {
    if (config.chain_id == 0) return false;
    if (config.congestion_low > config.congestion_medium) return false;
    if (config.congestion_medium > config.congestion_high) return false;
    // Finality takes at least one block
    if (config.finality_time_seconds != 0 &&
        config.finality_time_seconds < config.block_time_seconds) {
        return false;
    }
    return true;
}

} // namespace gasopt
