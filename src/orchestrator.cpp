// =============================================================================
// orchestrator.cpp - SwapOrchestrator Cross-Chain Swap State Machine
// =============================================================================

#include "gasopt/orchestrator.hpp"
#include "gasopt/log.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>

namespace gasopt {

const char* to_string(SwapStatus status) {
    switch (status) {
        case SwapStatus::INITIATED: return "initiated";
        case SwapStatus::BRIDGING: return "bridging";
        case SwapStatus::SWAPPING: return "swapping";
        case SwapStatus::BRIDGING_BACK: return "bridging_back";
        case SwapStatus::COMPLETED: return "completed";
        case SwapStatus::FAILED: return "failed";
        case SwapStatus::RECOVERED: return "recovered";
    }
    return "unknown";
}

// =============================================================================
// Constructor
// =============================================================================

SwapOrchestrator::SwapOrchestrator(std::shared_ptr<const ChainRegistry> registry,
                                   std::shared_ptr<const CostModel> cost_model,
                                   std::shared_ptr<const AccessControl> access,
                                   std::shared_ptr<BridgeClient> bridge,
                                   OrchestratorParams params,
                                   Thresholds thresholds,
                                   TimeSource clock)
    : registry_(std::move(registry)),
      cost_model_(std::move(cost_model)),
      access_(std::move(access)),
      bridge_(std::move(bridge)),
      params_(params),
      clock_(std::move(clock)),
      thresholds_(thresholds) {}

// =============================================================================
// Query Surface
// =============================================================================

OptimizationQuote SwapOrchestrator::quote(const SwapIntent& intent) const {
    const ChainId local = params_.local_chain;
    OptimizationQuote q{errors::OK, local, local, 0, 0, 0, false, 0, 0};

    if (intent.amount_in_x18 <= 0) {
        q.status = errors::INVALID_AMOUNT;
        return q;
    }

    // User preferences override the global thresholds
    uint32_t min_bps;
    I128 min_abs;
    uint32_t max_time;
    {
        std::shared_lock lock(config_mutex_);
        auto it = preferences_.find(intent.user);
        if (it != preferences_.end()) {
            if (!it->second.optimization_enabled) {
                return q;
            }
            min_bps = it->second.min_savings_bps;
            min_abs = it->second.min_absolute_savings_usd_x18;
            max_time = it->second.max_bridge_time_seconds;
        } else {
            min_bps = thresholds_.min_savings_bps;
            min_abs = thresholds_.min_absolute_savings_usd_x18;
            max_time = thresholds_.max_bridge_time_seconds;
        }
    }

    OptimalChain opt = cost_model_->find_optimal_chain(
        local, intent.token_in, intent.token_out, intent.amount_in_x18,
        min_bps, min_abs, max_time, intent.exclude_chains);

    if (!opt.ok()) {
        // Stale or missing prices: fall back to executing locally
        q.status = opt.status;
        return q;
    }

    q.baseline_cost_usd_x18 = opt.baseline.total_cost_usd_x18;
    q.optimized_cost_usd_x18 = opt.baseline.total_cost_usd_x18;

    if (opt.should_optimize(local)) {
        // The bridge confirms the route and may report a slower crossing
        BridgeQuote route{0, 0};
        int32_t rc = bridge_quote(intent.token_in, intent.amount_in_x18, opt.chain_id, route);
        if (rc != errors::OK) {
            q.status = rc;
            return q;
        }

        uint32_t eta = std::max(opt.best.estimated_execution_time_seconds,
                                route.estimated_time_seconds);
        if (eta > max_time) {
            log::get()->debug("chain {} skipped: bridge quotes {}s, limit {}s",
                              opt.chain_id, route.estimated_time_seconds, max_time);
            return q;
        }

        q.optimized_chain = opt.chain_id;
        q.savings_usd_x18 = opt.savings_usd_x18;
        q.savings_bps = opt.savings_bps;
        q.estimated_bridge_time = eta;
        q.should_optimize = true;
        q.optimized_cost_usd_x18 = opt.best.total_cost_usd_x18;
    }

    return q;
}

// =============================================================================
// Transitions
// =============================================================================

InitiateResult SwapOrchestrator::execute(const SwapIntent& intent) {
    const ChainId local = params_.local_chain;

    if (is_zero(intent.user)) {
        return InitiateResult{errors::INVALID_USER, 0, local, false};
    }
    if (intent.amount_in_x18 <= 0) {
        return InitiateResult{errors::INVALID_AMOUNT, 0, local, false};
    }
    if (intent.deadline <= clock_()) {
        return InitiateResult{errors::DEADLINE_EXPIRED, 0, local, false};
    }

    OptimizationQuote q = quote(intent);
    if (!q.should_optimize) {
        if (q.status != errors::OK) {
            log::get()->info("executing locally for {}: {}",
                             address_to_hex(intent.user), errors::to_string(q.status));
        }
        return InitiateResult{errors::OK, 0, local, true};
    }

    InitiateParams params;
    params.user = intent.user;
    params.token_in = intent.token_in;
    params.token_out = intent.token_out;
    params.amount_in_x18 = intent.amount_in_x18;
    params.min_amount_out_x18 = intent.min_amount_out_x18;
    params.deadline = intent.deadline;
    params.destination_chain = q.optimized_chain;
    params.expected_savings_usd_x18 = q.savings_usd_x18;

    return initiate(params);
}

InitiateResult SwapOrchestrator::initiate(const InitiateParams& params) {
    const ChainId local = params_.local_chain;
    uint64_t now = clock_();

    InitiateResult result{errors::OK, 0, params.destination_chain, false};

    // Validation: nothing is created on failure
    if (is_paused()) {
        result.status = errors::OPERATIONS_PAUSED;
    } else if (is_zero(params.user)) {
        result.status = errors::INVALID_USER;
    } else if (params.amount_in_x18 <= 0) {
        result.status = errors::INVALID_AMOUNT;
    } else if (params.deadline <= now) {
        result.status = errors::DEADLINE_EXPIRED;
    } else if (params.destination_chain == local ||
               !registry_->is_enabled(params.destination_chain)) {
        result.status = errors::INVALID_DESTINATION_CHAIN;
    }
    if (result.status != errors::OK) {
        log::get()->warn("initiate rejected for {}: {}",
                         address_to_hex(params.user), errors::to_string(result.status));
        return result;
    }

    auto slot = std::make_shared<SwapSlot>();
    SwapRecord& record = slot->record;
    record.user = params.user;
    record.token_in = params.token_in;
    record.token_out = params.token_out;
    record.amount_in_x18 = params.amount_in_x18;
    record.min_amount_out_x18 = params.min_amount_out_x18;
    record.amount_out_x18 = 0;
    record.source_chain = local;
    record.destination_chain = params.destination_chain;
    record.initiated_at = now;
    record.completed_at = 0;
    record.status = SwapStatus::BRIDGING;
    record.failure_code = errors::OK;
    record.failed_leg = SwapStatus::INITIATED;
    record.expected_savings_usd_x18 = params.expected_savings_usd_x18;
    slot->in_flight = true;

    SwapId swap_id;
    SwapRecord snapshot;
    {
        std::unique_lock lock(swaps_mutex_);
        do {
            record.digest = derive_swap_digest(
                params, now, nonce_.fetch_add(1, std::memory_order_relaxed));
            swap_id = swap_id_from(record.digest);
        } while (swap_id == 0 || swaps_.find(swap_id) != swaps_.end());

        record.swap_id = swap_id;
        snapshot = record;
        swaps_.emplace(swap_id, slot);
        user_index_[params.user].push_back(swap_id);
    }
    record_initiated(params.destination_chain);

    log::get()->info("swap {:016x} initiated: {} -> {} amount={}",
                     swap_id, local, params.destination_chain,
                     x18::to_string(params.amount_in_x18));

    std::string reference;
    int32_t rc = send_outbound(snapshot, reference);

    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->in_flight = false;
        if (rc == errors::OK) {
            slot->record.bridge_reference_id = reference;
        } else {
            mark_failed(slot->record, rc, SwapStatus::BRIDGING);
            result.status = errors::BRIDGE_FAILED;
        }
    }

    result.swap_id = swap_id;
    return result;
}

int32_t SwapOrchestrator::handle_destination_swap(SwapId swap_id,
                                                  const DestinationSwapResult& outcome) {
    auto slot = find_slot(swap_id);
    if (!slot) return errors::SWAP_NOT_FOUND;

    SwapRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        SwapRecord& record = slot->record;

        if (slot->in_flight) return errors::TRANSITION_IN_PROGRESS;
        if (record.status != SwapStatus::BRIDGING) {
            return errors::INVALID_STATE_TRANSITION;
        }

        if (!outcome.success || outcome.amount_out_x18 <= 0 ||
            outcome.amount_out_x18 < record.min_amount_out_x18) {
            record.amount_out_x18 = outcome.success ? outcome.amount_out_x18 : 0;
            mark_failed(record, errors::DESTINATION_SWAP_FAILED, SwapStatus::SWAPPING);
            return errors::DESTINATION_SWAP_FAILED;
        }

        record.amount_out_x18 = outcome.amount_out_x18;
        record.status = SwapStatus::SWAPPING;
        slot->in_flight = true;
        snapshot = record;
    }

    log::get()->info("swap {:016x} executed on chain {}: amount_out={}",
                     swap_id, snapshot.destination_chain,
                     x18::to_string(snapshot.amount_out_x18));

    std::string reference;
    int32_t rc = send_return(snapshot, reference);

    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->in_flight = false;
    if (rc != errors::OK) {
        mark_failed(slot->record, rc, SwapStatus::BRIDGING_BACK);
        return errors::BRIDGE_FAILED;
    }

    slot->record.status = SwapStatus::BRIDGING_BACK;
    slot->record.bridge_reference_id = reference;
    return errors::OK;
}

int32_t SwapOrchestrator::complete(SwapId swap_id) {
    auto slot = find_slot(swap_id);
    if (!slot) return errors::SWAP_NOT_FOUND;

    std::lock_guard<std::mutex> lock(slot->mutex);
    SwapRecord& record = slot->record;

    if (slot->in_flight) return errors::TRANSITION_IN_PROGRESS;
    if (record.status != SwapStatus::BRIDGING_BACK) {
        return errors::INVALID_STATE_TRANSITION;
    }

    record.status = SwapStatus::COMPLETED;
    record.completed_at = std::max(clock_(), record.initiated_at);
    record_terminal(record);

    log::get()->info("swap {:016x} completed in {}s",
                     swap_id, record.completed_at - record.initiated_at);
    return errors::OK;
}

int32_t SwapOrchestrator::emergency_recovery(const Address& caller, SwapId swap_id) {
    auto slot = find_slot(swap_id);
    if (!slot) return errors::SWAP_NOT_FOUND;

    uint64_t now = clock_();
    SwapRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        SwapRecord& record = slot->record;

        if (is_terminal(record.status)) return errors::SWAP_NOT_ACTIVE;
        if (slot->in_flight) return errors::TRANSITION_IN_PROGRESS;

        if (!access_->is_admin(caller)) {
            if (caller != record.user) {
                return errors::UNAUTHORIZED;
            }
            uint64_t elapsed = now > record.initiated_at ? now - record.initiated_at : 0;
            if (elapsed <= params_.recovery_timeout) {
                return errors::RECOVERY_TOO_EARLY;
            }
        }

        slot->in_flight = true;
        snapshot = record;
    }

    log::get()->warn("swap {:016x} emergency recovery by {} from {}",
                     swap_id, address_to_hex(caller), to_string(snapshot.status));

    std::string reference = snapshot.bridge_reference_id;
    SwapStatus leg;
    int32_t rc;
    if (snapshot.status == SwapStatus::BRIDGING_BACK) {
        // The output is already travelling home; only a failed leg needs action
        leg = SwapStatus::BRIDGING_BACK;
        BridgeStatus status{false, false, 0};
        rc = bridge_status(reference, status);
        if (rc == errors::OK && status.failed) {
            rc = errors::BRIDGE_FAILED;
        }
    } else {
        // Refund the input on the source chain
        leg = SwapStatus::RECOVERED;
        rc = send_refund(snapshot, reference);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    SwapRecord& record = slot->record;
    slot->in_flight = false;
    if (rc != errors::OK) {
        mark_failed(record, rc, leg);
        return errors::BRIDGE_FAILED;
    }

    record.status = SwapStatus::RECOVERED;
    record.completed_at = std::max(now, record.initiated_at);
    record.bridge_reference_id = reference;
    record_terminal(record);
    return errors::OK;
}

int32_t SwapOrchestrator::retry(const Address& caller, SwapId swap_id) {
    if (!access_->is_admin(caller)) return errors::UNAUTHORIZED;

    auto slot = find_slot(swap_id);
    if (!slot) return errors::SWAP_NOT_FOUND;

    SwapRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        SwapRecord& record = slot->record;

        if (slot->in_flight) return errors::TRANSITION_IN_PROGRESS;
        if (record.status != SwapStatus::FAILED) {
            return errors::INVALID_STATE_TRANSITION;
        }

        record_retried(record);
        record.failure_code = errors::OK;
        record.completed_at = 0;

        if (record.failed_leg == SwapStatus::SWAPPING) {
            // Input is still on the destination chain, awaiting another execution
            record.status = SwapStatus::BRIDGING;
            record.amount_out_x18 = 0;
            record.failed_leg = SwapStatus::INITIATED;
            log::get()->warn("swap {:016x} reopened for destination execution by {}",
                             swap_id, address_to_hex(caller));
            return errors::OK;
        }

        record.status = record.failed_leg == SwapStatus::BRIDGING_BACK ?
            SwapStatus::SWAPPING : SwapStatus::BRIDGING;
        slot->in_flight = true;
        snapshot = record;
    }

    log::get()->warn("swap {:016x} retrying {} leg by {}",
                     swap_id, to_string(snapshot.failed_leg), address_to_hex(caller));

    std::string reference;
    int32_t rc;
    SwapStatus next;
    switch (snapshot.failed_leg) {
        case SwapStatus::BRIDGING_BACK:
            rc = send_return(snapshot, reference);
            next = SwapStatus::BRIDGING_BACK;
            break;
        case SwapStatus::RECOVERED:
            rc = send_refund(snapshot, reference);
            next = SwapStatus::RECOVERED;
            break;
        default:
            rc = send_outbound(snapshot, reference);
            next = SwapStatus::BRIDGING;
            break;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    SwapRecord& record = slot->record;
    slot->in_flight = false;
    if (rc != errors::OK) {
        mark_failed(record, rc, next);
        return errors::BRIDGE_FAILED;
    }

    record.status = next;
    record.failed_leg = SwapStatus::INITIATED;
    record.bridge_reference_id = reference;
    if (next == SwapStatus::RECOVERED) {
        record.completed_at = std::max(clock_(), record.initiated_at);
        record_terminal(record);
    }
    return errors::OK;
}

int32_t SwapOrchestrator::sync_bridge_status(SwapId swap_id) {
    auto slot = find_slot(swap_id);
    if (!slot) return errors::SWAP_NOT_FOUND;

    std::string reference;
    SwapStatus leg;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        const SwapRecord& record = slot->record;

        if (slot->in_flight) return errors::TRANSITION_IN_PROGRESS;
        if (record.status != SwapStatus::BRIDGING &&
            record.status != SwapStatus::BRIDGING_BACK) {
            return errors::INVALID_STATE_TRANSITION;
        }
        reference = record.bridge_reference_id;
        leg = record.status;
        slot->in_flight = true;
    }

    BridgeStatus status{false, false, 0};
    int32_t rc = bridge_status(reference, status);
    if (rc == errors::OK && status.failed) {
        rc = errors::BRIDGE_FAILED;
    }
    if (rc == errors::OK && status.completed) {
        log::get()->info("swap {:016x} {} leg delivered {}",
                         swap_id, to_string(leg), x18::to_string(status.filled_amount_x18));
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->in_flight = false;
    if (rc != errors::OK) {
        mark_failed(slot->record, rc, leg);
        return errors::BRIDGE_FAILED;
    }
    return errors::OK;
}

// =============================================================================
// Administration
// =============================================================================

int32_t SwapOrchestrator::pause(const Address& caller) {
    if (!access_->is_admin(caller)) return errors::UNAUTHORIZED;
    paused_.store(true, std::memory_order_release);
    log::get()->warn("operations paused by {}", address_to_hex(caller));
    return errors::OK;
}

int32_t SwapOrchestrator::unpause(const Address& caller) {
    if (!access_->is_admin(caller)) return errors::UNAUTHORIZED;
    paused_.store(false, std::memory_order_release);
    log::get()->info("operations resumed by {}", address_to_hex(caller));
    return errors::OK;
}

int32_t SwapOrchestrator::set_thresholds(const Address& caller, const Thresholds& thresholds) {
    if (!access_->is_admin(caller)) return errors::UNAUTHORIZED;
    if (thresholds.min_savings_bps > BPS_DENOMINATOR ||
        thresholds.min_absolute_savings_usd_x18 < 0) {
        return errors::INVALID_PARAMETER;
    }

    std::unique_lock lock(config_mutex_);
    thresholds_ = thresholds;
    log::get()->info("thresholds updated: {}bps ${} {}s",
                     thresholds.min_savings_bps,
                     x18::to_string(thresholds.min_absolute_savings_usd_x18),
                     thresholds.max_bridge_time_seconds);
    return errors::OK;
}

Thresholds SwapOrchestrator::thresholds() const {
    std::shared_lock lock(config_mutex_);
    return thresholds_;
}

int32_t SwapOrchestrator::set_user_preferences(const Address& caller, const Address& user,
                                               const UserPreferences& prefs) {
    if (is_zero(user)) return errors::INVALID_USER;
    if (caller != user) return errors::UNAUTHORIZED;
    if (prefs.min_savings_bps > BPS_DENOMINATOR || prefs.min_absolute_savings_usd_x18 < 0) {
        return errors::INVALID_PARAMETER;
    }

    std::unique_lock lock(config_mutex_);
    preferences_[user] = prefs;
    return errors::OK;
}

int32_t SwapOrchestrator::clear_user_preferences(const Address& caller, const Address& user) {
    if (caller != user) return errors::UNAUTHORIZED;

    std::unique_lock lock(config_mutex_);
    preferences_.erase(user);
    return errors::OK;
}

std::optional<UserPreferences> SwapOrchestrator::user_preferences(const Address& user) const {
    std::shared_lock lock(config_mutex_);
    auto it = preferences_.find(user);
    if (it == preferences_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Read Paths
// =============================================================================

std::optional<SwapRecord> SwapOrchestrator::get_swap(SwapId swap_id) const {
    auto slot = find_slot(swap_id);
    if (!slot) return std::nullopt;

    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->record;
}

std::vector<SwapId> SwapOrchestrator::user_swaps(const Address& user) const {
    std::shared_lock lock(swaps_mutex_);
    auto it = user_index_.find(user);
    if (it == user_index_.end()) return {};
    return it->second;
}

std::vector<SwapId> SwapOrchestrator::active_swaps(const Address& user) const {
    std::vector<std::shared_ptr<SwapSlot>> slots;
    {
        std::shared_lock lock(swaps_mutex_);
        auto it = user_index_.find(user);
        if (it == user_index_.end()) return {};
        for (SwapId id : it->second) {
            slots.push_back(swaps_.at(id));
        }
    }

    std::vector<SwapId> active;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!is_terminal(slot->record.status)) {
            active.push_back(slot->record.swap_id);
        }
    }
    return active;
}

SwapStats SwapOrchestrator::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return to_stats(global_stats_);
}

SwapStats SwapOrchestrator::chain_stats(ChainId chain_id) const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    auto it = chain_stats_.find(chain_id);
    if (it == chain_stats_.end()) return to_stats(StatsAccumulator{});
    return to_stats(it->second);
}

// =============================================================================
// Internal Helpers
// =============================================================================

std::shared_ptr<SwapOrchestrator::SwapSlot> SwapOrchestrator::find_slot(SwapId swap_id) const {
    std::shared_lock lock(swaps_mutex_);
    auto it = swaps_.find(swap_id);
    if (it == swaps_.end()) return nullptr;
    return it->second;
}

SwapDigest SwapOrchestrator::derive_swap_digest(const InitiateParams& params, uint64_t now,
                                                uint64_t nonce) const {
    std::vector<uint8_t> preimage;
    preimage.reserve(3 * 20 + 16 + 5 * 8);
    auto put_u64 = [&preimage](uint64_t v) {
        for (int i = 7; i >= 0; --i) preimage.push_back(static_cast<uint8_t>(v >> (8 * i)));
    };

    preimage.insert(preimage.end(), params.user.begin(), params.user.end());
    preimage.insert(preimage.end(), params.token_in.addr.begin(), params.token_in.addr.end());
    preimage.insert(preimage.end(), params.token_out.addr.begin(), params.token_out.addr.end());
    U128 amount = static_cast<U128>(params.amount_in_x18);
    put_u64(static_cast<uint64_t>(amount >> 64));
    put_u64(static_cast<uint64_t>(amount));
    put_u64(params_.local_chain);
    put_u64(params.destination_chain);
    put_u64(params.deadline);
    put_u64(now);
    put_u64(nonce);

    SwapDigest digest{};
    unsigned int length = 0;
    if (EVP_Digest(preimage.data(), preimage.size(), digest.data(), &length,
                   EVP_sha256(), nullptr) != 1 || length != digest.size()) {
        throw std::runtime_error("SwapOrchestrator: SHA-256 digest failed");
    }
    return digest;
}

void SwapOrchestrator::mark_failed(SwapRecord& record, int32_t code, SwapStatus leg) {
    record.status = SwapStatus::FAILED;
    record.failure_code = code;
    record.failed_leg = leg;
    record.completed_at = std::max(clock_(), record.initiated_at);
    record_terminal(record);

    log::get()->error("swap {:016x} failed on {} leg: {}",
                      record.swap_id, to_string(leg), errors::to_string(code));
}

void SwapOrchestrator::record_initiated(ChainId destination_chain) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    global_stats_.total++;
    chain_stats_[destination_chain].total++;
}

void SwapOrchestrator::record_terminal(const SwapRecord& record) {
    std::lock_guard<std::mutex> lock(stats_mutex_);

    for (StatsAccumulator* acc : {&global_stats_, &chain_stats_[record.destination_chain]}) {
        switch (record.status) {
            case SwapStatus::COMPLETED:
                acc->successful++;
                acc->total_execution_time += record.completed_at - record.initiated_at;
                acc->total_savings_x18 += record.expected_savings_usd_x18;
                break;
            case SwapStatus::FAILED:
                acc->failed++;
                break;
            case SwapStatus::RECOVERED:
                acc->recovered++;
                break;
            default:
                break;
        }
    }
}

void SwapOrchestrator::record_retried(const SwapRecord& record) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    for (StatsAccumulator* acc : {&global_stats_, &chain_stats_[record.destination_chain]}) {
        if (acc->failed > 0) acc->failed--;
    }
}

int32_t SwapOrchestrator::bridge_transfer(const Address& depositor, const Address& recipient,
                                          const Token& token, I128 amount_x18,
                                          ChainId destination_chain,
                                          const std::vector<uint8_t>& message,
                                          std::string& reference_id) {
    if (!bridge_) {
        return errors::BRIDGE_TRANSPORT;
    }

    try {
        reference_id = bridge_->transfer(depositor, recipient, token, amount_x18,
                                         destination_chain, message);
    } catch (const BridgeError& e) {
        log::get()->error("bridge transfer to chain {} failed ({}): {}",
                          destination_chain, errors::to_string(e.code()), e.what());
        return e.code();
    } catch (const std::exception& e) {
        log::get()->error("bridge transfer to chain {} failed: {}", destination_chain, e.what());
        return errors::BRIDGE_TRANSPORT;
    } catch (...) {
        log::get()->error("bridge transfer to chain {} failed: unknown exception",
                          destination_chain);
        return errors::BRIDGE_TRANSPORT;
    }
    return errors::OK;
}

int32_t SwapOrchestrator::bridge_status(const std::string& reference_id, BridgeStatus& status) {
    if (!bridge_) {
        return errors::BRIDGE_TRANSPORT;
    }

    try {
        status = bridge_->status(reference_id);
    } catch (const BridgeError& e) {
        log::get()->error("bridge status for {} failed ({}): {}",
                          reference_id, errors::to_string(e.code()), e.what());
        return e.code();
    } catch (const std::exception& e) {
        log::get()->error("bridge status for {} failed: {}", reference_id, e.what());
        return errors::BRIDGE_TRANSPORT;
    } catch (...) {
        log::get()->error("bridge status for {} failed: unknown exception", reference_id);
        return errors::BRIDGE_TRANSPORT;
    }
    return errors::OK;
}

int32_t SwapOrchestrator::bridge_quote(const Token& token, I128 amount_x18,
                                       ChainId destination_chain, BridgeQuote& quote) const {
    if (!bridge_) {
        return errors::BRIDGE_TRANSPORT;
    }

    try {
        quote = bridge_->quote(token, amount_x18, destination_chain);
    } catch (const BridgeError& e) {
        log::get()->warn("bridge quote to chain {} failed ({}): {}",
                         destination_chain, errors::to_string(e.code()), e.what());
        return e.code();
    } catch (const std::exception& e) {
        log::get()->warn("bridge quote to chain {} failed: {}", destination_chain, e.what());
        return errors::BRIDGE_TRANSPORT;
    } catch (...) {
        log::get()->warn("bridge quote to chain {} failed: unknown exception", destination_chain);
        return errors::BRIDGE_TRANSPORT;
    }
    return errors::OK;
}

int32_t SwapOrchestrator::send_outbound(const SwapRecord& record, std::string& reference_id) {
    const Address recipient = is_zero(params_.escrow) ? record.user : params_.escrow;
    return bridge_transfer(record.user, recipient, record.token_in, record.amount_in_x18,
                           record.destination_chain,
                           encode_message(record, SwapStatus::BRIDGING), reference_id);
}

int32_t SwapOrchestrator::send_return(const SwapRecord& record, std::string& reference_id) {
    const Address depositor = is_zero(params_.escrow) ? record.user : params_.escrow;
    return bridge_transfer(depositor, record.user, record.token_out, record.amount_out_x18,
                           record.source_chain,
                           encode_message(record, SwapStatus::BRIDGING_BACK), reference_id);
}

int32_t SwapOrchestrator::send_refund(const SwapRecord& record, std::string& reference_id) {
    const Address depositor = is_zero(params_.escrow) ? record.user : params_.escrow;
    return bridge_transfer(depositor, record.user, record.token_in, record.amount_in_x18,
                           record.source_chain,
                           encode_message(record, SwapStatus::RECOVERED), reference_id);
}

SwapStats SwapOrchestrator::to_stats(const StatsAccumulator& acc) {
    return SwapStats{
        acc.total,
        acc.successful,
        acc.failed,
        acc.recovered,
        acc.successful > 0 ? acc.total_execution_time / acc.successful : 0,
        acc.total_savings_x18
    };
}

SwapId SwapOrchestrator::swap_id_from(const SwapDigest& digest) {
    SwapId id = 0;
    for (int i = 0; i < 8; ++i) {
        id = (id << 8) | digest[i];
    }
    return id;
}

std::vector<uint8_t> SwapOrchestrator::encode_message(const SwapRecord& record, SwapStatus leg) {
    // [digest: 32 bytes][leg: 1 byte]
    std::vector<uint8_t> message(record.digest.begin(), record.digest.end());
    message.push_back(static_cast<uint8_t>(leg));
    return message;
}

} // namespace gasopt
