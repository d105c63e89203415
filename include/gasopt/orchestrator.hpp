#ifndef GASOPT_ORCHESTRATOR_HPP
#define GASOPT_ORCHESTRATOR_HPP

#include <array>
#include <map>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <optional>
#include <memory>
#include <atomic>
#include <string>
#include <vector>

#include "types.hpp"
#include "access.hpp"
#include "chain_registry.hpp"
#include "clients.hpp"
#include "cost_model.hpp"

namespace gasopt {

using SwapId = uint64_t;

// SHA-256 over the swap contents; the SwapId is its leading 8 bytes
using SwapDigest = std::array<uint8_t, 32>;

// =============================================================================
// Swap State Machine
// =============================================================================

enum class SwapStatus : uint8_t {
    INITIATED = 0,
    BRIDGING = 1,
    SWAPPING = 2,
    BRIDGING_BACK = 3,
    COMPLETED = 4,
    FAILED = 5,
    RECOVERED = 6
};

const char* to_string(SwapStatus status);

inline bool is_terminal(SwapStatus status) {
    return status == SwapStatus::COMPLETED ||
           status == SwapStatus::FAILED ||
           status == SwapStatus::RECOVERED;
}

struct SwapRecord {
    SwapId swap_id;
    SwapDigest digest;
    Address user;
    Token token_in;
    Token token_out;
    I128 amount_in_x18;
    I128 min_amount_out_x18;
    I128 amount_out_x18;           // 0 until the destination swap executes
    ChainId source_chain;
    ChainId destination_chain;
    uint64_t initiated_at;
    uint64_t completed_at;         // 0 until terminal
    SwapStatus status;
    std::string bridge_reference_id;
    int32_t failure_code;          // What drove FAILED, OK otherwise
    SwapStatus failed_leg;         // Leg behind FAILED, INITIATED otherwise
    I128 expected_savings_usd_x18;
};

// =============================================================================
// Thresholds & Preferences
// =============================================================================

struct Thresholds {
    uint32_t min_savings_bps = 500;                        // 5%
    I128 min_absolute_savings_usd_x18 = 10 * X18_ONE;      // $10
    uint32_t max_bridge_time_seconds = 1800;
};

struct UserPreferences {
    uint32_t min_savings_bps = 500;
    I128 min_absolute_savings_usd_x18 = 10 * X18_ONE;
    uint32_t max_bridge_time_seconds = 1800;
    bool optimization_enabled = true;
};

struct OrchestratorParams {
    ChainId local_chain = 0;               // Chain this core executes on
    uint64_t recovery_timeout = 3600;      // seconds before user self-recovery
    Address escrow;                        // Depositor for outgoing bridge legs
};

// =============================================================================
// Requests & Results
// =============================================================================

// Caller-supplied description of a swap before any chain decision
struct SwapIntent {
    Address user;
    Token token_in;
    Token token_out;
    I128 amount_in_x18;            // USD-equivalent notional
    I128 min_amount_out_x18;
    uint64_t deadline;
    std::vector<ChainId> exclude_chains;
};

// Explicit cross-chain swap toward a chosen destination
struct InitiateParams {
    Address user;
    Token token_in;
    Token token_out;
    I128 amount_in_x18;
    I128 min_amount_out_x18;
    uint64_t deadline;
    ChainId destination_chain;
    I128 expected_savings_usd_x18 = 0;
};

struct OptimizationQuote {
    int32_t status;                // Cause when should_optimize is forced false
    ChainId original_chain;
    ChainId optimized_chain;
    I128 savings_usd_x18;
    uint32_t savings_bps;
    uint32_t estimated_bridge_time;
    bool should_optimize;
    I128 baseline_cost_usd_x18;
    I128 optimized_cost_usd_x18;

    bool ok() const { return status == errors::OK; }

    bool operator==(const OptimizationQuote& other) const {
        return status == other.status &&
               original_chain == other.original_chain &&
               optimized_chain == other.optimized_chain &&
               savings_usd_x18 == other.savings_usd_x18 &&
               savings_bps == other.savings_bps &&
               estimated_bridge_time == other.estimated_bridge_time &&
               should_optimize == other.should_optimize &&
               baseline_cost_usd_x18 == other.baseline_cost_usd_x18 &&
               optimized_cost_usd_x18 == other.optimized_cost_usd_x18;
    }
};

struct InitiateResult {
    int32_t status;
    SwapId swap_id;                // Set whenever a record was created
    ChainId destination_chain;
    bool executed_locally;         // execute() chose not to bridge

    bool ok() const { return status == errors::OK; }
};

struct DestinationSwapResult {
    bool success;
    I128 amount_out_x18;
};

struct SwapStats {
    uint64_t total_swaps;
    uint64_t successful_swaps;
    uint64_t failed_swaps;
    uint64_t recovered_swaps;
    uint64_t average_execution_time;   // seconds, successful swaps only
    I128 total_savings_usd_x18;
};

// =============================================================================
// SwapOrchestrator - Cross-chain swap state machine
// =============================================================================

class SwapOrchestrator {
public:
    SwapOrchestrator(std::shared_ptr<const ChainRegistry> registry,
                     std::shared_ptr<const CostModel> cost_model,
                     std::shared_ptr<const AccessControl> access,
                     std::shared_ptr<BridgeClient> bridge,
                     OrchestratorParams params,
                     Thresholds thresholds = {},
                     TimeSource clock = system_time);
    ~SwapOrchestrator() = default;

    // Non-copyable
    SwapOrchestrator(const SwapOrchestrator&) = delete;
    SwapOrchestrator& operator=(const SwapOrchestrator&) = delete;

    // =========================================================================
    // Query Surface (side-effect free)
    // =========================================================================

    OptimizationQuote quote(const SwapIntent& intent) const;

    // =========================================================================
    // Transitions
    // =========================================================================

    // Quote, then bridge if worth it; otherwise report local execution
    InitiateResult execute(const SwapIntent& intent);

    InitiateResult initiate(const InitiateParams& params);

    int32_t handle_destination_swap(SwapId swap_id, const DestinationSwapResult& result);

    int32_t complete(SwapId swap_id);

    // From BRIDGING refunds amount_in on the source chain. From BRIDGING_BACK
    // the return leg is already carrying amount_out, so nothing is re-sent.
    int32_t emergency_recovery(const Address& caller, SwapId swap_id);

    // Admin only: re-run the leg that failed a FAILED swap
    int32_t retry(const Address& caller, SwapId swap_id);

    // Polls the bridge for an in-flight leg; a reported failure fails the swap
    int32_t sync_bridge_status(SwapId swap_id);

    // =========================================================================
    // Administration
    // =========================================================================

    int32_t pause(const Address& caller);
    int32_t unpause(const Address& caller);
    bool is_paused() const { return paused_.load(std::memory_order_acquire); }

    int32_t set_thresholds(const Address& caller, const Thresholds& thresholds);
    Thresholds thresholds() const;

    // Only the user may change their own preferences
    int32_t set_user_preferences(const Address& caller, const Address& user,
                                 const UserPreferences& prefs);
    int32_t clear_user_preferences(const Address& caller, const Address& user);
    std::optional<UserPreferences> user_preferences(const Address& user) const;

    // =========================================================================
    // Read Paths
    // =========================================================================

    std::optional<SwapRecord> get_swap(SwapId swap_id) const;
    std::vector<SwapId> user_swaps(const Address& user) const;
    std::vector<SwapId> active_swaps(const Address& user) const;

    SwapStats stats() const;
    SwapStats chain_stats(ChainId chain_id) const;

    const OrchestratorParams& params() const noexcept { return params_; }

private:
    std::shared_ptr<const ChainRegistry> registry_;
    std::shared_ptr<const CostModel> cost_model_;
    std::shared_ptr<const AccessControl> access_;
    std::shared_ptr<BridgeClient> bridge_;
    OrchestratorParams params_;
    TimeSource clock_;

    std::atomic<bool> paused_{false};

    Thresholds thresholds_;
    std::unordered_map<Address, UserPreferences, AddressHash> preferences_;
    mutable std::shared_mutex config_mutex_;

    // One slot per swap; the slot mutex serializes transitions on that swap
    struct SwapSlot {
        std::mutex mutex;
        SwapRecord record;
        bool in_flight = false;   // Claimed by a transition awaiting bridge I/O
    };
    std::unordered_map<SwapId, std::shared_ptr<SwapSlot>> swaps_;
    std::unordered_map<Address, std::vector<SwapId>, AddressHash> user_index_;
    mutable std::shared_mutex swaps_mutex_;

    std::atomic<uint64_t> nonce_{0};

    // Statistics
    struct StatsAccumulator {
        uint64_t total = 0;
        uint64_t successful = 0;
        uint64_t failed = 0;
        uint64_t recovered = 0;
        uint64_t total_execution_time = 0;
        I128 total_savings_x18 = 0;
    };
    StatsAccumulator global_stats_;
    std::map<ChainId, StatsAccumulator> chain_stats_;
    mutable std::mutex stats_mutex_;

    std::shared_ptr<SwapSlot> find_slot(SwapId swap_id) const;

    SwapDigest derive_swap_digest(const InitiateParams& params, uint64_t now,
                                  uint64_t nonce) const;

    // Commit helpers, called with the slot mutex held
    void mark_failed(SwapRecord& record, int32_t code, SwapStatus leg);
    void record_terminal(const SwapRecord& record);
    void record_initiated(ChainId destination_chain);
    void record_retried(const SwapRecord& record);

    // Bridge calls with every exception mapped to an error code
    int32_t bridge_transfer(const Address& depositor, const Address& recipient,
                            const Token& token, I128 amount_x18, ChainId destination_chain,
                            const std::vector<uint8_t>& message, std::string& reference_id);
    int32_t bridge_status(const std::string& reference_id, BridgeStatus& status);
    int32_t bridge_quote(const Token& token, I128 amount_x18, ChainId destination_chain,
                         BridgeQuote& quote) const;

    // Outgoing legs, run with the slot claimed
    int32_t send_outbound(const SwapRecord& record, std::string& reference_id);
    int32_t send_return(const SwapRecord& record, std::string& reference_id);
    int32_t send_refund(const SwapRecord& record, std::string& reference_id);

    static SwapStats to_stats(const StatsAccumulator& acc);
    static SwapId swap_id_from(const SwapDigest& digest);
    static std::vector<uint8_t> encode_message(const SwapRecord& record, SwapStatus leg);
};

} // namespace gasopt

#endif // GASOPT_ORCHESTRATOR_HPP
