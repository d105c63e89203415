#ifndef GASOPT_ORACLE_HPP
#define GASOPT_ORACLE_HPP

#include <unordered_map>
#include <shared_mutex>
#include <optional>
#include <vector>
#include <atomic>
#include <memory>

#include "types.hpp"
#include "access.hpp"
#include "chain_registry.hpp"
#include "clients.hpp"

namespace gasopt {

// =============================================================================
// Gas Price Sample & History
// =============================================================================

struct GasPriceSample {
    uint64_t price;        // wei per gas unit
    uint64_t observed_at;  // seconds
};

// Fixed-capacity ring buffer, overwrite-oldest
class GasHistory {
public:
    explicit GasHistory(size_t capacity);

    void push(const GasPriceSample& sample);

    size_t size() const { return count_; }
    size_t capacity() const { return slots_.size(); }
    bool empty() const { return count_ == 0; }

    // i = 0 is the oldest populated entry
    const GasPriceSample& at(size_t i) const;

    // Last `n` entries, oldest first (n clamped to size)
    std::vector<GasPriceSample> latest(size_t n) const;

private:
    std::vector<GasPriceSample> slots_;
    size_t head_ = 0;   // Next write position
    size_t count_ = 0;
};

// =============================================================================
// Oracle Parameters
// =============================================================================

struct OracleParams {
    uint64_t min_gas_price = 1;                        // wei
    uint64_t max_gas_price = 10000000000000ULL;        // 10,000 gwei
    uint64_t staleness_threshold = 600;                // seconds
    uint64_t feed_max_age = 3600;                      // seconds
    size_t history_capacity = 24;
};

// =============================================================================
// Query Results
// =============================================================================

struct GasPriceReading {
    int32_t status;
    uint64_t price;
    uint64_t observed_at;

    bool ok() const { return status == errors::OK; }
};

struct UsdGasPrice {
    int32_t status;
    I128 usd_per_gas_x18;   // USD cost of one gas unit
    I128 native_usd_x18;    // USD per native token used for the conversion
    uint64_t gas_price;     // wei, the sample the conversion used
    uint64_t observed_at;

    bool ok() const { return status == errors::OK; }
};

struct GasTrend {
    int32_t status;
    uint64_t avg;
    uint64_t min;
    uint64_t max;
    uint64_t volatility;   // Population standard deviation, wei
    bool is_increasing;
    size_t samples;

    bool ok() const { return status == errors::OK; }
};

enum class Congestion : uint8_t {
    UNKNOWN = 0,
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3,
    CRITICAL = 4
};

const char* to_string(Congestion level);

// =============================================================================
// GasPriceOracle - Per-chain gas prices from the keeper
// =============================================================================

class GasPriceOracle {
public:
    GasPriceOracle(std::shared_ptr<const ChainRegistry> registry,
                   std::shared_ptr<const AccessControl> access,
                   std::shared_ptr<PriceFeedClient> feed,
                   OracleParams params = {},
                   TimeSource clock = system_time);
    ~GasPriceOracle() = default;

    // Non-copyable
    GasPriceOracle(const GasPriceOracle&) = delete;
    GasPriceOracle& operator=(const GasPriceOracle&) = delete;

    // =========================================================================
    // Keeper Updates
    // =========================================================================

    int32_t update(const Address& caller, ChainId chain_id, uint64_t price);

    // Each update is applied independently; returns the first failure code
    int32_t update_batch(const Address& caller,
                         const std::vector<std::pair<ChainId, uint64_t>>& updates);

    // =========================================================================
    // Queries
    // =========================================================================

    GasPriceReading get(ChainId chain_id) const;

    // Calls the price feed; never holds a lock across it
    UsdGasPrice get_usd(ChainId chain_id) const;

    // window = 0 means the whole populated history
    GasTrend trend(ChainId chain_id, size_t window) const;

    Congestion congestion(ChainId chain_id) const;

    std::vector<GasPriceSample> history(ChainId chain_id) const;

    // =========================================================================
    // Staleness
    // =========================================================================

    bool is_fresh(ChainId chain_id) const;
    uint64_t price_age(ChainId chain_id) const;

    // =========================================================================
    // Administration
    // =========================================================================

    int32_t set_params(const Address& caller, const OracleParams& params);
    OracleParams params() const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_chains;
        uint64_t total_updates;
        uint64_t stale_chains;
    };
    Stats get_stats() const;

private:
    std::shared_ptr<const ChainRegistry> registry_;
    std::shared_ptr<const AccessControl> access_;
    std::shared_ptr<PriceFeedClient> feed_;
    TimeSource clock_;

    OracleParams params_;
    mutable std::shared_mutex params_mutex_;

    struct ChainPrices {
        GasPriceSample latest;
        GasHistory history;

        explicit ChainPrices(size_t capacity) : latest{0, 0}, history(capacity) {}
    };
    std::unordered_map<ChainId, ChainPrices> prices_;
    mutable std::shared_mutex prices_mutex_;

    std::atomic<uint64_t> total_updates_{0};

    std::optional<GasPriceSample> latest_sample(ChainId chain_id) const;
};

} // namespace gasopt

#endif // GASOPT_ORACLE_HPP
