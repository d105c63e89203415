// =============================================================================
// oracle.cpp - GasPriceOracle Per-Chain Gas Price Tracking
// =============================================================================

#include "gasopt/oracle.hpp"
#include "gasopt/log.hpp"
#include <algorithm>
#include <limits>

namespace gasopt {

// =============================================================================
// GasHistory
// =============================================================================

GasHistory::GasHistory(size_t capacity)
    : slots_(std::max<size_t>(capacity, 1), GasPriceSample{0, 0}) {}

void GasHistory::push(const GasPriceSample& sample) {
    slots_[head_] = sample;
    head_ = (head_ + 1) % slots_.size();
    if (count_ < slots_.size()) {
        count_++;
    }
}

const GasPriceSample& GasHistory::at(size_t i) const {
    // Oldest entry sits `count_` slots behind the write head
    size_t start = (head_ + slots_.size() - count_) % slots_.size();
    return slots_[(start + i) % slots_.size()];
}

std::vector<GasPriceSample> GasHistory::latest(size_t n) const {
    n = std::min(n, count_);
    std::vector<GasPriceSample> result;
    result.reserve(n);
    for (size_t i = count_ - n; i < count_; ++i) {
        result.push_back(at(i));
    }
    return result;
}

const char* to_string(Congestion level) {
    switch (level) {
        case Congestion::UNKNOWN: return "unknown";
        case Congestion::LOW: return "low";
        case Congestion::MEDIUM: return "medium";
        case Congestion::HIGH: return "high";
        case Congestion::CRITICAL: return "critical";
    }
    return "unknown";
}

// =============================================================================
// Constructor
// =============================================================================

GasPriceOracle::GasPriceOracle(std::shared_ptr<const ChainRegistry> registry,
                               std::shared_ptr<const AccessControl> access,
                               std::shared_ptr<PriceFeedClient> feed,
                               OracleParams params,
                               TimeSource clock)
    : registry_(std::move(registry)),
      access_(std::move(access)),
      feed_(std::move(feed)),
      clock_(std::move(clock)),
      params_(params) {}

// =============================================================================
// Keeper Updates
// =============================================================================

int32_t GasPriceOracle::update(const Address& caller, ChainId chain_id, uint64_t price) {
    if (!access_->is_keeper(caller)) {
        log::get()->warn("gas price update for chain {} rejected: caller {} is not the keeper",
                         chain_id, address_to_hex(caller));
        return errors::UNAUTHORIZED;
    }
    if (!registry_->chain_exists(chain_id)) {
        return errors::UNKNOWN_CHAIN;
    }

    OracleParams p = params();
    if (price < p.min_gas_price || price > p.max_gas_price) {
        log::get()->warn("gas price {} for chain {} outside [{}, {}]",
                         price, chain_id, p.min_gas_price, p.max_gas_price);
        return errors::GAS_PRICE_OUT_OF_BOUNDS;
    }

    uint64_t now = clock_();

    std::unique_lock lock(prices_mutex_);

    auto it = prices_.find(chain_id);
    if (it == prices_.end()) {
        it = prices_.emplace(chain_id, ChainPrices(p.history_capacity)).first;
    }

    ChainPrices& chain = it->second;
    if (now < chain.latest.observed_at) {
        return errors::NON_MONOTONIC_TIMESTAMP;
    }

    chain.latest = GasPriceSample{price, now};
    chain.history.push(chain.latest);

    total_updates_.fetch_add(1, std::memory_order_relaxed);

    log::get()->debug("gas price chain={} price={} at={}", chain_id, price, now);
    return errors::OK;
}

int32_t GasPriceOracle::update_batch(const Address& caller,
                                     const std::vector<std::pair<ChainId, uint64_t>>& updates) {
    int32_t first_error = errors::OK;
    for (const auto& [chain_id, price] : updates) {
        int32_t rc = update(caller, chain_id, price);
        if (rc != errors::OK && first_error == errors::OK) {
            first_error = rc;
        }
    }
    return first_error;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<GasPriceSample> GasPriceOracle::latest_sample(ChainId chain_id) const {
    std::shared_lock lock(prices_mutex_);
    auto it = prices_.find(chain_id);
    if (it == prices_.end()) return std::nullopt;
    return it->second.latest;
}

GasPriceReading GasPriceOracle::get(ChainId chain_id) const {
    if (!registry_->chain_exists(chain_id)) {
        return GasPriceReading{errors::UNKNOWN_CHAIN, 0, 0};
    }

    auto sample = latest_sample(chain_id);
    if (!sample) {
        return GasPriceReading{errors::UNKNOWN_CHAIN, 0, 0};
    }

    return GasPriceReading{errors::OK, sample->price, sample->observed_at};
}

UsdGasPrice GasPriceOracle::get_usd(ChainId chain_id) const {
    UsdGasPrice result{errors::OK, 0, 0, 0, 0};

    auto chain = registry_->get_chain(chain_id);
    auto sample = latest_sample(chain_id);
    if (!chain || !sample) {
        result.status = errors::UNKNOWN_CHAIN;
        return result;
    }
    result.gas_price = sample->price;
    result.observed_at = sample->observed_at;

    OracleParams p = params();
    uint64_t now = clock_();

    if (now > sample->observed_at && now - sample->observed_at > p.staleness_threshold) {
        result.status = errors::STALE_PRICE;
        return result;
    }

    if (!feed_) {
        result.status = errors::PRICE_FEED_UNAVAILABLE;
        return result;
    }

    UsdPrice native;
    try {
        native = feed_->get_usd_price(chain->native_asset_id);
    } catch (const std::exception& e) {
        log::get()->warn("price feed unavailable for asset {}: {}",
                         chain->native_asset_id, e.what());
        result.status = errors::PRICE_FEED_UNAVAILABLE;
        return result;
    }

    if (native.price_x18 <= 0) {
        result.status = errors::PRICE_FEED_UNAVAILABLE;
        return result;
    }
    if (now > native.updated_at && now - native.updated_at > p.feed_max_age) {
        log::get()->warn("price feed for asset {} stale: updated_at={} now={}",
                         chain->native_asset_id, native.updated_at, now);
        result.status = errors::PRICE_FEED_UNAVAILABLE;
        return result;
    }

    // wei * (USD per 1e18 wei) / 1e18
    result.usd_per_gas_x18 = x18::mul(static_cast<I128>(sample->price), native.price_x18);
    result.native_usd_x18 = native.price_x18;
    return result;
}

GasTrend GasPriceOracle::trend(ChainId chain_id, size_t window) const {
    GasTrend result{errors::OK, 0, 0, 0, 0, false, 0};

    std::vector<GasPriceSample> samples;
    {
        std::shared_lock lock(prices_mutex_);
        auto it = prices_.find(chain_id);
        if (it == prices_.end() || it->second.history.empty()) {
            result.status = errors::UNKNOWN_CHAIN;
            return result;
        }
        const GasHistory& history = it->second.history;
        samples = history.latest(window == 0 ? history.size() : window);
    }

    size_t n = samples.size();
    U128 sum = 0;
    uint64_t lo = std::numeric_limits<uint64_t>::max();
    uint64_t hi = 0;
    for (const auto& s : samples) {
        sum += s.price;
        lo = std::min(lo, s.price);
        hi = std::max(hi, s.price);
    }
    uint64_t avg = static_cast<uint64_t>(sum / n);

    U128 variance = 0;
    for (const auto& s : samples) {
        I128 diff = static_cast<I128>(s.price) - static_cast<I128>(avg);
        variance += static_cast<U128>(diff * diff);
    }
    variance /= n;

    // Newer half vs older half; an odd window leaves the middle sample out
    size_t half = n / 2;
    bool increasing = false;
    if (half > 0) {
        U128 older = 0;
        U128 newer = 0;
        for (size_t i = 0; i < half; ++i) {
            older += samples[i].price;
            newer += samples[n - half + i].price;
        }
        increasing = newer > older;
    }

    result.avg = avg;
    result.min = lo;
    result.max = hi;
    result.volatility = isqrt(variance);
    result.is_increasing = increasing;
    result.samples = n;
    return result;
}

Congestion GasPriceOracle::congestion(ChainId chain_id) const {
    auto chain = registry_->get_chain(chain_id);
    auto sample = latest_sample(chain_id);
    if (!chain || !sample || chain->congestion_high == 0) {
        return Congestion::UNKNOWN;
    }

    if (sample->price < chain->congestion_low) return Congestion::LOW;
    if (sample->price < chain->congestion_medium) return Congestion::MEDIUM;
    if (sample->price < chain->congestion_high) return Congestion::HIGH;
    return Congestion::CRITICAL;
}

std::vector<GasPriceSample> GasPriceOracle::history(ChainId chain_id) const {
    std::shared_lock lock(prices_mutex_);
    auto it = prices_.find(chain_id);
    if (it == prices_.end()) return {};
    return it->second.history.latest(it->second.history.size());
}

// =============================================================================
// Staleness
// =============================================================================

bool GasPriceOracle::is_fresh(ChainId chain_id) const {
    return price_age(chain_id) <= params().staleness_threshold;
}

uint64_t GasPriceOracle::price_age(ChainId chain_id) const {
    auto sample = latest_sample(chain_id);
    if (!sample) return UINT64_MAX;

    uint64_t now = clock_();
    return now > sample->observed_at ? now - sample->observed_at : 0;
}

// =============================================================================
// Administration
// =============================================================================

int32_t GasPriceOracle::set_params(const Address& caller, const OracleParams& params) {
    if (!access_->is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }
    if (params.min_gas_price > params.max_gas_price || params.history_capacity == 0) {
        return errors::INVALID_PARAMETER;
    }

    std::unique_lock lock(params_mutex_);
    params_ = params;
    // Existing histories keep their capacity; new chains use the new one
    log::get()->info("oracle params updated: staleness={}s feed_max_age={}s bounds=[{}, {}]",
                     params.staleness_threshold, params.feed_max_age,
                     params.min_gas_price, params.max_gas_price);
    return errors::OK;
}

OracleParams GasPriceOracle::params() const {
    std::shared_lock lock(params_mutex_);
    return params_;
}

// =============================================================================
// Statistics
// =============================================================================

GasPriceOracle::Stats GasPriceOracle::get_stats() const {
    uint64_t staleness = params().staleness_threshold;
    uint64_t now = clock_();

    std::shared_lock lock(prices_mutex_);

    uint64_t stale_count = 0;
    for (const auto& [chain_id, chain] : prices_) {
        if (now > chain.latest.observed_at && now - chain.latest.observed_at > staleness) {
            stale_count++;
        }
    }

    return Stats{
        prices_.size(),
        total_updates_.load(std::memory_order_relaxed),
        stale_count
    };
}

} // namespace gasopt
