#ifndef GASOPT_CLIENTS_HPP
#define GASOPT_CLIENTS_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "types.hpp"

namespace gasopt {

// =============================================================================
// Price Feed Interface (native asset USD prices)
// =============================================================================

struct UsdPrice {
    I128 price_x18;       // USD per whole native token
    uint64_t updated_at;  // seconds
};

// Raised when the feed cannot be reached or answers garbage
class PriceFeedError : public std::runtime_error {
public:
    explicit PriceFeedError(const std::string& msg) : std::runtime_error(msg) {}
};

class PriceFeedClient {
public:
    virtual ~PriceFeedClient() = default;

    // Throws PriceFeedError when unreachable
    virtual UsdPrice get_usd_price(uint64_t asset_id) = 0;
};

// =============================================================================
// Bridge Interface
// =============================================================================

struct BridgeQuote {
    I128 fee_usd_x18;
    uint32_t estimated_time_seconds;
};

struct BridgeStatus {
    bool completed;
    bool failed;
    I128 filled_amount_x18;
};

// Carries one of errors::UNSUPPORTED_CHAIN, errors::AMOUNT_OUT_OF_BOUNDS or
// errors::BRIDGE_TRANSPORT
class BridgeError : public std::runtime_error {
public:
    BridgeError(int32_t code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

class BridgeClient {
public:
    virtual ~BridgeClient() = default;

    /// Estimate the fee and latency of moving `amount` of `token`
    virtual BridgeQuote quote(const Token& token, I128 amount_x18,
                              ChainId destination_chain) = 0;

    /// Start a transfer. Returns the bridge reference id.
    virtual std::string transfer(const Address& depositor,
                                 const Address& recipient,
                                 const Token& token,
                                 I128 amount_x18,
                                 ChainId destination_chain,
                                 const std::vector<uint8_t>& message) = 0;

    /// Status of a previously started transfer
    virtual BridgeStatus status(const std::string& bridge_reference_id) = 0;
};

} // namespace gasopt

#endif // GASOPT_CLIENTS_HPP
