#ifndef GASOPT_TYPES_HPP
#define GASOPT_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <functional>
#include <vector>

namespace gasopt {

// =============================================================================
// Chain Identifiers & Addresses (EVM 20-byte addresses)
// =============================================================================

using ChainId = uint64_t;
using Address = std::array<uint8_t, 20>;

constexpr Address ZERO_ADDRESS = {};

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// Parse "0x"-prefixed (or bare) 40 hex digit address. Returns false on
// malformed input and leaves `out` untouched.
bool address_from_hex(std::string_view hex, Address& out);
std::string address_to_hex(const Address& addr);

struct AddressHash {
    size_t operator()(const Address& addr) const {
        uint64_t h = 1469598103934665603ULL;
        for (auto b : addr) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

// Well-known chain ids
namespace chains {
constexpr ChainId ETHEREUM = 1;
constexpr ChainId OPTIMISM = 10;
constexpr ChainId POLYGON = 137;
constexpr ChainId BASE = 8453;
constexpr ChainId ARBITRUM = 42161;
}

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr uint32_t BPS_DENOMINATOR = 10000;      // 100%

namespace x18 {

inline I128 mul(I128 a, I128 b) {
    return (a * b) / X18_ONE;
}

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

// Parse a plain decimal string ("2000", "0.25", "-1.5") into X18.
// Returns false on malformed input.
bool from_string(std::string_view s, I128& out);
std::string to_string(I128 v);

// Apply a basis-point factor: v * bps / 10000
inline I128 apply_bps(I128 v, uint32_t bps) {
    return v * static_cast<I128>(bps) / static_cast<I128>(BPS_DENOMINATOR);
}

} // namespace x18

// Integer square root (floor) via Newton-Raphson
inline uint64_t isqrt(U128 x) {
    if (x == 0) return 0;
    U128 z = x;
    U128 y = (x + 1) / 2;
    while (y < z) {
        z = y;
        y = (x / y + y) / 2;
    }
    return static_cast<uint64_t>(z);
}

// =============================================================================
// Token Type (Token Address)
// =============================================================================

struct Token {
    Address addr;

    Token() : addr{} {}
    explicit Token(const Address& a) : addr(a) {}

    bool operator==(const Token& other) const { return addr == other.addr; }
    bool operator!=(const Token& other) const { return addr != other.addr; }
    bool operator<(const Token& other) const { return addr < other.addr; }
};

// =============================================================================
// Time Source
// =============================================================================

// Seconds since epoch. Injected so callers (and tests) control the clock.
using TimeSource = std::function<uint64_t()>;

uint64_t system_time();

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation
constexpr int32_t INVALID_USER = -1;
constexpr int32_t INVALID_AMOUNT = -2;
constexpr int32_t DEADLINE_EXPIRED = -3;
constexpr int32_t INVALID_DESTINATION_CHAIN = -4;
constexpr int32_t INVALID_PARAMETER = -5;

// Registry
constexpr int32_t UNKNOWN_CHAIN = -10;
constexpr int32_t CHAIN_ALREADY_REGISTERED = -11;
constexpr int32_t INVALID_CHAIN_CONFIG = -12;

// Prices
constexpr int32_t GAS_PRICE_OUT_OF_BOUNDS = -20;
constexpr int32_t STALE_PRICE = -21;
constexpr int32_t PRICE_FEED_UNAVAILABLE = -22;
constexpr int32_t NON_MONOTONIC_TIMESTAMP = -23;

// State machine
constexpr int32_t SWAP_NOT_FOUND = -30;
constexpr int32_t INVALID_STATE_TRANSITION = -31;
constexpr int32_t SWAP_NOT_ACTIVE = -32;
constexpr int32_t RECOVERY_TOO_EARLY = -33;
constexpr int32_t TRANSITION_IN_PROGRESS = -34;
constexpr int32_t OPERATIONS_PAUSED = -35;
constexpr int32_t DESTINATION_SWAP_FAILED = -36;

// External dependencies
constexpr int32_t BRIDGE_FAILED = -40;
constexpr int32_t UNSUPPORTED_CHAIN = -41;
constexpr int32_t AMOUNT_OUT_OF_BOUNDS = -42;
constexpr int32_t BRIDGE_TRANSPORT = -43;

// Access
constexpr int32_t UNAUTHORIZED = -50;

const char* to_string(int32_t code);
}

} // namespace gasopt

#endif // GASOPT_TYPES_HPP
