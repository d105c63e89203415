// =============================================================================
// types.cpp - Address/X18 helpers and error names
// =============================================================================

#include "gasopt/types.hpp"
#include <chrono>

namespace gasopt {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Addresses
// =============================================================================

bool address_from_hex(std::string_view hex, Address& out) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return false;

    Address addr{};
    for (size_t i = 0; i < 20; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    out = addr;
    return true;
}

std::string address_to_hex(const Address& addr) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string s = "0x";
    s.reserve(42);
    for (auto b : addr) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0x0F]);
    }
    return s;
}

// =============================================================================
// X18 String Conversion
// =============================================================================

namespace x18 {

bool from_string(std::string_view s, I128& out) {
    if (s.empty()) return false;

    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        s.remove_prefix(1);
    }
    if (s.empty()) return false;

    I128 whole = 0;
    I128 frac = 0;
    int frac_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;

    for (char c : s) {
        if (c == '.') {
            if (seen_dot) return false;
            seen_dot = true;
            continue;
        }
        if (c < '0' || c > '9') return false;
        seen_digit = true;

        if (!seen_dot) {
            whole = whole * 10 + (c - '0');
            if (whole > static_cast<I128>(1e20)) return false;
        } else if (frac_digits < 18) {
            frac = frac * 10 + (c - '0');
            frac_digits++;
        }
    }
    if (!seen_digit) return false;

    for (int i = frac_digits; i < 18; ++i) frac *= 10;

    I128 value = whole * X18_ONE + frac;
    out = negative ? -value : value;
    return true;
}

std::string to_string(I128 v) {
    bool negative = v < 0;
    U128 abs = negative ? static_cast<U128>(-v) : static_cast<U128>(v);

    U128 whole = abs / static_cast<U128>(X18_ONE);
    U128 frac = abs % static_cast<U128>(X18_ONE);

    std::string whole_str;
    do {
        whole_str.insert(whole_str.begin(), static_cast<char>('0' + static_cast<int>(whole % 10)));
        whole /= 10;
    } while (whole > 0);

    std::string result = negative ? "-" + whole_str : whole_str;
    if (frac == 0) return result;

    std::string frac_str(18, '0');
    for (int i = 17; i >= 0; --i) {
        frac_str[i] = static_cast<char>('0' + static_cast<int>(frac % 10));
        frac /= 10;
    }
    while (!frac_str.empty() && frac_str.back() == '0') frac_str.pop_back();

    return result + "." + frac_str;
}

} // namespace x18

uint64_t system_time() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

// =============================================================================
// Error Names
// =============================================================================

namespace errors {

const char* to_string(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case INVALID_USER: return "invalid_user";
        case INVALID_AMOUNT: return "invalid_amount";
        case DEADLINE_EXPIRED: return "deadline_expired";
        case INVALID_DESTINATION_CHAIN: return "invalid_destination_chain";
        case INVALID_PARAMETER: return "invalid_parameter";
        case UNKNOWN_CHAIN: return "unknown_chain";
        case CHAIN_ALREADY_REGISTERED: return "chain_already_registered";
        case INVALID_CHAIN_CONFIG: return "invalid_chain_config";
        case GAS_PRICE_OUT_OF_BOUNDS: return "gas_price_out_of_bounds";
        case STALE_PRICE: return "stale_price";
        case PRICE_FEED_UNAVAILABLE: return "price_feed_unavailable";
        case NON_MONOTONIC_TIMESTAMP: return "non_monotonic_timestamp";
        case SWAP_NOT_FOUND: return "swap_not_found";
        case INVALID_STATE_TRANSITION: return "invalid_state_transition";
        case SWAP_NOT_ACTIVE: return "swap_not_active";
        case RECOVERY_TOO_EARLY: return "recovery_too_early";
        case TRANSITION_IN_PROGRESS: return "transition_in_progress";
        case OPERATIONS_PAUSED: return "operations_paused";
        case DESTINATION_SWAP_FAILED: return "destination_swap_failed";
        case BRIDGE_FAILED: return "bridge_failed";
        case UNSUPPORTED_CHAIN: return "unsupported_chain";
        case AMOUNT_OUT_OF_BOUNDS: return "amount_out_of_bounds";
        case BRIDGE_TRANSPORT: return "bridge_transport";
        case UNAUTHORIZED: return "unauthorized";
    }
    return "unknown_error";
}

} // namespace errors

} // namespace gasopt
