#ifndef GASOPT_HTTP_FEED_HPP
#define GASOPT_HTTP_FEED_HPP

#include <optional>
#include <string>
#include <string_view>

#include "clients.hpp"

namespace gasopt {

// =============================================================================
// HttpPriceFeed - PriceFeedClient over a REST price service
//
//   GET {base_url}/api/v1/prices/{asset_id}
//   -> {"price": "2000.15", "updated_at": 1700000000}
//
// =============================================================================

class HttpPriceFeed : public PriceFeedClient {
public:
    explicit HttpPriceFeed(std::string base_url, int timeout_ms = 5000);

    HttpPriceFeed& with_api_key(std::string_view key) {
        api_key_ = std::string(key);
        return *this;
    }

    // Throws PriceFeedError on transport errors, non-200 answers or bad bodies
    UsdPrice get_usd_price(uint64_t asset_id) override;

    // Decodes one response body; throws PriceFeedError
    static UsdPrice parse_response(std::string_view body);

private:
    std::string base_url_;
    int timeout_ms_;
    std::optional<std::string> api_key_;
};

} // namespace gasopt

#endif // GASOPT_HTTP_FEED_HPP
