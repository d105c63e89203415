// =============================================================================
// http_feed.cpp - REST native asset price feed
// =============================================================================

#include "gasopt/http_feed.hpp"
#include "gasopt/log.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

namespace gasopt {

using json = nlohmann::json;

HttpPriceFeed::HttpPriceFeed(std::string base_url, int timeout_ms)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

UsdPrice HttpPriceFeed::get_usd_price(uint64_t asset_id) {
    cpr::Header headers{{"Accept", "application/json"}};
    if (api_key_) {
        headers["X-API-KEY"] = *api_key_;
    }

    auto response = cpr::Get(
        cpr::Url{base_url_ + "/api/v1/prices/" + std::to_string(asset_id)},
        headers,
        cpr::Timeout{timeout_ms_});

    if (response.error) {
        throw PriceFeedError("price feed unreachable: " + response.error.message);
    }
    if (response.status_code != 200) {
        throw PriceFeedError("HTTP " + std::to_string(response.status_code) +
                             ": " + response.text);
    }

    UsdPrice price = parse_response(response.text);
    log::get()->trace("asset {} = ${} at {}", asset_id,
                      x18::to_string(price.price_x18), price.updated_at);
    return price;
}

UsdPrice HttpPriceFeed::parse_response(std::string_view body) {
    json j;
    try {
        j = json::parse(body.begin(), body.end());
    } catch (const json::parse_error& e) {
        throw PriceFeedError(std::string("malformed price response: ") + e.what());
    }

    if (!j.is_object() || !j.contains("price") || !j.contains("updated_at")) {
        throw PriceFeedError("price response missing price or updated_at");
    }

    const json& p = j.at("price");
    const json& t = j.at("updated_at");
    if (!p.is_string() || !t.is_number_unsigned()) {
        throw PriceFeedError("price response has wrong field types");
    }

    UsdPrice result{0, t.get<uint64_t>()};
    if (!x18::from_string(p.get<std::string>(), result.price_x18)) {
        throw PriceFeedError("price is not a decimal: " + p.get<std::string>());
    }
    return result;
}

} // namespace gasopt
