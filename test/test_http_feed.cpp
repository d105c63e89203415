// gasopt - HttpPriceFeed Tests

#include <catch2/catch_test_macros.hpp>
#include <gasopt/http_feed.hpp>

using namespace gasopt;

TEST_CASE("HttpPriceFeed response decoding", "[http]") {
    SECTION("Valid body") {
        UsdPrice p = HttpPriceFeed::parse_response(R"({"price": "2000.5", "updated_at": 1700000000})");
        REQUIRE(p.price_x18 == x18::from_int(2000) + X18_ONE / 2);
        REQUIRE(p.updated_at == 1700000000ULL);
    }

    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(HttpPriceFeed::parse_response("<html>"), PriceFeedError);
    }

    SECTION("Missing fields") {
        REQUIRE_THROWS_AS(HttpPriceFeed::parse_response(R"({"price": "1"})"), PriceFeedError);
        REQUIRE_THROWS_AS(HttpPriceFeed::parse_response(R"({"updated_at": 1})"), PriceFeedError);
    }

    SECTION("Wrong field types") {
        REQUIRE_THROWS_AS(HttpPriceFeed::parse_response(R"({"price": 2000, "updated_at": 1})"),
                          PriceFeedError);
        REQUIRE_THROWS_AS(HttpPriceFeed::parse_response(R"({"price": "abc", "updated_at": 1})"),
                          PriceFeedError);
    }
}

TEST_CASE("HttpPriceFeed unreachable service", "[http]") {
    // Nothing listens on port 1
    HttpPriceFeed feed("http://127.0.0.1:1/", 500);
    REQUIRE_THROWS_AS(feed.get_usd_price(1), PriceFeedError);
}
