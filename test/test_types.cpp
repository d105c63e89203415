// gasopt - Types Tests

#include <catch2/catch_test_macros.hpp>
#include <gasopt/types.hpp>
#include <string>

using namespace gasopt;

TEST_CASE("Address hex parsing", "[types]") {
    Address a{};

    SECTION("Prefixed and bare forms") {
        REQUIRE(address_from_hex("0x00000000000000000000000000000000000000a1", a));
        REQUIRE(a[19] == 0xA1);
        REQUIRE(address_to_hex(a) == "0x00000000000000000000000000000000000000a1");

        Address b{};
        REQUIRE(address_from_hex("00000000000000000000000000000000000000A1", b));
        REQUIRE(a == b);
    }

    SECTION("Malformed input leaves output untouched") {
        a[0] = 0x42;
        REQUIRE_FALSE(address_from_hex("0x1234", a));
        REQUIRE_FALSE(address_from_hex("0xzz000000000000000000000000000000000000a1", a));
        REQUIRE(a[0] == 0x42);
    }

    SECTION("Zero address") {
        REQUIRE(is_zero(ZERO_ADDRESS));
        a = {};
        a[5] = 1;
        REQUIRE_FALSE(is_zero(a));
    }
}

TEST_CASE("X18 decimal strings", "[types][x18]") {
    I128 v = 0;

    SECTION("Parse") {
        REQUIRE(x18::from_string("2000", v));
        REQUIRE(v == x18::from_int(2000));

        REQUIRE(x18::from_string("0.25", v));
        REQUIRE(v == X18_ONE / 4);

        REQUIRE(x18::from_string("-1.5", v));
        REQUIRE(v == -(X18_ONE + X18_ONE / 2));
    }

    SECTION("Reject garbage") {
        REQUIRE_FALSE(x18::from_string("", v));
        REQUIRE_FALSE(x18::from_string("-", v));
        REQUIRE_FALSE(x18::from_string("1.2.3", v));
        REQUIRE_FALSE(x18::from_string("12a", v));
        REQUIRE_FALSE(x18::from_string(".", v));
    }

    SECTION("Format") {
        REQUIRE(x18::to_string(x18::from_int(48)) == "48");
        REQUIRE(x18::to_string(X18_ONE / 4) == "0.25");
        REQUIRE(x18::to_string(-(X18_ONE / 2)) == "-0.5");
        REQUIRE(x18::to_string(0) == "0");
    }
}

TEST_CASE("Basis point and integer math", "[types][x18]") {
    REQUIRE(x18::apply_bps(x18::from_int(1000), 500) == x18::from_int(50));
    REQUIRE(x18::apply_bps(x18::from_int(50), 12000) == x18::from_int(60));
    REQUIRE(x18::mul(x18::from_int(3), x18::from_int(4)) == x18::from_int(12));
    REQUIRE(x18::mul(X18_ONE / 2, X18_ONE / 2) == X18_ONE / 4);

    REQUIRE(isqrt(0) == 0);
    REQUIRE(isqrt(125) == 11);
    REQUIRE(isqrt(144) == 12);
}

TEST_CASE("Error names", "[types]") {
    REQUIRE(std::string(errors::to_string(errors::OK)) == "ok");
    REQUIRE(std::string(errors::to_string(errors::STALE_PRICE)) == "stale_price");
    REQUIRE(std::string(errors::to_string(errors::RECOVERY_TOO_EARLY)) == "recovery_too_early");
    REQUIRE(std::string(errors::to_string(-9999)) == "unknown_error");
}
