// gasopt - AccessControl Tests

#include <catch2/catch_test_macros.hpp>
#include "test_mocks.hpp"

using namespace gasopt;
using namespace gasopt::testing;

TEST_CASE("AccessControl roles", "[access]") {
    const Address owner = addr(0xA1);
    const Address keeper = addr(0xB2);
    const Address other = addr(0x33);

    AccessControl access(owner, keeper);

    REQUIRE(access.is_admin(owner));
    REQUIRE_FALSE(access.is_admin(keeper));
    REQUIRE(access.is_keeper(keeper));
    REQUIRE_FALSE(access.is_keeper(owner));
    REQUIRE_FALSE(access.is_keeper(ZERO_ADDRESS));

    SECTION("Only admins add admins") {
        REQUIRE(access.add_admin(other, other) == errors::UNAUTHORIZED);
        REQUIRE(access.add_admin(owner, ZERO_ADDRESS) == errors::INVALID_USER);
        REQUIRE(access.add_admin(owner, other) == errors::OK);
        REQUIRE(access.is_admin(other));
        REQUIRE(access.admins().size() == 2);
    }

    SECTION("The last admin cannot be removed") {
        REQUIRE(access.remove_admin(owner, owner) == errors::INVALID_PARAMETER);

        REQUIRE(access.add_admin(owner, other) == errors::OK);
        REQUIRE(access.remove_admin(other, owner) == errors::OK);
        REQUIRE_FALSE(access.is_admin(owner));
        REQUIRE(access.remove_admin(owner, other) == errors::UNAUTHORIZED);
    }

    SECTION("Keeper rotation takes effect immediately") {
        REQUIRE(access.rotate_keeper(keeper, other) == errors::UNAUTHORIZED);
        REQUIRE(access.rotate_keeper(owner, ZERO_ADDRESS) == errors::INVALID_USER);

        REQUIRE(access.rotate_keeper(owner, other) == errors::OK);
        REQUIRE(access.keeper() == other);
        REQUIRE(access.is_keeper(other));
        REQUIRE_FALSE(access.is_keeper(keeper));
    }
}
