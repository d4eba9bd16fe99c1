#include <catch2/catch.hpp>

#include "common/entities/entity_id.hpp"

#include <fmt/format.h>

namespace bastion::test {

namespace {

BASTION_DEFINE_ENTITY_ID(MyId, u16)

} // namespace

static_assert(sizeof(MyId) == sizeof(u16));

TEST_CASE("Default constructed entity ids are invalid", "[entities]") {
    MyId id;
    REQUIRE(!id);
    REQUIRE(!id.valid());
    REQUIRE(id.value() == MyId::invalid_value);
    REQUIRE(MyId::invalid_value == 65535);
}

TEST_CASE("Entity ids compare by their value", "[entities]") {
    MyId a(1);
    MyId b(2);
    REQUIRE(a);
    REQUIRE(a.value() == 1);
    REQUIRE(a == MyId(1));
    REQUIRE(a != b);
    REQUIRE(MyId() == MyId());
    REQUIRE(MyId() != MyId(0));
}

TEST_CASE("Entity ids are formatted with their type name", "[entities]") {
    REQUIRE(fmt::format("{}", MyId(3)) == "MyId(3)");
    REQUIRE(fmt::format("{}", MyId()) == "MyId(invalid)");
}

TEST_CASE("Equal entity ids have equal hashes", "[entities]") {
    UseHasher h;
    REQUIRE(h(MyId(5)) == h(MyId(5)));
    REQUIRE(h(MyId(5)) != h(MyId(6)));
}

} // namespace bastion::test
