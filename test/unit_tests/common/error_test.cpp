#include <catch2/catch.hpp>

#include "common/error.hpp"

#include "support/matchers.hpp"

#include <string>

namespace bastion::test {

using test_support::exception_contains_string;
using test_support::exception_matches_code;

TEST_CASE("Errors carry their code and message", "[error]") {
    Error error(BASTION_ERROR_BAD_ARG, "something went wrong");
    REQUIRE(error.code() == BASTION_ERROR_BAD_ARG);
    REQUIRE(std::string(error.what()) == "something went wrong");
}

TEST_CASE("Errors know the name of their code", "[error]") {
    Error error(BASTION_ERROR_MODULE_TOO_LARGE, "too large");
    REQUIRE(std::string(error.code_name()) == "ERROR_MODULE_TOO_LARGE");
}

TEST_CASE("Error messages mention the throwing function in debug builds", "[error]") {
    auto thrower = [] { BASTION_ERROR_WITH_CODE(BASTION_ERROR_BAD_ARG, "bad argument"); };
#ifdef BASTION_DEBUG
    REQUIRE_THROWS_MATCHES(thrower(), Error, exception_contains_string("bad argument (in "));
#else
    REQUIRE_THROWS_WITH(thrower(), "bad argument");
#endif
}

TEST_CASE("Error macros format their message", "[error]") {
    REQUIRE_THROWS_MATCHES(BASTION_ERROR_WITH_CODE(BASTION_ERROR_OUT_OF_BOUNDS, "index {}", 3),
        Error, exception_matches_code(BASTION_ERROR_OUT_OF_BOUNDS));
    REQUIRE_THROWS_MATCHES(
        BASTION_ERROR("value {} is {}", 1, "bad"), Error, exception_contains_string("value 1 is bad"));
    REQUIRE_THROWS_MATCHES(
        BASTION_ERROR("internal"), Error, exception_matches_code(BASTION_ERROR_INTERNAL));
}

TEST_CASE("BASTION_CHECK only throws if the condition fails", "[error]") {
    auto check = [](int value) { BASTION_CHECK(value == 3, "expected {}, got {}", 3, value); };

    REQUIRE_NOTHROW(check(3));
    REQUIRE_THROWS_MATCHES(check(4), Error, exception_contains_string("expected 3, got 4"));
}

TEST_CASE("Error codes have names and messages", "[error]") {
    REQUIRE(std::string(bastion_errc_name(BASTION_OK)) == "OK");
    REQUIRE(std::string(bastion_errc_name(BASTION_ERROR_BAD_MODULE)) == "ERROR_BAD_MODULE");
    REQUIRE(std::string(bastion_errc_name(BASTION_ERROR_MODULE_TOO_LARGE))
            == "ERROR_MODULE_TOO_LARGE");
    REQUIRE(std::string(bastion_errc_message(BASTION_ERROR_OUT_OF_BOUNDS))
            == "a table index does not resolve");
    REQUIRE(std::string(bastion_errc_name(static_cast<bastion_errc_t>(12345)))
            == "unknown error code");
}

} // namespace bastion::test
