#include "common/assert.hpp"

#include "common/error.hpp"

#include <fmt/format.h>

#include <iterator>
#include <string_view>

namespace bastion {

/// Thrown when an internal invariant does not hold. Carries `BASTION_ERROR_INTERNAL`.
class AssertionFailure final : public virtual Error {
public:
    explicit AssertionFailure(std::string message)
        : Error(BASTION_ERROR_INTERNAL, std::move(message)) {}
};

namespace detail {

[[noreturn]] static void
fail(const SourceLocation& loc, std::string_view what, const char* message) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "{}", what);
    if (message && *message)
        fmt::format_to(std::back_inserter(buf), ": {}", message);
    append_location(buf, loc);
    throw AssertionFailure(fmt::to_string(buf));
}

void assert_fail(const SourceLocation& loc, const char* condition, const char* message) {
    fail(loc, fmt::format("Assertion `{}` failed", condition), message);
}

void unreachable(const SourceLocation& loc, const char* message) {
    fail(loc, "Unreachable code executed", message);
}

} // namespace detail
} // namespace bastion
