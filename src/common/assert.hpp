#ifndef BASTION_COMMON_ASSERT_HPP
#define BASTION_COMMON_ASSERT_HPP

#include "common/defs.hpp"

namespace bastion::detail {

// Both throw an `AssertionFailure` (code `BASTION_ERROR_INTERNAL`).
[[noreturn]] BASTION_DISABLE_INLINE BASTION_COLD void
assert_fail(const SourceLocation& loc, const char* condition, const char* message);

[[noreturn]] BASTION_DISABLE_INLINE BASTION_COLD void
unreachable(const SourceLocation& loc, const char* message);

} // namespace bastion::detail

/// Checks an internal invariant in debug builds. Compiles to nothing otherwise.
#ifdef BASTION_DEBUG
#    define BASTION_DEBUG_ASSERT(cond, message)                                              \
        do {                                                                                 \
            if (BASTION_UNLIKELY(!(cond)))                                                   \
                ::bastion::detail::assert_fail(BASTION_SOURCE_LOCATION(), #cond, (message)); \
        } while (0)
#else
#    define BASTION_DEBUG_ASSERT(cond, message) \
        do {                                    \
        } while (0)
#endif

/// Marks code that must never run. Throws in all build modes; the message is kept in debug builds only.
#ifdef BASTION_DEBUG
#    define BASTION_UNREACHABLE(message) \
        ::bastion::detail::unreachable(BASTION_SOURCE_LOCATION(), (message))
#else
#    define BASTION_UNREACHABLE(message) \
        ::bastion::detail::unreachable(BASTION_SOURCE_LOCATION(), nullptr)
#endif

#endif // BASTION_COMMON_ASSERT_HPP
