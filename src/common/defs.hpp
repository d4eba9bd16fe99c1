#ifndef BASTION_COMMON_DEFS_HPP
#define BASTION_COMMON_DEFS_HPP

#include <cstddef>
#include <cstdint>

namespace bastion {

using u8 = std::uint8_t;
using u16 = std::uint16_t;

using byte = unsigned char;

using std::size_t;

#if defined(__GNUC__) || defined(__clang__)
#    define BASTION_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#    define BASTION_DISABLE_INLINE __attribute__((noinline))
#    define BASTION_COLD __attribute__((cold))
#else
#    define BASTION_UNLIKELY(x) (!!(x))
#    define BASTION_DISABLE_INLINE
#    define BASTION_COLD
#endif

// Debug builds (no NDEBUG) enable internal assertions and source locations in error messages.
#if !defined(BASTION_DEBUG) && !defined(NDEBUG)
#    define BASTION_DEBUG 1
#endif

/// Where an error or a failed assertion originated. All members are null
/// in release builds.
struct SourceLocation {
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;
};

#ifdef BASTION_DEBUG
#    define BASTION_SOURCE_LOCATION() (::bastion::SourceLocation{__FILE__, __LINE__, __func__})
#else
#    define BASTION_SOURCE_LOCATION() (::bastion::SourceLocation{})
#endif

} // namespace bastion

#endif // BASTION_COMMON_DEFS_HPP
