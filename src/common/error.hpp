#ifndef BASTION_COMMON_ERROR_HPP
#define BASTION_COMMON_ERROR_HPP

#include "bastion/error.h"
#include "common/defs.hpp"

#include <fmt/format.h>

#include <exception>
#include <string>

namespace bastion {

/// Error class thrown by the library when an operation cannot complete.
/// Every error carries one of the public `bastion_errc_t` codes.
///
/// Structural defects found by the module checker are reported as values
/// and only become exceptions at the `verify_module()` boundary.
class Error : public virtual std::exception {
public:
    explicit Error(bastion_errc_t code, std::string message);
    virtual ~Error();

    bastion_errc_t code() const noexcept { return code_; }

    /// The symbolic name of `code()`, e.g. "ERROR_BAD_MODULE".
    const char* code_name() const noexcept;

    virtual const char* what() const noexcept;

private:
    bastion_errc_t code_;
    std::string message_;
};

namespace detail {

[[noreturn]] BASTION_DISABLE_INLINE BASTION_COLD void throw_error_impl(
    const SourceLocation& loc, bastion_errc_t code, const char* format, fmt::format_args args);

/// Appends " (in function at file:line)" to the buffer. Appends nothing if the
/// location is unknown.
void append_location(fmt::memory_buffer& buf, const SourceLocation& loc);

} // namespace detail

/// Throws an internal error. The arguments to the macro are interpreted like in fmt::format().
#define BASTION_ERROR(...) BASTION_ERROR_WITH_CODE(BASTION_ERROR_INTERNAL, __VA_ARGS__)

/// Throws an error with the given code. The remaining arguments are interpreted like in fmt::format().
#define BASTION_ERROR_WITH_CODE(code, ...) \
    (::bastion::throw_error(BASTION_SOURCE_LOCATION(), (code), __VA_ARGS__))

/// Throws an internal error if the condition is false.
/// All other arguments are passed to BASTION_ERROR().
#define BASTION_CHECK(cond, ...)         \
    do {                                 \
        if (BASTION_UNLIKELY(!(cond))) { \
            BASTION_ERROR(__VA_ARGS__);  \
        }                                \
    } while (0)

template<typename... Args>
[[noreturn]] inline BASTION_COLD void throw_error(
    const SourceLocation& loc, bastion_errc_t code, const char* format, const Args&... args) {
    detail::throw_error_impl(loc, code, format, fmt::make_format_args(args...));
}

} // namespace bastion

#endif // BASTION_COMMON_ERROR_HPP
