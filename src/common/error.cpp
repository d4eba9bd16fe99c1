#include "common/error.hpp"

#include <iterator>

namespace bastion {

Error::Error(bastion_errc_t code, std::string message)
    : code_(code)
    , message_(std::move(message)) {}

Error::~Error() {}

const char* Error::code_name() const noexcept {
    return bastion_errc_name(code_);
}

const char* Error::what() const noexcept {
    return message_.c_str();
}

namespace detail {

void append_location(fmt::memory_buffer& buf, const SourceLocation& loc) {
    if (!loc.file)
        return;

    fmt::format_to(std::back_inserter(buf), " (in {} at {}:{})",
        loc.function ? loc.function : "<unknown>", loc.file, loc.line);
}

void throw_error_impl(
    const SourceLocation& loc, bastion_errc_t code, const char* format, fmt::format_args args) {
    fmt::memory_buffer buf;
    fmt::vformat_to(std::back_inserter(buf), format, args);
    append_location(buf, loc);
    throw Error(code, fmt::to_string(buf));
}

} // namespace detail
} // namespace bastion
