#ifndef BASTION_COMMON_FORMAT_HPP
#define BASTION_COMMON_FORMAT_HPP

#include "common/defs.hpp"

#include <fmt/format.h>

#include <string_view>
#include <type_traits>

namespace bastion {

/// How a user defined type is printed by fmt. Types choose a mode with one of
///
/// - `BASTION_ENABLE_MEMBER_FORMAT(Type)`: calls `value.format(FormatStream&)`,
/// - `BASTION_ENABLE_FREE_TO_STRING(Type)`: prints the result of `to_string(value)`.
///
/// Invoke the macros in the global namespace.
enum class FormatMode { None, MemberFormat, FreeToString };

template<typename T, typename Enable = void>
struct EnableFormatMode : std::integral_constant<FormatMode, FormatMode::None> {};

#define BASTION_ENABLE_MEMBER_FORMAT(T) \
    template<>                          \
    struct bastion::EnableFormatMode<T> \
        : ::std::integral_constant<::bastion::FormatMode, ::bastion::FormatMode::MemberFormat> {};

#define BASTION_ENABLE_FREE_TO_STRING(T) \
    template<>                           \
    struct bastion::EnableFormatMode<T>  \
        : ::std::integral_constant<::bastion::FormatMode, ::bastion::FormatMode::FreeToString> {};

/// Sink for member format functions.
class FormatStream {
public:
    FormatStream() = default;
    virtual ~FormatStream() = default;

    FormatStream(const FormatStream&) = delete;
    FormatStream& operator=(const FormatStream&) = delete;

    template<typename... Args>
    FormatStream& format(std::string_view format_str, const Args&... args) {
        write(format_str, fmt::make_format_args(args...));
        return *this;
    }

protected:
    virtual void write(std::string_view format_str, fmt::format_args args) = 0;
};

/// Writes to an output iterator, e.g. the one of a fmt format context.
template<typename OutputIterator>
class OutputIteratorStream final : public FormatStream {
public:
    explicit OutputIteratorStream(OutputIterator out)
        : out_(std::move(out)) {}

    OutputIterator out() const { return out_; }

private:
    void write(std::string_view format_str, fmt::format_args args) override {
        out_ = fmt::vformat_to(out_, format_str, args);
    }

private:
    OutputIterator out_;
};

} // namespace bastion

template<typename T, typename Char>
struct fmt::formatter<T, Char,
    std::enable_if_t<bastion::EnableFormatMode<T>::value != bastion::FormatMode::None>> {

    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const T& value, FormatContext& ctx) const {
        if constexpr (bastion::EnableFormatMode<T>::value == bastion::FormatMode::MemberFormat) {
            bastion::OutputIteratorStream stream(ctx.out());
            value.format(stream);
            return stream.out();
        } else {
            return fmt::format_to(ctx.out(), "{}", to_string(value));
        }
    }
};

#endif // BASTION_COMMON_FORMAT_HPP
