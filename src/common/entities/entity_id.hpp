#ifndef BASTION_COMMON_ENTITIES_ENTITY_ID_HPP
#define BASTION_COMMON_ENTITIES_ENTITY_ID_HPP

#include "common/defs.hpp"
#include "common/format.hpp"
#include "common/hash.hpp"

#include <string_view>
#include <type_traits>

namespace bastion {

struct EntityIdBase {};

/// Index into one particular table of a module. Every table has its own id type
/// (see `BASTION_DEFINE_ENTITY_ID`), so an index into one table cannot be used to
/// access another.
///
/// A default constructed id holds the all-ones bit pattern and is invalid.
template<typename Underlying, typename Derived>
class EntityId : public EntityIdBase {
public:
    using UnderlyingType = Underlying;

    static constexpr Underlying invalid_value = static_cast<Underlying>(-1);

    constexpr EntityId() = default;

    constexpr explicit EntityId(Underlying value)
        : value_(value) {}

    constexpr bool valid() const noexcept { return value_ != invalid_value; }
    constexpr explicit operator bool() const noexcept { return valid(); }

    constexpr Underlying value() const noexcept { return value_; }

    friend constexpr bool operator==(const Derived& lhs, const Derived& rhs) {
        return lhs.value_ == rhs.value_;
    }

    friend constexpr bool operator!=(const Derived& lhs, const Derived& rhs) {
        return lhs.value_ != rhs.value_;
    }

    void hash(Hasher& h) const { h.append(value_); }

protected:
    // Prints `Name(value)`, or `Name(invalid)`.
    void format_as(std::string_view name, FormatStream& stream) const {
        if (valid()) {
            stream.format("{}({})", name, value_);
        } else {
            stream.format("{}(invalid)", name);
        }
    }

private:
    Underlying value_ = invalid_value;
};

#define BASTION_DEFINE_ENTITY_ID(Name, Underlying)                                     \
    class Name final : public ::bastion::EntityId<Underlying, Name> {                  \
    public:                                                                            \
        using EntityId::EntityId;                                                      \
                                                                                       \
        void format(::bastion::FormatStream& stream) const { format_as(#Name, stream); } \
    };

} // namespace bastion

template<typename T>
struct bastion::EnableMemberHash<T, std::enable_if_t<std::is_base_of_v<bastion::EntityIdBase, T>>>
    : std::true_type {};

template<typename T>
struct bastion::EnableFormatMode<T, std::enable_if_t<std::is_base_of_v<bastion::EntityIdBase, T>>>
    : std::integral_constant<bastion::FormatMode, bastion::FormatMode::MemberFormat> {};

#endif // BASTION_COMMON_ENTITIES_ENTITY_ID_HPP
