#ifndef BASTION_COMMON_HASH_HPP
#define BASTION_COMMON_HASH_HPP

#include "common/defs.hpp"

#include "absl/hash/hash.h"

#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace bastion {

/// Types with a `void hash(Hasher&) const` member opt into `Hasher` and `UseHasher`
/// with `BASTION_ENABLE_MEMBER_HASH(Type)`, invoked in the global namespace.
template<typename T, typename Enable = void>
struct EnableMemberHash : std::false_type {};

#define BASTION_ENABLE_MEMBER_HASH(T) \
    template<>                        \
    struct bastion::EnableMemberHash<T> : ::std::true_type {};

/// Feeds values into an abseil hash state. Values with a member hash function
/// describe themselves through `append()`, all others are handed to abseil.
/// Tuples and vectors are taken apart so that their elements may use member hashes.
class Hasher final {
public:
    explicit Hasher(absl::HashState state)
        : state_(std::move(state)) {}

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    template<typename... Args>
    Hasher& append(const Args&... args) {
        (add(args), ...);
        return *this;
    }

private:
    template<typename T>
    void add(const T& value) {
        if constexpr (EnableMemberHash<T>::value) {
            value.hash(*this);
        } else {
            state_ = absl::HashState::combine(std::move(state_), value);
        }
    }

    template<typename... T>
    void add(const std::tuple<T...>& tuple) {
        std::apply([this](const auto&... items) { append(items...); }, tuple);
    }

    template<typename T>
    void add(const std::vector<T>& items) {
        for (const auto& item : items)
            add(item);
        add(items.size());
    }

private:
    absl::HashState state_;
};

/// Hash function object for abseil containers, e.g. `absl::flat_hash_set<Key, UseHasher>`.
struct UseHasher {
    template<typename T>
    size_t operator()(const T& value) const {
        return absl::Hash<Ref<T>>()(Ref<T>{value});
    }

private:
    // Adapts `Hasher` to abseil's `AbslHashValue` extension point.
    template<typename T>
    struct Ref {
        const T& value;

        template<typename H>
        friend H AbslHashValue(H state, const Ref& ref) {
            Hasher hasher(absl::HashState::Create(&state));
            hasher.append(ref.value);
            return state;
        }
    };
};

} // namespace bastion

#endif // BASTION_COMMON_HASH_HPP
