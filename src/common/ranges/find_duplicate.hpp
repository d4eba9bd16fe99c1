#ifndef BASTION_COMMON_RANGES_FIND_DUPLICATE_HPP
#define BASTION_COMMON_RANGES_FIND_DUPLICATE_HPP

#include "common/defs.hpp"
#include "common/hash.hpp"

#include "absl/container/flat_hash_set.h"

#include <iterator>
#include <optional>
#include <type_traits>

namespace bastion {

namespace detail {

struct IdentityKey {
    template<typename T>
    const T& operator()(const T& value) const {
        return value;
    }
};

} // namespace detail

/// Scans the range from left to right and returns the position of the first element
/// whose key is equal to the key of an earlier element, i.e. the position of the
/// second occurrence of the first repeated key. Returns an empty optional if all
/// keys are unique.
///
/// Keys are derived from the elements with `key_of` and must be hashable with `UseHasher`
/// and equality comparable. The range is traversed exactly once.
template<typename Range, typename KeyFunc>
std::optional<size_t> find_duplicate(const Range& range, KeyFunc&& key_of) {
    using Key = std::remove_cv_t<std::remove_reference_t<decltype(key_of(*std::begin(range)))>>;

    absl::flat_hash_set<Key, UseHasher> seen;
    size_t index = 0;
    for (const auto& item : range) {
        if (!seen.insert(key_of(item)).second)
            return index;
        ++index;
    }
    return {};
}

/// Like `find_duplicate(range, key_of)`, but compares the elements themselves.
template<typename Range>
std::optional<size_t> find_duplicate(const Range& range) {
    return find_duplicate(range, detail::IdentityKey());
}

} // namespace bastion

#endif // BASTION_COMMON_RANGES_FIND_DUPLICATE_HPP
