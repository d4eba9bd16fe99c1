#include <catch2/catch.hpp>

#include "common/ranges/find_duplicate.hpp"

#include <string>
#include <tuple>
#include <vector>

namespace bastion::test {

TEST_CASE("find_duplicate returns nothing for unique elements", "[find-duplicate]") {
    std::vector<int> empty;
    REQUIRE_FALSE(find_duplicate(empty));

    std::vector<int> single{1};
    REQUIRE_FALSE(find_duplicate(single));

    std::vector<int> values{1, 2, 3, 4};
    REQUIRE_FALSE(find_duplicate(values));
}

TEST_CASE("find_duplicate returns the second occurrence", "[find-duplicate]") {
    std::vector<std::string> values{"a", "b", "c", "b"};
    auto index = find_duplicate(values);
    REQUIRE(index);
    REQUIRE(*index == 3);
}

TEST_CASE("find_duplicate reports the earliest repeated element", "[find-duplicate]") {
    // Both 1 and 2 repeat, but the repetition of 2 is seen first.
    std::vector<int> values{1, 2, 2, 1};
    REQUIRE(find_duplicate(values) == 2u);
}

TEST_CASE("find_duplicate compares the keys of the elements", "[find-duplicate]") {
    struct Item {
        int group;
        std::string name;
    };

    std::vector<Item> items{{1, "x"}, {2, "x"}, {1, "y"}, {2, "x"}};
    REQUIRE(find_duplicate(items, [](const Item& item) { return item.group; }) == 2u);
    REQUIRE(find_duplicate(items, [](const Item& item) { return item.name; }) == 1u);
    REQUIRE(find_duplicate(items, [](const Item& item) {
        return std::tuple(item.group, item.name);
    }) == 3u);
}

} // namespace bastion::test
