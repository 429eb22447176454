#include "tile_link/core/disjoint_set.hpp"
#include "tile_link/core/errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using tile_link::core::DisjointSet;

TEST_CASE("disjoint_set_starts_with_singletons") {
  DisjointSet sets(4);
  REQUIRE(sets.size() == 4);
  REQUIRE(sets.groups().size() == 4);
  REQUIRE_FALSE(sets.connected(0, 1));
}

TEST_CASE("disjoint_set_unite_is_transitive") {
  DisjointSet sets(5);
  REQUIRE(sets.unite(0, 3));
  REQUIRE(sets.unite(3, 4));
  REQUIRE_FALSE(sets.unite(4, 0));
  REQUIRE(sets.connected(0, 4));
  REQUIRE_FALSE(sets.connected(1, 4));
  REQUIRE(sets.find(4) == sets.find(0));
}

TEST_CASE("disjoint_set_groups_are_ordered_by_smallest_member") {
  DisjointSet sets(6);
  sets.unite(5, 1);
  sets.unite(4, 2);
  sets.unite(2, 0);

  auto groups = sets.groups();
  REQUIRE(groups.size() == 3);
  REQUIRE((groups[0] == std::vector<std::size_t>{0, 2, 4}));
  REQUIRE((groups[1] == std::vector<std::size_t>{1, 5}));
  REQUIRE(groups[2] == std::vector<std::size_t>{3});
}

TEST_CASE("disjoint_set_rejects_out_of_range_index") {
  DisjointSet sets(2);
  REQUIRE_THROWS_AS(sets.find(2), tile_link::TileLinkError);
}
