#pragma once

#include <cstddef>
#include <vector>

namespace tile_link::core {

// Union-find over the index set [0, n) with path compression (halving).
class DisjointSet {
public:
    explicit DisjointSet(std::size_t n = 0);

    std::size_t find(std::size_t idx);

    // Merges the sets of a and b. The root of a's set survives.
    // Returns false if they were already in the same set.
    bool unite(std::size_t a, std::size_t b);

    bool connected(std::size_t a, std::size_t b);

    std::size_t size() const { return parent_.size(); }

    // Members grouped by root, each group in ascending index order and the
    // groups ordered by their smallest member.
    std::vector<std::vector<std::size_t>> groups();

private:
    std::vector<std::size_t> parent_;
};

} // namespace tile_link::core
