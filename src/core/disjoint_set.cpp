#include "tile_link/core/disjoint_set.hpp"
#include "tile_link/core/errors.hpp"

#include <map>
#include <numeric>
#include <string>

namespace tile_link::core {

DisjointSet::DisjointSet(std::size_t n) : parent_(n) {
    std::iota(parent_.begin(), parent_.end(), std::size_t{0});
}

std::size_t DisjointSet::find(std::size_t idx) {
    if (idx >= parent_.size()) {
        throw TileLinkError("DisjointSet index out of range: " + std::to_string(idx));
    }
    while (parent_[idx] != idx) {
        parent_[idx] = parent_[parent_[idx]];
        idx = parent_[idx];
    }
    return idx;
}

bool DisjointSet::unite(std::size_t a, std::size_t b) {
    std::size_t ra = find(a);
    std::size_t rb = find(b);
    if (ra == rb) {
        return false;
    }
    parent_[rb] = ra;
    return true;
}

bool DisjointSet::connected(std::size_t a, std::size_t b) {
    return find(a) == find(b);
}

std::vector<std::vector<std::size_t>> DisjointSet::groups() {
    // Iterating indices in ascending order fills each group sorted, and the
    // first time a root is seen is at its group's smallest member.
    std::map<std::size_t, std::size_t> slot_by_root;
    std::vector<std::vector<std::size_t>> out;
    for (std::size_t i = 0; i < parent_.size(); ++i) {
        std::size_t root = find(i);
        auto it = slot_by_root.find(root);
        if (it == slot_by_root.end()) {
            slot_by_root.emplace(root, out.size());
            out.push_back({i});
        } else {
            out[it->second].push_back(i);
        }
    }
    return out;
}

} // namespace tile_link::core
