#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace evalign {

// ============================================================================
// Disjoint Set (Union-Find)
// ============================================================================

/**
 * Union-find over [0, n) with path compression and union by rank.
 * Owned by a single match() call; cluster id = find(i).
 */
class DisjointSet {
public:
    explicit DisjointSet(size_t n) : parent_(n), rank_(n, 0) {
        for (size_t i = 0; i < n; ++i) parent_[i] = static_cast<int>(i);
    }

    int find(int x) {
        int root = x;
        while (parent_[root] != root) root = parent_[root];
        // Path compression
        while (parent_[x] != x) {
            int p = parent_[x];
            parent_[x] = root;
            x = p;
        }
        return root;
    }

    void unite(int a, int b) {
        int ra = find(a);
        int rb = find(b);
        if (ra == rb) return;
        if (rank_[ra] < rank_[rb]) std::swap(ra, rb);
        parent_[rb] = ra;
        if (rank_[ra] == rank_[rb]) rank_[ra]++;
    }

    bool connected(int a, int b) { return find(a) == find(b); }

    size_t size() const { return parent_.size(); }

private:
    std::vector<int> parent_;
    std::vector<uint8_t> rank_;
};

}  // namespace evalign
