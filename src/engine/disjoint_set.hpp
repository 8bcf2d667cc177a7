#pragma once

#include <vector>
#include <cstddef>
#include <utility>

// Union-find over dense indices 0..n-1 with path compression and union by rank.
class DisjointSet {
public:
    explicit DisjointSet(size_t n) : parent_(n), rank_(n, 0), size_(n, 1) {
        for (size_t i = 0; i < n; i++) parent_[i] = i;
    }

    size_t find(size_t x) {
        size_t root = x;
        while (parent_[root] != root) root = parent_[root];
        while (parent_[x] != root) {
            size_t next = parent_[x];
            parent_[x] = root;
            x = next;
        }
        return root;
    }

    // Returns false if already in the same set
    bool unite(size_t a, size_t b) {
        size_t ra = find(a), rb = find(b);
        if (ra == rb) return false;
        if (rank_[ra] < rank_[rb]) std::swap(ra, rb);
        parent_[rb] = ra;
        size_[ra] += size_[rb];
        if (rank_[ra] == rank_[rb]) rank_[ra]++;
        return true;
    }

    size_t set_size(size_t x) { return size_[find(x)]; }
    size_t size() const { return parent_.size(); }

private:
    std::vector<size_t> parent_;
    std::vector<size_t> rank_;
    std::vector<size_t> size_;   // valid at roots only
};
