#include "crowd/group/disjoint_set.h"

#include <numeric>
#include <utility>

namespace crowd::group {

    DisjointSet::DisjointSet(int n) : parent_(n > 0 ? n : 0), rank_(n > 0 ? n : 0, 0) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    int DisjointSet::find(int x) {
        int root = x;
        while (parent_[root] != root) root = parent_[root];

        // сжатие пути
        while (parent_[x] != root) {
            int up = parent_[x];
            parent_[x] = root;
            x = up;
        }
        return root;
    }

    bool DisjointSet::unite(int a, int b) {
        a = find(a);
        b = find(b);
        if (a == b) return false;
        if (rank_[a] < rank_[b]) std::swap(a, b);
        parent_[b] = a;
        if (rank_[a] == rank_[b]) rank_[a]++;
        return true;
    }

} // namespace crowd::group
