#pragma once

#include <vector>

namespace crowd::group {

    // Union-find по индексам 0..n-1.
    // find() итеративный со сжатием пути, unite() - объединение по рангу.
    class DisjointSet {
    public:
        explicit DisjointSet(int n);

        int find(int x);

        // true, если множества были разными и объединены.
        bool unite(int a, int b);

        int size() const { return (int)parent_.size(); }

    private:
        std::vector<int> parent_;
        std::vector<int> rank_;
    };

} // namespace crowd::group
