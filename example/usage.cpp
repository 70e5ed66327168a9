// Wraps a 3x3 matrix and requests its inverse twice. The second request is answered from the
// cache, which is reported on stderr as "getting cached data".

#include <cachematrix/cachematrix.hpp>

#include <fmt/format.h>

#include <cstdio>

void print(cmat::Matrix const& m) {
    for (int i = 0; i < m.rows(); ++i) {
        for (int j = 0; j < m.cols(); ++j) {
            fmt::print("{:12.7f}", m(i, j));
        }
        fmt::print("\n");
    }
    fmt::print("\n");
}

int main() {
    try {
        auto cm = cmat::CacheMatrix(cmat::Matrix{{1, 4, 6}, {2, 1, 7}, {3, 7, 8}});
        print(cm.get());

        fmt::print("First solve:\n");
        print(cmat::solve(cm));

        fmt::print("Second solve:\n");
        std::fflush(stdout);
        print(cmat::solve(cm));
    } catch (cmat::Exception const& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
    return 0;
}
