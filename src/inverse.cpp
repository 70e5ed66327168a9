#include "inverse.hpp"
#include "assert.hpp"

#include <fmt/format.h>

#include <Eigen/LU>

namespace cmat {

MatrixXd invert(MatrixXd const& m, Options const& options) {
    if (!(options.tolerance >= 0)) {
        throw Exception(fmt::format("Invalid tolerance {}", options.tolerance));
    }
    if (m.size() == 0) {
        throw NotInvertible("Matrix has zero extent");
    }
    if (m.rows() != m.cols()) {
        throw NotInvertible(fmt::format("Matrix ({} x {}) must be square", m.rows(), m.cols()));
    }
    auto lu = Eigen::FullPivLU<MatrixXd>(m);
    if (lu.nonzeroPivots() < m.rows()) {
        throw NotInvertible(fmt::format("Matrix is exactly singular: rank {} < {}",
                                        lu.nonzeroPivots(), m.rows()));
    }
    double rcond = lu.rcond();
    if (!(rcond >= options.tolerance)) { // also rejects NaN
        throw NotInvertible(fmt::format(
            "Matrix is computationally singular: reciprocal condition number = {:g}", rcond));
    }
    return lu.inverse();
}

void notify_cache_hit(Options const& options) {
    if (options.on_cache_hit) {
        options.on_cache_hit(options.user_data);
    } else {
        fmt::print(stderr, "getting cached data\n");
    }
}

MatrixXd const& cache_solve(CacheMatrixImpl& m, Options const& options) {
    if (m.get_inverse()) {
        notify_cache_hit(options);
        // The callback may have replaced the matrix.
        if (auto& inverse = m.get_inverse()) {
            return *inverse;
        }
    }
    m.set_inverse(invert(m.get(), options));
    CMAT_ASSERT(m.get_inverse().has_value());
    return *m.get_inverse();
}

MatrixXd solve_system(CacheMatrixImpl& m, MatrixMap const& rhs, Options const& options) {
    auto const& inverse = cache_solve(m, options);
    if (inverse.rows() != m.get().rows()) {
        throw Exception(fmt::format("Stored inverse ({} x {}) does not match matrix ({} x {})",
                                    inverse.rows(), inverse.cols(), m.get().rows(),
                                    m.get().cols()));
    }
    if (rhs.rows() != inverse.cols()) {
        throw Exception(fmt::format("Right-hand side has {} rows, expected {}", rhs.rows(),
                                    inverse.cols()));
    }
    return inverse * rhs;
}

} // namespace cmat
