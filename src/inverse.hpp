#pragma once

#include "cache_matrix.hpp"
#include "matrix.hpp"

namespace cmat {

// Computes the inverse with a full pivoting LU decomposition.
// Throws NotInvertible if the matrix is empty, not square, exactly singular, or if its
// estimated reciprocal condition number is below options.tolerance.
// Throws Exception if options.tolerance is negative or NaN.
MatrixXd invert(MatrixXd const&, Options const&);

void notify_cache_hit(Options const&);

// Returns the cached inverse (and notifies), or computes and stores it.
MatrixXd const& cache_solve(CacheMatrixImpl&, Options const&);

// Computes inverse * rhs, using cache_solve for the inverse. The result always has as many rows
// as the matrix: a stored inverse of a different height is rejected.
MatrixXd solve_system(CacheMatrixImpl&, MatrixMap const& rhs, Options const&);

} // namespace cmat
