#include "cache_matrix.hpp"

#include <utility>

namespace cmat {

CacheMatrixImpl::CacheMatrixImpl(MatrixXd matrix) : matrix_(std::move(matrix)) {}

void CacheMatrixImpl::set(MatrixXd matrix) {
    matrix_ = std::move(matrix);
    inverse_.reset();
}

void CacheMatrixImpl::set_inverse(MatrixXd inverse) { inverse_ = std::move(inverse); }

} // namespace cmat
