#pragma once

#include "matrix.hpp"

#include <optional>

namespace cmat {

// Owns a matrix and, once it is known, its inverse. Never computes anything itself.
class CacheMatrixImpl {
  public:
    explicit CacheMatrixImpl(MatrixXd matrix);

    // Replaces the matrix and discards the inverse.
    void set(MatrixXd matrix);
    MatrixXd const& get() const { return matrix_; }

    void set_inverse(MatrixXd inverse);
    std::optional<MatrixXd> const& get_inverse() const { return inverse_; }

  private:
    MatrixXd matrix_;
    std::optional<MatrixXd> inverse_;
};

} // namespace cmat
