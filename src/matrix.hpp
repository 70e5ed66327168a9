#pragma once

#include <cachematrix/cachematrix.hpp>

#include <Eigen/Dense>

namespace cmat {

// Row-major to match the layout of MatrixView and Matrix.
using MatrixXd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MatrixMap = Eigen::Map<MatrixXd const>;

// Throws if the view doesn't describe a matrix (negative extent, or missing values).
void validate(MatrixView const&);

MatrixMap as_matrix(MatrixView const&);
MatrixView as_view(MatrixXd const&);

} // namespace cmat
