#include "matrix.hpp"

#include <fmt/format.h>

namespace cmat {

void validate(MatrixView const& m) {
    if (m.rows < 0 || m.cols < 0) {
        throw Exception(fmt::format("Invalid matrix extent {} x {}", m.rows, m.cols));
    }
    if (m.values == nullptr && m.rows > 0 && m.cols > 0) {
        throw Exception(fmt::format("Matrix ({} x {}) has no values", m.rows, m.cols));
    }
}

MatrixMap as_matrix(MatrixView const& m) {
    validate(m);
    return MatrixMap(m.values, m.rows, m.cols);
}

MatrixView as_view(MatrixXd const& m) {
    return MatrixView(int(m.rows()), int(m.cols()), m.data());
}

} // namespace cmat
