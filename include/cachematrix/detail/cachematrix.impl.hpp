// inline implementation for public header cachematrix.hpp

#include <algorithm>
#include <string>

namespace cmat {

inline void initialize(cmat_Api const* api) { detail::Global<void>::api_ = api; }

inline void throw_on_error(cmat_Result result) {
    if (result == cmat_not_invertible) {
        throw NotInvertible(api().last_error());
    }
    if (result == cmat_error) {
        throw Exception(api().last_error());
    }
}

// MatrixView

inline MatrixView::MatrixView(int rows, int cols, double const* values) noexcept
    : rows(rows), cols(cols), values(values) {}

inline MatrixView::MatrixView(Matrix const& m) noexcept
    : rows(m.rows()), cols(m.cols()), values(m.values()) {}

inline cmat_MatrixView const* to_api(MatrixView const& m) {
    return reinterpret_cast<cmat_MatrixView const*>(&m);
}

inline MatrixView from_api(cmat_MatrixView const& m) {
    return MatrixView(m.rows, m.cols, m.values);
}

// Matrix

inline size_t checked_size(int rows, int cols) {
    if (rows < 0 || cols < 0) {
        throw Exception("Invalid matrix extent " + std::to_string(rows) + " x " +
                        std::to_string(cols));
    }
    return size_t(rows) * size_t(cols);
}

inline Matrix::Matrix(int rows, int cols)
    : rows_(rows), cols_(cols), values_(checked_size(rows, cols), 0.0) {}

inline Matrix::Matrix(int rows, int cols, double const* values) : Matrix(rows, cols) {
    if (!values_.empty()) {
        if (!values) {
            throw Exception("Matrix values are missing");
        }
        std::copy(values, values + values_.size(), values_.begin());
    }
}

inline Matrix::Matrix(std::initializer_list<std::initializer_list<double>> rows)
    : rows_(int(rows.size())), cols_(rows.size() > 0 ? int(rows.begin()->size()) : 0) {
    values_.reserve(size_t(rows_) * size_t(cols_));
    for (auto&& row : rows) {
        if (int(row.size()) != cols_) {
            throw Exception("All matrix rows must have the same number of values");
        }
        values_.insert(values_.end(), row.begin(), row.end());
    }
}

inline Matrix::Matrix(MatrixView const& view) : Matrix(view.rows, view.cols, view.values) {}

inline bool operator==(Matrix const& a, Matrix const& b) {
    return a.rows() == b.rows() && a.cols() == b.cols() &&
           std::equal(a.values(), a.values() + a.size(), b.values());
}

inline bool operator!=(Matrix const& a, Matrix const& b) { return !(a == b); }

// Options

inline cmat_Options const* to_api(Options const& o) {
    return reinterpret_cast<cmat_Options const*>(&o);
}

// CacheMatrix

inline CacheMatrix::CacheMatrix(MatrixView const& matrix) {
    throw_on_error(api().create_cache_matrix(&emplace(), to_api(matrix)));
}

inline CacheMatrix::CacheMatrix(std::nullptr_t) noexcept {}

inline void CacheMatrix::set(MatrixView const& matrix) {
    throw_on_error(api().set_matrix(handle(), to_api(matrix)));
}

inline Matrix CacheMatrix::get() const {
    cmat_MatrixView result{};
    api().get_matrix(handle(), &result);
    return Matrix(from_api(result));
}

inline void CacheMatrix::set_inverse(MatrixView const& inverse) {
    throw_on_error(api().set_inverse(handle(), to_api(inverse)));
}

inline std::optional<Matrix> CacheMatrix::get_inverse() const {
    cmat_MatrixView result{};
    if (api().get_inverse(handle(), &result) == 0) {
        return std::nullopt;
    }
    return Matrix(from_api(result));
}

// Inverse computation

inline Matrix solve(CacheMatrix& m, Options const& options) {
    cmat_MatrixView result{};
    throw_on_error(api().solve(m.handle(), to_api(options), &result));
    return Matrix(from_api(result));
}

inline Matrix solve(CacheMatrix& m, MatrixView const& rhs, Options const& options) {
    cmat_MatrixView a{};
    api().get_matrix(m.handle(), &a);
    auto result = Matrix(a.rows, rhs.cols);
    throw_on_error(api().solve_system(m.handle(), to_api(rhs), to_api(options), result.values(),
                                      int(result.size())));
    return result;
}

} // namespace cmat
