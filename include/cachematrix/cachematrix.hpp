// cachematrix.hpp
// C++ library which caches the inverse of a matrix so that it is only computed once

#pragma once

#include <cachematrix/detail/cachematrix.h>
#include <cachematrix/detail/handle.hpp>

#include <cstddef>
#include <exception>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cmat {
class Matrix;

//
// Matrix values

// Read-only view of a dense matrix. Does not own the values.
// Values are expected to be row-major: values[row * cols + col].
struct MatrixView {
    int rows = 0;
    int cols = 0;
    double const* values = nullptr;

    MatrixView() noexcept = default;
    MatrixView(int rows, int cols, double const* values) noexcept;
    MatrixView(Matrix const&) noexcept;
};

// Dense matrix of doubles stored in row-major order.
class Matrix {
  public:
    Matrix() = default;

    // Allocate a matrix with all values set to zero.
    Matrix(int rows, int cols);

    // Copy rows * cols values from a row-major array.
    Matrix(int rows, int cols, double const* values);

    // Construct from a list of rows, eg. Matrix{{1, 2}, {3, 4}}. All rows must have the same
    // length.
    Matrix(std::initializer_list<std::initializer_list<double>> rows);

    explicit Matrix(MatrixView const&);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }
    size_t size() const noexcept { return values_.size(); }
    double* values() noexcept { return values_.data(); }
    double const* values() const noexcept { return values_.data(); }

    double& operator()(int row, int col) { return values_[row * cols_ + col]; }
    double operator()(int row, int col) const { return values_[row * cols_ + col]; }

  private:
    int rows_ = 0;
    int cols_ = 0;
    std::vector<double> values_;
};

bool operator==(Matrix const&, Matrix const&);
bool operator!=(Matrix const&, Matrix const&);

//
// Inverse computation

// Called each time a cached inverse is returned instead of being computed.
using CacheHitCallback = void (*)(void* user_data);

// Options for computing the inverse.
struct Options {
    // Matrices whose estimated reciprocal condition number is below this value are rejected as
    // computationally singular. Set to 0 to only reject exactly singular matrices. Negative or
    // NaN values are an error.
    double tolerance = std::numeric_limits<double>::epsilon();

    // Receives cache hit notifications. If null, "getting cached data" is printed to stderr.
    // If the callback replaces the matrix being solved, solve() returns the inverse of the new
    // matrix.
    CacheHitCallback on_cache_hit = nullptr;
    void* user_data = nullptr;
};

// Wraps a matrix together with its inverse, once it has been computed. Setting a new matrix
// discards the inverse. The inverse is computed by solve().
// CacheMatrix objects are not safe to use from multiple threads.
class CacheMatrix : public Handle<cmat_CacheMatrix_> {
  public:
    // Store a copy of the matrix. It is not checked for being square or invertible here.
    explicit CacheMatrix(MatrixView const&);

    CacheMatrix(std::nullptr_t) noexcept;

    // Replace the matrix. Always discards the cached inverse, even if the values are equal.
    void set(MatrixView const&);
    Matrix get() const;

    // Store an inverse for the current matrix. The values are taken as they are.
    void set_inverse(MatrixView const&);

    // Returns the cached inverse, or nothing if it hasn't been computed (or set) yet.
    std::optional<Matrix> get_inverse() const;
};

// Returns the inverse of the wrapped matrix. The first call computes and caches it, following
// calls return the cached inverse and notify Options::on_cache_hit.
// Throws NotInvertible if the matrix is not square or is singular.
Matrix solve(CacheMatrix&, Options const& = {});

// Solves the linear system A * x = rhs using the cached inverse of A (computing it if needed).
// Throws Exception if a stored inverse doesn't have as many rows as A.
Matrix solve(CacheMatrix&, MatrixView const& rhs, Options const& = {});

//
// API and error handling

// Initialize the C API. This is called automatically when linking at compile time.
// To load the library dynamically at runtime, define CACHEMATRIX_LOAD_DYNAMIC, resolve
// the symbol for the cmat_init function, and pass its result to this function.
void initialize(cmat_Api const* = cmat_init());

// The exception type thrown by functions in this library (unless marked noexcept).
class Exception : public std::exception {
  public:
    explicit Exception(std::string msg) : msg_(std::move(msg)) {}
    char const* what() const noexcept override { return msg_.c_str(); }

  private:
    std::string msg_;
};

// Thrown when the inverse is requested for a matrix which doesn't have one.
class NotInvertible : public Exception {
  public:
    using Exception::Exception;
};

} // namespace cmat

#include <cachematrix/detail/cachematrix.impl.hpp>
