#include "test_utils.hpp"
#include "matrix.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <unistd.h>

namespace cmat {

Options HitCounter::options(double tolerance) {
    Options opts;
    opts.tolerance = tolerance;
    opts.on_cache_hit = [](void* user_data) { ++static_cast<HitCounter*>(user_data)->count; };
    opts.user_data = this;
    return opts;
}

StderrCapture::StderrCapture() {
    std::fflush(stderr);
    file_ = std::tmpfile();
    REQUIRE(file_ != nullptr);
    saved_ = dup(fileno(stderr));
    REQUIRE(saved_ >= 0);
    REQUIRE(dup2(fileno(file_), fileno(stderr)) >= 0);
}

StderrCapture::~StderrCapture() {
    std::fflush(stderr);
    if (saved_ >= 0) {
        dup2(saved_, fileno(stderr));
        close(saved_);
    }
    if (file_) {
        std::fclose(file_);
    }
}

std::string StderrCapture::text() {
    std::fflush(stderr);
    std::string result;
    std::rewind(file_);
    char buffer[256];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file_)) > 0) {
        result.append(buffer, n);
    }
    return result;
}

Matrix multiply(Matrix const& a, Matrix const& b) {
    REQUIRE(a.cols() == b.rows());
    MatrixXd product = as_matrix(a) * as_matrix(b);
    return Matrix(as_view(product));
}

Matrix identity(int n) {
    auto result = Matrix(n, n);
    for (int i = 0; i < n; ++i) {
        result(i, i) = 1.0;
    }
    return result;
}

Matrix example_matrix() { return Matrix{{1, 4, 6}, {2, 1, 7}, {3, 7, 8}}; }

Matrix example_inverse() {
    // adjugate / determinant (45)
    auto result = Matrix{{-41, 10, 22}, {5, -10, 5}, {11, 5, -7}};
    for (size_t i = 0; i < result.size(); ++i) {
        result.values()[i] /= 45.0;
    }
    return result;
}

void check_matrix_near(Matrix const& result, Matrix const& expected, double epsilon) {
    REQUIRE(result.rows() == expected.rows());
    REQUIRE(result.cols() == expected.cols());
    for (int i = 0; i < result.rows(); ++i) {
        for (int j = 0; j < result.cols(); ++j) {
            INFO("at (" << i << ", " << j << ")");
            CHECK(result(i, j) == Catch::Approx(expected(i, j)).margin(epsilon));
        }
    }
}

void check_is_inverse(Matrix const& m, Matrix const& inverse, double epsilon) {
    check_matrix_near(multiply(m, inverse), identity(m.rows()), epsilon);
}

} // namespace cmat
