#include "matrix.hpp"
#include "test_utils.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cachematrix/cachematrix.hpp>

#include <array>

namespace cmat {

TEST_CASE("Matrix from rows", "[matrix]") {
    auto m = Matrix{{1, 2, 3}, {4, 5, 6}};
    CHECK(m.rows() == 2);
    CHECK(m.cols() == 3);
    CHECK(m.size() == 6);
    CHECK(m(0, 0) == 1);
    CHECK(m(0, 2) == 3);
    CHECK(m(1, 0) == 4);
    CHECK(m.values()[4] == 5);
}

TEST_CASE("Matrix rows must have equal length", "[matrix]") {
    CHECK_THROWS_AS((Matrix{{1, 2}, {3}}), Exception);
}

TEST_CASE("Matrix extent", "[matrix]") {
    SECTION("zero initialized") {
        auto const m = Matrix(2, 3);
        CHECK(m.size() == 6);
        for (int i = 0; i < 6; ++i) {
            CHECK(m.values()[i] == 0.0);
        }
    }
    SECTION("empty") {
        auto const m = Matrix();
        CHECK(m.rows() == 0);
        CHECK(m.cols() == 0);
        CHECK(m.size() == 0);
    }
    SECTION("negative") {
        CHECK_THROWS_AS(Matrix(-1, 2), Exception);
    }
    SECTION("missing values") {
        CHECK_THROWS_AS(Matrix(2, 2, nullptr), Exception);
    }
}

TEST_CASE("Matrix comparison", "[matrix]") {
    CHECK(Matrix{{1, 2}, {3, 4}} == Matrix{{1, 2}, {3, 4}});
    CHECK(Matrix{{1, 2}, {3, 4}} != Matrix{{1, 2}, {3, 5}});
    CHECK(Matrix{{1, 2, 3, 4}} != Matrix{{1, 2}, {3, 4}});
}

TEST_CASE("MatrixView", "[matrix]") {
    auto const m = Matrix{{1, 2}, {3, 4}, {5, 6}};
    auto const view = MatrixView(m);
    CHECK(view.rows == 3);
    CHECK(view.cols == 2);
    CHECK(view.values == m.values());
    CHECK(Matrix(view) == m);
}

TEST_CASE("validate", "[matrix]") {
    auto values = std::array{1.0, 2.0, 3.0, 4.0};
    CHECK_NOTHROW(validate(MatrixView(2, 2, values.data())));
    CHECK_NOTHROW(validate(MatrixView(0, 0, nullptr)));
    CHECK_NOTHROW(validate(MatrixView(0, 5, nullptr)));
    CHECK_THROWS_AS(validate(MatrixView(-2, 2, values.data())), Exception);
    CHECK_THROWS_AS(validate(MatrixView(2, 2, nullptr)), Exception);
}

TEST_CASE("as_matrix is row-major", "[matrix]") {
    auto const m = Matrix{{1, 2, 3}, {4, 5, 6}};
    auto map = as_matrix(m);
    CHECK(map.rows() == 2);
    CHECK(map.cols() == 3);
    CHECK(map(0, 1) == 2);
    CHECK(map(1, 0) == 4);
    CHECK(map.data() == m.values());

    MatrixXd copy = map;
    CHECK(Matrix(as_view(copy)) == m);
}

TEST_CASE("multiply", "[matrix]") {
    auto const a = Matrix{{1, 2}, {3, 4}};
    auto const b = Matrix{{0, 1}, {1, 0}};
    CHECK(multiply(a, b) == Matrix{{2, 1}, {4, 3}});
    CHECK(multiply(a, identity(2)) == a);
}

} // namespace cmat
