#include "assert.hpp"
#include "cache_matrix.hpp"
#include "inverse.hpp"
#include "matrix.hpp"
#include <cachematrix/cachematrix.hpp>
#include <cachematrix/detail/cachematrix.h>

#include <fmt/format.h>

#include <algorithm>
#include <bit>
#include <stdexcept>
#include <string>

namespace cmat {

cmat_Api api_;
std::string last_error_;

static_assert(sizeof(cmat_MatrixView) == sizeof(MatrixView));
static_assert(sizeof(cmat_Options) == sizeof(Options));

cmat_CacheMatrix to_handle(CacheMatrixImpl const* m) { return std::bit_cast<cmat_CacheMatrix>(m); }
CacheMatrixImpl& to_impl(cmat_CacheMatrix m) { return *std::bit_cast<CacheMatrixImpl*>(m); }
MatrixView const& to_impl(cmat_MatrixView const* m) {
    return *std::bit_cast<MatrixView const*>(m);
}
Options const& to_impl(cmat_Options const* o) {
    static Options const defaults;
    return o ? *std::bit_cast<Options const*>(o) : defaults;
}

void to_api(MatrixXd const& m, cmat_MatrixView* out) {
    out->rows = int(m.rows());
    out->cols = int(m.cols());
    out->values = m.data();
}

cmat_Result set_last_error(std::exception const& e, cmat_Result result = cmat_error) {
    last_error_ = e.what();
    return result;
}

template <typename F> cmat_Result try_(F const& f) {
    try {
        f();
    } catch (NotInvertible const& e) {
        return set_last_error(e, cmat_not_invertible);
    } catch (std::exception const& e) {
        return set_last_error(e);
    } catch (...) {
        return set_last_error(std::runtime_error("Unknown error"));
    }
    return cmat_success;
}

cmat_Result create_cache_matrix(cmat_CacheMatrix* handle, cmat_MatrixView const* matrix) {
    return try_([=] { *handle = to_handle(new CacheMatrixImpl(as_matrix(to_impl(matrix)))); });
}

void destroy_cache_matrix(cmat_CacheMatrix handle) { delete &to_impl(handle); }

cmat_Result set_matrix(cmat_CacheMatrix handle, cmat_MatrixView const* matrix) {
    return try_([=] { to_impl(handle).set(as_matrix(to_impl(matrix))); });
}

void get_matrix(cmat_CacheMatrix handle, cmat_MatrixView* out_matrix) {
    to_api(to_impl(handle).get(), out_matrix);
}

cmat_Result set_inverse(cmat_CacheMatrix handle, cmat_MatrixView const* inverse) {
    return try_([=] { to_impl(handle).set_inverse(as_matrix(to_impl(inverse))); });
}

int get_inverse(cmat_CacheMatrix handle, cmat_MatrixView* out_inverse) {
    auto const& inverse = to_impl(handle).get_inverse();
    if (!inverse) {
        return 0;
    }
    to_api(*inverse, out_inverse);
    return 1;
}

cmat_Result solve(cmat_CacheMatrix handle, cmat_Options const* options,
                  cmat_MatrixView* out_inverse) {
    return try_([=] { to_api(cache_solve(to_impl(handle), to_impl(options)), out_inverse); });
}

cmat_Result solve_system(cmat_CacheMatrix handle, cmat_MatrixView const* rhs,
                         cmat_Options const* options, double* out_values, int out_size) {
    return try_([=] {
        auto b = as_matrix(to_impl(rhs));
        auto x = solve_system(to_impl(handle), b, to_impl(options));
        if (x.size() != out_size) {
            throw Exception(fmt::format("Solution has {} values, output holds {}", x.size(),
                                        out_size));
        }
        CMAT_ASSERT(out_values != nullptr || x.size() == 0);
        std::copy(x.data(), x.data() + x.size(), out_values);
    });
}

char const* last_error() { return last_error_.c_str(); }

} // namespace cmat

extern "C" {

cmat_Api const* cmat_init() {
    cmat::api_.create_cache_matrix = cmat::create_cache_matrix;
    cmat::api_.destroy_cache_matrix = cmat::destroy_cache_matrix;
    cmat::api_.set_matrix = cmat::set_matrix;
    cmat::api_.get_matrix = cmat::get_matrix;
    cmat::api_.set_inverse = cmat::set_inverse;
    cmat::api_.get_inverse = cmat::get_inverse;
    cmat::api_.solve = cmat::solve;
    cmat::api_.solve_system = cmat::solve_system;
    cmat::api_.last_error = cmat::last_error;
    return &cmat::api_;
}

} // extern "C"
