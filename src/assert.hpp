#pragma once

#include <cachematrix/cachematrix.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <string_view>

namespace cmat {

class AssertionFailure : public Exception {
  public:
    AssertionFailure(std::string_view msg) : Exception(std::string(msg)) {}
};

[[noreturn]] inline void assertion_failure(char const* file, int line, char const* expr) {
    auto msg = fmt::format("Assertion failed at {}:{}: {}", file, line, expr);
    fmt::print(stderr, "{}\n", msg);
    throw AssertionFailure(msg);
}

} // namespace cmat

#define CMAT_ASSERT(cond)                                                                          \
    if (!(cond)) {                                                                                 \
        ::cmat::assertion_failure(__FILE__, __LINE__, #cond);                                      \
    }
