#ifndef COMMON_COMMON_HPP
#define COMMON_COMMON_HPP

#include "biglist/common.hpp"

#include <fmt/ostream.h>
#include <gsl/gsl_util>
#include <spdlog/spdlog.h>

#include <iostream>

class exit_main {
public:
    int code = 0;

    exit_main(int code = 0): code(code) {}
};

/// Calls the function f and flushes all loggers afterwards.
/// Returns the value returned by `f`, which should be an int.
/// Throwing exit_main from `f` ends the program with the given code.
template<typename Func>
int run_main(Func&& f) {
    auto cleanup = gsl::finally([]{ spdlog::shutdown(); });

    try {
        return f();
    } catch (const exit_main& e) {
        return e.code;
    }
}

#endif // COMMON_COMMON_HPP
