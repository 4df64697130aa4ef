#pragma once

#include <cstddef>
#include <string_view>

#include "integer.hpp"

struct evaluate_options final
{
    static constexpr std::size_t default_max_depth = 1024;

    std::size_t max_depth {default_max_depth};
};

/// Evaluates exactly one expression. Throws syntax_error, evaluation_error
/// or resource_error (see error/error.hpp) on the first problem found.
auto evaluate(std::string_view input, const evaluate_options& options = {}) -> integer_value;
