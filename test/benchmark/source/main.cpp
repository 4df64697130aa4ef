#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include <eval/evaluator.hpp>
#include <fmt/format.h>

namespace
{
constexpr std::size_t default_depth = 1000;
constexpr std::size_t iterations = 1000;

// (let x1 1 (let x2 (add x1 1) ... (mult xN 2)...)), one scope per level
auto nested_lets(std::size_t depth) -> std::string
{
    auto input = fmt::format("(let x1 1 ");
    for (std::size_t level = 2; level <= depth; ++level) {
        input += fmt::format("(let x{} (add x{} 1) ", level, level - 1);
    }
    input += fmt::format("(mult x{} 2)", depth);
    input.append(depth, ')');
    return input;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto depth = default_depth;
    for (const std::string_view arg : std::span(++argv, static_cast<std::size_t>(argc - 1))) {
        if (arg == "--shallow") {
            depth = default_depth / 10;
        }
    }

    const auto input = nested_lets(depth);
    const auto options = evaluate_options {.max_depth = (2 * depth) + 2};
    integer_value result {};
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        result = evaluate(input, options);
    }
    auto end = std::chrono::steady_clock::now();
    const std::chrono::duration<double> duration = end - start;
    fmt::print("depth={}, iterations={}, result={}, duration={:.6f}s\n", depth, iterations, result, duration.count());
    return 0;
}
