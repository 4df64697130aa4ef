#include <string_view>
#include <type_traits>
#include <utility>

#include "evaluator.hpp"

#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

#include "integer.hpp"

static_assert(std::is_same_v<decltype(std::declval<parser&>().parse_program()), integer_value>,
              "every expression evaluates to an integer");

auto evaluate(std::string_view input, const evaluate_options& options) -> integer_value
{
    auto prsr = parser {lexer {input}, options.max_depth};
    return prsr.parse_program();
}
