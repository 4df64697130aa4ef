#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "parser.hpp"

#include <error/error.hpp>
#include <eval/environment.hpp>
#include <eval/integer.hpp>
#include <fmt/format.h>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

namespace
{
using operator_pair = std::pair<std::string_view, binary_operation>;

constexpr auto binary_operator_count = 2;
constexpr std::array<operator_pair, binary_operator_count> binary_operators {
    std::pair {"add", &wrapping_add},
    std::pair {"mult", &wrapping_mul},
};

constexpr std::string_view let_keyword = "let";

auto describe(const token& tok) -> std::string
{
    using enum token_type;
    switch (tok.type) {
        case eof:
            return "end of input";
        case space:
            return "space";
        case lparen:
        case rparen:
            return fmt::format("`{}`", tok.literal);
        default:
            return fmt::format("{} `{}`", tok.type, tok.literal);
    }
}

class depth_guard final
{
  public:
    depth_guard(std::size_t& depth, std::size_t max_depth, std::size_t position)
        : m_depth {depth}
    {
        if (m_depth >= max_depth) {
            throw resource_error(
                fmt::format("maximum nesting depth of {} exceeded at position {}", max_depth, position));
        }
        ++m_depth;
    }

    ~depth_guard() { --m_depth; }

    depth_guard(const depth_guard&) = delete;
    depth_guard(depth_guard&&) = delete;
    auto operator=(const depth_guard&) -> depth_guard& = delete;
    auto operator=(depth_guard&&) -> depth_guard& = delete;

  private:
    std::size_t& m_depth;
};

}  // namespace

parser::parser(lexer lxr, std::size_t max_depth)
    : m_lxr(lxr)
    , m_max_depth {max_depth}
{
    next_token();
}

auto parser::parse_program() -> integer_value
{
    if (current_token_is(token_type::space)) {
        next_token();
    }
    const auto root = environment {};
    const auto result = parse_expression(root);
    if (!current_token_is(token_type::eof)) {
        fail_syntax("extra characters at end of input: {} at position {}",
                    describe(m_current_token),
                    m_current_token.position);
    }
    return result;
}

auto parser::next_token() -> void
{
    if (m_peek_token.has_value()) {
        m_current_token = *m_peek_token;
        m_peek_token.reset();
        return;
    }
    m_current_token = m_lxr.next_token();
}

auto parser::peek_token() -> const token&
{
    if (!m_peek_token.has_value()) {
        m_peek_token = m_lxr.next_token();
    }
    return *m_peek_token;
}

auto parser::parse_expression(const environment& env) -> integer_value
{
    const depth_guard guard {m_depth, m_max_depth, m_current_token.position};
    using enum token_type;
    switch (m_current_token.type) {
        case integer:
            return parse_integer_literal();
        case ident:
            return parse_identifier(env);
        case lparen:
            return parse_form(env);
        case eof:
            fail_syntax("unexpected end of input");
        default:
            fail_syntax("unexpected token {} at position {}", describe(m_current_token), m_current_token.position);
    }
}

auto parser::parse_integer_literal() -> integer_value
{
    const auto value = parse_integer(m_current_token.literal);
    next_token();
    return value;
}

auto parser::parse_identifier(const environment& env) -> integer_value
{
    const auto value = env.get(m_current_token.literal);
    next_token();
    return value;
}

auto parser::parse_form(const environment& env) -> integer_value
{
    const auto position = m_current_token.position;
    get(token_type::lparen);
    if (!current_token_is(token_type::ident)) {
        fail_syntax("expected an operator or keyword after ( at position {}, got {} instead",
                    position,
                    describe(m_current_token));
    }
    const auto keyword = m_current_token.literal;
    next_token();

    // NOLINTBEGIN(*-qualified-auto)
    const auto itr = std::find_if(binary_operators.cbegin(),
                                  binary_operators.cend(),
                                  [&keyword](const auto& pair) -> bool { return pair.first == keyword; });
    if (itr != binary_operators.cend()) {
        return parse_binary_form(itr->first, itr->second, env);
    }
    // NOLINTEND(*-qualified-auto)
    if (keyword == let_keyword) {
        return parse_let_form(env);
    }
    fail_evaluation("unknown operator or keyword: {}", keyword);
}

auto parser::parse_binary_form(std::string_view oper, binary_operation operation, const environment& env)
    -> integer_value
{
    using enum token_type;
    get(space);
    const auto left = parse_expression(env);
    get(space);
    const auto right = parse_expression(env);
    if (current_token_is(space) && !peek_token_is(rparen)) {
        const auto& extra = peek_token();
        fail_syntax("{} takes exactly two operands: expected ), got {} at position {}",
                    oper,
                    describe(extra),
                    extra.position);
    }
    get(rparen);
    return operation(left, right);
}

auto parser::parse_let_form(const environment& env) -> integer_value
{
    using enum token_type;
    auto scope = environment {&env};
    get(space);
    while (current_token_is(ident)) {
        if (peek_token_is(rparen)) {
            break;
        }
        const auto name = m_current_token;
        next_token();
        if (!current_token_is(space)) {
            fail_syntax("malformed let binding list: `{}` at position {} is not followed by a value, got {}",
                        name.literal,
                        name.position,
                        describe(m_current_token));
        }
        next_token();
        const auto value = parse_expression(scope);
        scope.set(std::string {name.literal}, value);
        if (!current_token_is(rparen)) {
            get(space);
        }
    }
    if (current_token_is(rparen)) {
        fail_syntax("let without body expression at position {}", m_current_token.position);
    }
    const auto body = parse_expression(scope);
    get(rparen);
    return body;
}

auto parser::get(token_type type) -> void
{
    if (m_current_token.type != type) {
        fail_syntax("expected {}, got {} at position {}", type, describe(m_current_token), m_current_token.position);
    }
    next_token();
}

auto parser::current_token_is(token_type type) const -> bool
{
    return m_current_token.type == type;
}

auto parser::peek_token_is(token_type type) -> bool
{
    return peek_token().type == type;
}
