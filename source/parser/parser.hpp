#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include <eval/environment.hpp>
#include <eval/integer.hpp>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>

/// Recursive descent parser that evaluates each expression as soon as it
/// has been parsed. No syntax tree is built.
class parser final
{
  public:
    explicit parser(lexer lxr, std::size_t max_depth);

    auto parse_program() -> integer_value;

  private:
    auto next_token() -> void;
    auto peek_token() -> const token&;

    auto parse_expression(const environment& env) -> integer_value;
    auto parse_integer_literal() -> integer_value;
    auto parse_identifier(const environment& env) -> integer_value;
    auto parse_form(const environment& env) -> integer_value;
    auto parse_binary_form(std::string_view oper, binary_operation operation, const environment& env) -> integer_value;
    auto parse_let_form(const environment& env) -> integer_value;

    auto get(token_type type) -> void;
    auto current_token_is(token_type type) const -> bool;
    auto peek_token_is(token_type type) -> bool;

    lexer m_lxr;
    token m_current_token {};
    std::optional<token> m_peek_token;
    std::size_t m_depth {0};
    std::size_t m_max_depth;
};
