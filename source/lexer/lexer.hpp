#pragma once

#include <string_view>

#include "token.hpp"

/// Produces tokens on demand. Spaces are tokens of their own, everything
/// else that is not a paren, integer or identifier is a syntax_error.
class lexer final
{
  public:
    explicit lexer(std::string_view input);

    auto next_token() -> token;

  private:
    auto read_char() -> void;
    auto peek_char() const -> std::string_view::value_type;
    auto at_end() const -> bool;
    auto read_identifier() -> token;
    auto read_number() -> token;

    std::string_view m_input;
    std::string_view::size_type m_position {0};
    std::string_view::size_type m_read_position {0};
    std::string_view::value_type m_byte {0};
};
