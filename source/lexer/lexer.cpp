#include <cctype>
#include <string_view>

#include "lexer.hpp"

#include <error/error.hpp>

#include "token.hpp"
#include "token_type.hpp"

namespace
{
inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0;
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

}  // namespace

lexer::lexer(std::string_view input)
    : m_input {input}
{
    read_char();
}

auto lexer::next_token() -> token
{
    using enum token_type;
    const auto position = m_position;
    if (at_end()) {
        return token {.type = eof, .literal = "", .position = position};
    }
    switch (m_byte) {
        case ' ':
            return read_char(), token {.type = space, .literal = m_input.substr(position, 1), .position = position};
        case '(':
            return read_char(), token {.type = lparen, .literal = m_input.substr(position, 1), .position = position};
        case ')':
            return read_char(), token {.type = rparen, .literal = m_input.substr(position, 1), .position = position};
        default:
            break;
    }
    if (is_digit(m_byte) || (m_byte == '-' && is_digit(peek_char()))) {
        return read_number();
    }
    if (is_letter(m_byte)) {
        return read_identifier();
    }
    fail_syntax("unexpected character '{}' at position {}", m_byte, position);
}

auto lexer::read_char() -> void
{
    if (m_read_position >= m_input.size()) {
        m_byte = '\0';
    } else {
        m_byte = m_input[m_read_position];
    }
    m_position = m_read_position;
    if (m_read_position < m_input.size()) {
        m_read_position++;
    }
}

auto lexer::peek_char() const -> std::string_view::value_type
{
    if (m_read_position >= m_input.size()) {
        return '\0';
    }
    return m_input[m_read_position];
}

auto lexer::at_end() const -> bool
{
    return m_position >= m_input.size();
}

auto lexer::read_identifier() -> token
{
    const auto position = m_position;
    while (!at_end() && (is_letter(m_byte) || is_digit(m_byte))) {
        read_char();
    }
    return token {
        .type = token_type::ident,
        .literal = m_input.substr(position, m_position - position),
        .position = position,
    };
}

auto lexer::read_number() -> token
{
    const auto position = m_position;
    if (m_byte == '-') {
        read_char();
    }
    while (!at_end() && is_digit(m_byte)) {
        read_char();
    }
    return token {
        .type = token_type::integer,
        .literal = m_input.substr(position, m_position - position),
        .position = position,
    };
}
