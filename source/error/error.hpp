#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/ostream.h>

enum class error_kind : std::uint8_t
{
    syntax,
    evaluation,
    resource,
};

auto operator<<(std::ostream& ostream, error_kind kind) -> std::ostream&;

template<>
struct fmt::formatter<error_kind> : ostream_formatter
{
};

class error : public std::runtime_error
{
  public:
    error(error_kind kind, const std::string& message);

    [[nodiscard]] auto kind() const -> error_kind;

  private:
    error_kind m_kind;
};

/// raised by the lexer and parser for malformed input
class syntax_error final : public error
{
  public:
    explicit syntax_error(const std::string& message);
};

/// raised for undefined variables and unknown operators
class evaluation_error final : public error
{
  public:
    explicit evaluation_error(const std::string& message);
};

/// raised when the input nests deeper than the configured limit
class resource_error final : public error
{
  public:
    explicit resource_error(const std::string& message);
};

template<typename... T>
[[noreturn]] auto fail_syntax(fmt::format_string<T...> fmt, T&&... args) -> void
{
    throw syntax_error(fmt::format(fmt, std::forward<T>(args)...));
}

template<typename... T>
[[noreturn]] auto fail_evaluation(fmt::format_string<T...> fmt, T&&... args) -> void
{
    throw evaluation_error(fmt::format(fmt, std::forward<T>(args)...));
}
