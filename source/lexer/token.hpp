#pragma once

#include <cstddef>
#include <ostream>
#include <string_view>

#include <fmt/ostream.h>

#include "token_type.hpp"

struct token final
{
    token_type type;
    std::string_view literal;
    std::size_t position;
    auto operator==(const token& other) const -> bool = default;
};

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&;

template<>
struct fmt::formatter<token> : ostream_formatter
{
};
