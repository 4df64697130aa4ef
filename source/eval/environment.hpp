#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "integer.hpp"

/// One lexical scope. Lookups walk outwards through the enclosing scopes,
/// definitions only ever touch this one.
struct environment final
{
    explicit environment(const environment* outer_env = nullptr);

    auto get(std::string_view name) const -> integer_value;
    auto set(const std::string& name, integer_value val) -> void;

    std::unordered_map<std::string, integer_value> store;
    const environment* outer {};
};
