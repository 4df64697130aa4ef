#pragma once

#include <cstdint>
#include <string_view>

using integer_value = std::int64_t;
using binary_operation = integer_value (*)(integer_value, integer_value);

// add and mult wrap around in two's complement instead of overflowing
auto wrapping_add(integer_value left, integer_value right) -> integer_value;
auto wrapping_mul(integer_value left, integer_value right) -> integer_value;

auto parse_integer(std::string_view literal) -> integer_value;
