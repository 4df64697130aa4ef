#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "integer.hpp"

#include <error/error.hpp>

namespace
{
using unsigned_value = std::uint64_t;
}  // namespace

auto wrapping_add(integer_value left, integer_value right) -> integer_value
{
    return static_cast<integer_value>(static_cast<unsigned_value>(left) + static_cast<unsigned_value>(right));
}

auto wrapping_mul(integer_value left, integer_value right) -> integer_value
{
    return static_cast<integer_value>(static_cast<unsigned_value>(left) * static_cast<unsigned_value>(right));
}

auto parse_integer(std::string_view literal) -> integer_value
{
    try {
        return std::stoll(std::string {literal});
    } catch (const std::out_of_range&) {
        fail_syntax("could not parse {} as integer", literal);
    } catch (const std::invalid_argument&) {
        fail_syntax("could not parse {} as integer", literal);
    }
}
