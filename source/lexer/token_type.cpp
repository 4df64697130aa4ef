#include <ostream>
#include <stdexcept>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case eof:
            return ostream << "eof";
        case space:
            return ostream << "space";
        case lparen:
            return ostream << "(";
        case rparen:
            return ostream << ")";
        case ident:
            return ostream << "identifier";
        case integer:
            return ostream << "integer";
    }
    throw std::invalid_argument("invalid token_type");
}
