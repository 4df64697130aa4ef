#include <ostream>
#include <stdexcept>
#include <string>

#include "error.hpp"

auto operator<<(std::ostream& ostream, error_kind kind) -> std::ostream&
{
    using enum error_kind;
    switch (kind) {
        case syntax:
            return ostream << "syntax";
        case evaluation:
            return ostream << "evaluation";
        case resource:
            return ostream << "resource";
    }
    throw std::invalid_argument("invalid error_kind");
}

error::error(error_kind kind, const std::string& message)
    : std::runtime_error {message}
    , m_kind {kind}
{
}

auto error::kind() const -> error_kind
{
    return m_kind;
}

syntax_error::syntax_error(const std::string& message)
    : error {error_kind::syntax, message}
{
}

evaluation_error::evaluation_error(const std::string& message)
    : error {error_kind::evaluation, message}
{
}

resource_error::resource_error(const std::string& message)
    : error {error_kind::resource, message}
{
}
