#include <string>
#include <utility>

#include "boolean_literal.hpp"

#include "visitor.hpp"

boolean_literal::boolean_literal(token tkn, bool val)
    : expression {std::move(tkn)}
    , value {val}
{
}

auto boolean_literal::string() const -> std::string
{
    return std::string {value ? "true" : "false"};
}

void boolean_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
