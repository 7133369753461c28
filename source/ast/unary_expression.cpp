#include <string>

#include "unary_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto unary_expression::string() const -> std::string
{
    return fmt::format("({}{})", op, string_of(right));
}

void unary_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
