#include <string>

#include "binary_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto binary_expression::string() const -> std::string
{
    return fmt::format("({} {} {})", string_of(left), op, string_of(right));
}

void binary_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
