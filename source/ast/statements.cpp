#include <string>

#include "statements.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto let_statement::string() const -> std::string
{
    return fmt::format("{} {} = {};", token_literal(), string_of(name), string_of(value));
}

void let_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto return_statement::string() const -> std::string
{
    return fmt::format("{} {};", token_literal(), string_of(value));
}

void return_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto expression_statement::string() const -> std::string
{
    return string_of(expr);
}

void expression_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
