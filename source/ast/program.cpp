#include <string>

#include "program.hpp"

#include "util.hpp"
#include "visitor.hpp"

program::program()
    : expression {token {.type = token_type::eof, .literal = ""}}
{
}

auto program::string() const -> std::string
{
    return join(statements);
}

void program::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
