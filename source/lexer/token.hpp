#pragma once

#include <ostream>
#include <string>

#include <fmt/ostream.h>

#include "token_type.hpp"

struct token final
{
    token_type type {token_type::illegal};
    std::string literal;
    auto operator==(const token& other) const -> bool = default;
};

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&;

template<>
struct fmt::formatter<token> : ostream_formatter
{
};
