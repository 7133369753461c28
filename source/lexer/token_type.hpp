#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    // special tokens
    illegal,
    eof,

    // single character tokens
    assign,
    asterisk,
    comma,
    exclamation,
    greater_than,
    less_than,
    lparen,
    lsquirly,
    minus,
    plus,
    rparen,
    rsquirly,
    semicolon,
    slash,

    // two character tokens
    equals,
    not_equals,

    // multi character tokens
    ident,
    integer,

    // keywords
    let,
    ret,
    tru,
    fals,

    // reserved keywords
    function,
    eef,
    elze,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
