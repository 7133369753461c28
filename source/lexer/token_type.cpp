#include <ostream>
#include <stdexcept>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case illegal:
            return ostream << "ILLEGAL";
        case eof:
            return ostream << "EOF";
        case assign:
            return ostream << "=";
        case asterisk:
            return ostream << "*";
        case comma:
            return ostream << ",";
        case exclamation:
            return ostream << "!";
        case greater_than:
            return ostream << ">";
        case less_than:
            return ostream << "<";
        case lparen:
            return ostream << "(";
        case lsquirly:
            return ostream << "{";
        case minus:
            return ostream << "-";
        case plus:
            return ostream << "+";
        case rparen:
            return ostream << ")";
        case rsquirly:
            return ostream << "}";
        case semicolon:
            return ostream << ";";
        case slash:
            return ostream << "/";
        case equals:
            return ostream << "==";
        case not_equals:
            return ostream << "!=";
        case ident:
            return ostream << "IDENT";
        case integer:
            return ostream << "INT";
        case let:
            return ostream << "LET";
        case ret:
            return ostream << "RETURN";
        case tru:
            return ostream << "TRUE";
        case fals:
            return ostream << "FALSE";
        case function:
            return ostream << "FUNCTION";
        case eef:
            return ostream << "IF";
        case elze:
            return ostream << "ELSE";
    }
    throw std::invalid_argument("invalid token_type");
}
