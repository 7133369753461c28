#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <ast/expression.hpp>
#include <ast/identifier.hpp>
#include <ast/program.hpp>
#include <fmt/format.h>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>

/// Pratt parser turning the lexer's tokens into a program.
///
/// Syntax errors never abort the parse: they are collected as messages and
/// parse_program() always returns a program, possibly with statements that
/// lack a child. Check errors() before trusting the tree.
class parser final
{
  public:
    explicit parser(lexer lxr);
    parser(const parser&) = delete;
    parser(parser&&) = delete;
    auto operator=(const parser&) -> parser& = delete;
    auto operator=(parser&&) -> parser& = delete;
    ~parser() = default;

    auto parse_program() -> program_ptr;
    [[nodiscard]] auto errors() const -> const std::vector<std::string>&;

  private:
    using binary_parser = std::function<expression_ptr(expression_ptr)>;
    using unary_parser = std::function<expression_ptr()>;

    auto next_token() -> void;
    auto parse_statement() -> statement_ptr;
    auto parse_let_statement() -> statement_ptr;
    auto parse_return_statement() -> statement_ptr;
    auto parse_expression_statement() -> statement_ptr;

    auto parse_expression(int precedence) -> expression_ptr;
    [[nodiscard]] auto parse_identifier() const -> identifier_ptr;
    auto parse_integer_literal() -> expression_ptr;
    auto parse_unary_expression() -> expression_ptr;
    auto parse_binary_expression(expression_ptr left) -> expression_ptr;
    [[nodiscard]] auto parse_boolean() const -> expression_ptr;
    auto parse_grouped_expression() -> expression_ptr;

    auto get(token_type type) -> bool;
    [[nodiscard]] auto current_token_is(token_type type) const -> bool;
    [[nodiscard]] auto peek_token_is(token_type type) const -> bool;
    auto peek_error(token_type type) -> void;
    auto register_binary(token_type type, binary_parser binary) -> void;
    auto register_unary(token_type type, unary_parser unary) -> void;
    auto no_unary_expression_error(const token& tkn) -> void;
    [[nodiscard]] auto peek_precedence() const -> int;
    [[nodiscard]] auto current_precedence() const -> int;

    template<typename... T>
    auto new_error(fmt::format_string<T...> fmt, T&&... args)
    {
        m_errors.push_back(fmt::format(fmt, std::forward<T>(args)...));
    }

    lexer m_lxr;
    token m_current_token {};
    token m_peek_token {};
    std::vector<std::string> m_errors {};
    int m_depth {};

    std::unordered_map<token_type, unary_parser> m_unary_parsers;
    std::unordered_map<token_type, binary_parser> m_binary_parsers;
};
