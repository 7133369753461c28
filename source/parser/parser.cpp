#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "parser.hpp"

#include <ast/binary_expression.hpp>
#include <ast/boolean_literal.hpp>
#include <ast/expression.hpp>
#include <ast/identifier.hpp>
#include <ast/integer_literal.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

namespace
{
enum precedence : std::uint8_t
{
    lowest,
    equals,
    lessgreater,
    sum,
    product,
    prefix,
    call,
};

// bounds the height of the tree, and with it the recursion of everything walking it
constexpr auto max_nesting_depth = 1000;

class nesting_guard final
{
  public:
    explicit nesting_guard(int& depth)
        : m_depth {depth}
        , m_saved {depth}
    {
    }

    nesting_guard(const nesting_guard&) = delete;
    nesting_guard(nesting_guard&&) = delete;
    auto operator=(const nesting_guard&) -> nesting_guard& = delete;
    auto operator=(nesting_guard&&) -> nesting_guard& = delete;

    ~nesting_guard() { m_depth = m_saved; }

    [[nodiscard]] auto enter() -> bool { return ++m_depth <= max_nesting_depth; }

  private:
    int& m_depth;
    int m_saved;
};

auto precedence_of_token(token_type type) -> std::uint8_t
{
    switch (type) {
        case token_type::equals:
        case token_type::not_equals:
            return equals;
        case token_type::less_than:
        case token_type::greater_than:
            return lessgreater;
        case token_type::plus:
        case token_type::minus:
            return sum;
        case token_type::slash:
        case token_type::asterisk:
            return product;
        default:
            return lowest;
    }
}
}  // namespace

parser::parser(lexer lxr)
    : m_lxr(std::move(lxr))
{
    next_token();
    next_token();
    using enum token_type;
    register_unary(ident, [this] { return parse_identifier(); });
    register_unary(integer, [this] { return parse_integer_literal(); });
    register_unary(exclamation, [this] { return parse_unary_expression(); });
    register_unary(minus, [this] { return parse_unary_expression(); });
    register_unary(tru, [this] { return parse_boolean(); });
    register_unary(fals, [this] { return parse_boolean(); });
    register_unary(lparen, [this] { return parse_grouped_expression(); });
    register_binary(plus, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(minus, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(slash, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(asterisk, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(equals, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(not_equals, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(less_than, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(greater_than, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
}

auto parser::parse_program() -> program_ptr
{
    auto prog = std::make_unique<program>();
    while (!current_token_is(token_type::eof)) {
        auto stmt = parse_statement();
        if (stmt != nullptr) {
            prog->statements.push_back(std::move(stmt));
        }
        next_token();
    }
    return prog;
}

auto parser::errors() const -> const std::vector<std::string>&
{
    return m_errors;
}

auto parser::next_token() -> void
{
    m_current_token = std::move(m_peek_token);
    m_peek_token = m_lxr.next_token();
}

auto parser::parse_statement() -> statement_ptr
{
    using enum token_type;
    switch (m_current_token.type) {
        case let:
            return parse_let_statement();
        case ret:
            return parse_return_statement();
        default:
            return parse_expression_statement();
    }
}

auto parser::parse_let_statement() -> statement_ptr
{
    using enum token_type;
    auto stmt = std::make_unique<let_statement>(m_current_token);
    if (!get(ident)) {
        return {};
    }
    stmt->name = parse_identifier();

    if (!get(assign)) {
        return {};
    }

    next_token();
    stmt->value = parse_expression(lowest);

    if (peek_token_is(semicolon)) {
        next_token();
    }
    return stmt;
}

auto parser::parse_return_statement() -> statement_ptr
{
    using enum token_type;
    auto stmt = std::make_unique<return_statement>(m_current_token);

    next_token();
    stmt->value = parse_expression(lowest);

    if (peek_token_is(semicolon)) {
        next_token();
    }
    return stmt;
}

auto parser::parse_expression_statement() -> statement_ptr
{
    auto expr_stmt = std::make_unique<expression_statement>(m_current_token);
    expr_stmt->expr = parse_expression(lowest);
    if (peek_token_is(token_type::semicolon)) {
        next_token();
    }
    return expr_stmt;
}

auto parser::parse_expression(int precedence) -> expression_ptr
{
    auto nesting = nesting_guard {m_depth};
    if (!nesting.enter()) {
        new_error("expression nested too deeply");
        return {};
    }
    const auto unary = m_unary_parsers.find(m_current_token.type);
    if (unary == m_unary_parsers.end()) {
        no_unary_expression_error(m_current_token);
        return {};
    }
    auto left_expr = unary->second();
    while (!peek_token_is(token_type::semicolon) && precedence < peek_precedence()) {
        const auto binary = m_binary_parsers.find(m_peek_token.type);
        if (binary == m_binary_parsers.end()) {
            return left_expr;
        }
        // every operator folded into left_expr adds a level to the tree
        if (!nesting.enter()) {
            new_error("expression nested too deeply");
            return left_expr;
        }
        next_token();

        left_expr = binary->second(std::move(left_expr));
    }
    return left_expr;
}

auto parser::parse_identifier() const -> identifier_ptr
{
    return std::make_unique<identifier>(m_current_token, m_current_token.literal);
}

auto parser::parse_integer_literal() -> expression_ptr
{
    auto lit = std::make_unique<integer_literal>(m_current_token);
    try {
        lit->value = std::stoll(m_current_token.literal);
    } catch (const std::out_of_range&) {
        new_error("could not parse {} as integer", m_current_token.literal);
        return {};
    }
    return lit;
}

auto parser::parse_unary_expression() -> expression_ptr
{
    auto unary = std::make_unique<unary_expression>(m_current_token);
    unary->op = m_current_token.type;

    next_token();
    unary->right = parse_expression(prefix);
    return unary;
}

auto parser::parse_boolean() const -> expression_ptr
{
    return std::make_unique<boolean_literal>(m_current_token, current_token_is(token_type::tru));
}

auto parser::parse_grouped_expression() -> expression_ptr
{
    next_token();
    auto exp = parse_expression(lowest);
    if (!get(token_type::rparen)) {
        return {};
    }
    return exp;
}

auto parser::parse_binary_expression(expression_ptr left) -> expression_ptr
{
    auto bin_expr = std::make_unique<binary_expression>(m_current_token);
    bin_expr->op = m_current_token.type;
    bin_expr->left = std::move(left);

    auto precedence = current_precedence();
    next_token();
    bin_expr->right = parse_expression(precedence);

    return bin_expr;
}

auto parser::get(token_type type) -> bool
{
    if (m_peek_token.type == type) {
        next_token();
        return true;
    }
    peek_error(type);
    return false;
}

auto parser::peek_error(token_type type) -> void
{
    new_error("expected next token to be {}, got {} instead", type, m_peek_token.type);
}

auto parser::register_binary(token_type type, binary_parser binary) -> void
{
    m_binary_parsers[type] = std::move(binary);
}

auto parser::register_unary(token_type type, unary_parser unary) -> void
{
    m_unary_parsers[type] = std::move(unary);
}

auto parser::current_token_is(token_type type) const -> bool
{
    return m_current_token.type == type;
}

auto parser::peek_token_is(token_type type) const -> bool
{
    return m_peek_token.type == type;
}

auto parser::no_unary_expression_error(const token& tkn) -> void
{
    new_error("no prefix parse function for {} found", tkn.literal);
}

auto parser::peek_precedence() const -> int
{
    return precedence_of_token(m_peek_token.type);
}

auto parser::current_precedence() const -> int
{
    return precedence_of_token(m_current_token.type);
}
