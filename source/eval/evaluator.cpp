#include <cstdint>
#include <limits>
#include <type_traits>

#include "evaluator.hpp"

#include <ast/binary_expression.hpp>
#include <ast/boolean_literal.hpp>
#include <ast/expression.hpp>
#include <ast/identifier.hpp>
#include <ast/integer_literal.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>
#include <gc.hpp>
#include <lexer/token_type.hpp>
#include <object/object.hpp>

namespace
{
using value_type = integer_object::value_type;
using unsigned_value_type = std::make_unsigned_t<value_type>;

// two's complement wrap around instead of signed overflow
auto wrapping_add(value_type lhs, value_type rhs) -> value_type
{
    return static_cast<value_type>(static_cast<unsigned_value_type>(lhs) + static_cast<unsigned_value_type>(rhs));
}

auto wrapping_sub(value_type lhs, value_type rhs) -> value_type
{
    return static_cast<value_type>(static_cast<unsigned_value_type>(lhs) - static_cast<unsigned_value_type>(rhs));
}

auto wrapping_mul(value_type lhs, value_type rhs) -> value_type
{
    return static_cast<value_type>(static_cast<unsigned_value_type>(lhs) * static_cast<unsigned_value_type>(rhs));
}

auto wrapping_neg(value_type value) -> value_type
{
    return static_cast<value_type>(unsigned_value_type {0} - static_cast<unsigned_value_type>(value));
}

auto apply_bang_operator(const object* operand) -> const object*
{
    using enum object::object_type;
    if (operand->is(boolean)) {
        return native_bool_to_object(!operand->as<boolean_object>()->value);
    }
    if (operand->is(null)) {
        return native_true();
    }
    return native_false();
}

auto apply_minus_operator(const object* operand) -> const object*
{
    if (!operand->is(object::object_type::integer)) {
        return nullptr;
    }
    return make<integer_object>(wrapping_neg(operand->as<integer_object>()->value));
}

auto apply_integer_operator(token_type oper, value_type left, value_type right) -> const object*
{
    using enum token_type;
    switch (oper) {
        case plus:
            return make<integer_object>(wrapping_add(left, right));
        case minus:
            return make<integer_object>(wrapping_sub(left, right));
        case asterisk:
            return make<integer_object>(wrapping_mul(left, right));
        case slash:
            if (right == 0 || (left == std::numeric_limits<value_type>::min() && right == -1)) {
                return native_null();
            }
            return make<integer_object>(left / right);
        case less_than:
            return native_bool_to_object(left < right);
        case greater_than:
            return native_bool_to_object(left > right);
        case equals:
            return native_bool_to_object(left == right);
        case not_equals:
            return native_bool_to_object(left != right);
        default:
            return native_null();
    }
}

auto apply_boolean_operator(token_type oper, bool left, bool right) -> const object*
{
    switch (oper) {
        case token_type::equals:
            return native_bool_to_object(left == right);
        case token_type::not_equals:
            return native_bool_to_object(left != right);
        default:
            return native_null();
    }
}

auto apply_binary_operator(token_type oper, const object* left, const object* right) -> const object*
{
    using enum object::object_type;
    if (left->is(integer) && right->is(integer)) {
        return apply_integer_operator(oper, left->as<integer_object>()->value, right->as<integer_object>()->value);
    }
    if (left->is(boolean) && right->is(boolean)) {
        return apply_boolean_operator(oper, left->as<boolean_object>()->value, right->as<boolean_object>()->value);
    }
    return native_null();
}

}  // namespace

auto evaluator::evaluate(const expression& node) -> const object*
{
    m_result = nullptr;
    node.accept(*this);
    return m_result;
}

auto evaluator::evaluate_child(const expression_ptr& child) -> const object*
{
    if (child == nullptr) {
        return nullptr;
    }
    child->accept(*this);
    return m_result;
}

void evaluator::visit(const binary_expression& expr)
{
    const auto* evaluated_left = evaluate_child(expr.left);
    const auto* evaluated_right = evaluate_child(expr.right);
    if (evaluated_left == nullptr || evaluated_right == nullptr) {
        m_result = nullptr;
        return;
    }
    m_result = apply_binary_operator(expr.op, evaluated_left, evaluated_right);
}

void evaluator::visit(const boolean_literal& expr)
{
    m_result = native_bool_to_object(expr.value);
}

void evaluator::visit(const expression_statement& expr)
{
    m_result = evaluate_child(expr.expr);
}

void evaluator::visit(const identifier& /*expr*/)
{
    m_result = nullptr;
}

void evaluator::visit(const integer_literal& expr)
{
    m_result = make<integer_object>(expr.value);
}

void evaluator::visit(const let_statement& /*expr*/)
{
    m_result = nullptr;
}

void evaluator::visit(const program& expr)
{
    m_result = nullptr;
    for (const auto& statement : expr.statements) {
        m_result = evaluate_child(statement);
    }
}

void evaluator::visit(const return_statement& /*expr*/)
{
    m_result = nullptr;
}

void evaluator::visit(const unary_expression& expr)
{
    const auto* evaluated_value = evaluate_child(expr.right);
    if (evaluated_value == nullptr) {
        m_result = nullptr;
        return;
    }
    using enum token_type;
    switch (expr.op) {
        case exclamation:
            m_result = apply_bang_operator(evaluated_value);
            return;
        case minus:
            m_result = apply_minus_operator(evaluated_value);
            return;
        default:
            m_result = native_null();
            return;
    }
}
