#pragma once

#include <ast/expression.hpp>
#include <ast/visitor.hpp>
#include <object/object.hpp>

/// Tree-walking evaluator.
///
/// evaluate() reduces a node to an object, or to nullptr when the node has no
/// runtime meaning in this language (let, return, identifiers), when part of
/// the tree is missing after a syntax error, or when `-` is applied to a
/// non-integer. Operators applied to unsupported operand types yield
/// native_null(). Evaluation never throws and never modifies the tree.
struct evaluator final : visitor
{
    evaluator() = default;
    auto evaluate(const expression& node) -> const object*;

  protected:
    void visit(const binary_expression& expr) final;
    void visit(const boolean_literal& expr) final;
    void visit(const expression_statement& expr) final;
    void visit(const identifier& expr) final;
    void visit(const integer_literal& expr) final;
    void visit(const let_statement& expr) final;
    void visit(const program& expr) final;
    void visit(const return_statement& expr) final;
    void visit(const unary_expression& expr) final;

  private:
    auto evaluate_child(const expression_ptr& child) -> const object*;

    const object* m_result {};
};
