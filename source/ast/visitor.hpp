#pragma once

#include <ast/binary_expression.hpp>
#include <ast/boolean_literal.hpp>
#include <ast/expression.hpp>
#include <ast/identifier.hpp>
#include <ast/integer_literal.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>

struct visitor
{
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;
    visitor() = default;
    virtual ~visitor() = default;

    virtual void visit(const binary_expression& expr) = 0;
    virtual void visit(const boolean_literal& expr) = 0;
    virtual void visit(const expression_statement& expr) = 0;
    virtual void visit(const identifier& expr) = 0;
    virtual void visit(const integer_literal& expr) = 0;
    virtual void visit(const let_statement& expr) = 0;
    virtual void visit(const program& expr) = 0;
    virtual void visit(const return_statement& expr) = 0;
    virtual void visit(const unary_expression& expr) = 0;
};
