#pragma once

#include "expression.hpp"
#include "identifier.hpp"

using statement = expression;
using statement_ptr = expression_ptr;

struct let_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    identifier_ptr name;
    expression_ptr value;
};

struct return_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr value;
};

struct expression_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr;
};
