#pragma once

#include <memory>
#include <vector>

#include "expression.hpp"
#include "statements.hpp"

/// Root of a parsed source text; owns its statements in source order.
struct program final : expression
{
    program();
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::vector<statement_ptr> statements;
};

using program_ptr = std::unique_ptr<program>;
