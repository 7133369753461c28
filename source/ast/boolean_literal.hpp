#pragma once

#include "expression.hpp"

struct boolean_literal final : expression
{
    boolean_literal(token tkn, bool val);
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    bool value {};
};
