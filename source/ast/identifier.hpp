#pragma once

#include <memory>
#include <string>
#include <utility>

#include "expression.hpp"

struct identifier final : expression
{
    identifier(token tkn, std::string val)
        : expression {std::move(tkn)}
        , value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string override;
    void accept(struct visitor& visitor) const override;

    std::string value;
};

using identifier_ptr = std::unique_ptr<identifier>;
