#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <lexer/token.hpp>

/// Base of every syntax tree node. Each node keeps the token it was created
/// from, so token_literal() always reports the source text that started it.
struct expression
{
    explicit expression(token tkn)
        : tkn {std::move(tkn)}
    {
    }

    virtual ~expression() = default;
    expression(const expression&) = delete;
    expression(expression&&) = delete;
    auto operator=(const expression&) -> expression& = delete;
    auto operator=(expression&&) -> expression& = delete;

    [[nodiscard]] auto token_literal() const -> std::string_view { return tkn.literal; }

    [[nodiscard]] virtual auto string() const -> std::string = 0;
    virtual void accept(struct visitor& visitor) const = 0;

    token tkn;
};

using expression_ptr = std::unique_ptr<expression>;
