#pragma once

#include <algorithm>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

/// Renders a possibly missing child; a syntax error can leave a node without one.
template<typename Node>
auto string_of(const std::unique_ptr<Node>& node) -> std::string
{
    return node != nullptr ? node->string() : std::string {};
}

template<typename Node>
auto join(const std::vector<std::unique_ptr<Node>>& nodes, std::string_view sep = {}) -> std::string
{
    auto strs = std::vector<std::string>();
    std::transform(nodes.cbegin(), nodes.cend(), std::back_inserter(strs), [](const auto& node) {
        return string_of(node);
    });
    return fmt::format("{}", fmt::join(strs.cbegin(), strs.cend(), sep));
}
