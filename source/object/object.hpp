#pragma once

#include <cassert>
#include <cstdint>
#include <ostream>
#include <string>

#include <fmt/ostream.h>
#include <gc.hpp>

/// Runtime value produced by the evaluator.
///
/// Booleans and null only ever exist as the shared instances returned by
/// native_true(), native_false() and native_null(); integers are allocated
/// fresh through make<integer_object>().
struct object
{
    enum class object_type : std::uint8_t
    {
        integer,
        boolean,
        null,
    };

    object() = default;
    virtual ~object() = default;
    object(const object&) = delete;
    object(object&&) = delete;
    auto operator=(const object&) -> object& = delete;
    auto operator=(object&&) -> object& = delete;

    [[nodiscard]] auto is(object_type obj_type) const -> bool { return type() == obj_type; }

    template<typename T>
    [[nodiscard]] auto as() const -> const T*
    {
        assert(is(T::static_type));
        return static_cast<const T*>(this);
    }

    [[nodiscard]] virtual auto type() const -> object_type = 0;
    [[nodiscard]] virtual auto inspect() const -> std::string = 0;

    [[nodiscard]] virtual auto equals_to(const object* /*other*/) const -> bool { return false; }
};

auto operator<<(std::ostream& ostrm, object::object_type type) -> std::ostream&;

template<>
struct fmt::formatter<object::object_type> : ostream_formatter
{
};

struct integer_object final : object
{
    using value_type = std::int64_t;
    static constexpr auto static_type = object_type::integer;

    explicit integer_object(value_type val)
        : value {val}
    {
    }

    [[nodiscard]] auto type() const -> object_type override { return static_type; }

    [[nodiscard]] auto inspect() const -> std::string override { return std::to_string(value); }

    [[nodiscard]] auto equals_to(const object* other) const -> bool override
    {
        return other->is(type()) && other->as<integer_object>()->value == value;
    }

    value_type value {};
};

struct boolean_object final : object
{
    using value_type = bool;
    static constexpr auto static_type = object_type::boolean;

    explicit boolean_object(value_type val)
        : value {val}
    {
    }

    [[nodiscard]] auto type() const -> object_type override { return static_type; }

    [[nodiscard]] auto inspect() const -> std::string override { return value ? "true" : "false"; }

    [[nodiscard]] auto equals_to(const object* other) const -> bool override
    {
        return other->is(type()) && other->as<boolean_object>()->value == value;
    }

    value_type value {};
};

struct null_object final : object
{
    static constexpr auto static_type = object_type::null;

    [[nodiscard]] auto type() const -> object_type override { return static_type; }

    [[nodiscard]] auto inspect() const -> std::string override { return "null"; }

    [[nodiscard]] auto equals_to(const object* other) const -> bool override { return other->is(type()); }
};

auto native_true() -> const object*;
auto native_false() -> const object*;
auto native_null() -> const object*;
auto native_bool_to_object(bool val) -> const object*;
