// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <compare>
#include <concepts>
#include <cstddef>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace Quarry
{

namespace detail
{
    template <class... Ts>
    struct overloaded: Ts... // NOLINT(readability-identifier-naming)
    {
        using Ts::operator()...;
    };

    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    template <typename T>
    struct IsOptional: std::false_type
    {
    };

    template <typename T>
    struct IsOptional<std::optional<T>>: std::true_type
    {
    };
} // namespace detail

/// Tag type representing the absence of a value.
struct NullType
{
    constexpr auto operator<=>(NullType const&) const noexcept = default;
};

/// Used to indicate a null attribute value.
constexpr auto NullValue = NullType {};

/// Dynamically typed attribute value of a resource.
///
/// Integers are always stored as 64-bit signed integers and character data as std::string.
class QUARRY_API Value
{
  public:
    using InnerType = std::variant<NullType, bool, long long, double, std::string>;

    Value() = default;
    Value(Value const&) = default;
    Value(Value&&) noexcept = default;
    Value& operator=(Value const&) = default;
    Value& operator=(Value&&) noexcept = default;
    ~Value() = default;

    QUARRY_FORCE_INLINE Value(NullType /*null*/) noexcept {}

    QUARRY_FORCE_INLINE Value(std::nullptr_t /*null*/) noexcept {}

    QUARRY_FORCE_INLINE Value(bool value) noexcept:
        _value { value }
    {
    }

    template <std::integral T>
        requires(!std::same_as<T, bool> && !std::same_as<T, char>)
    QUARRY_FORCE_INLINE Value(T value) noexcept:
        _value { static_cast<long long>(value) }
    {
    }

    template <std::floating_point T>
    QUARRY_FORCE_INLINE Value(T value) noexcept:
        _value { static_cast<double>(value) }
    {
    }

    QUARRY_FORCE_INLINE Value(char const* value):
        _value { std::string(value) }
    {
    }

    QUARRY_FORCE_INLINE Value(std::string_view value):
        _value { std::string(value) }
    {
    }

    QUARRY_FORCE_INLINE Value(std::string value):
        _value { std::move(value) }
    {
    }

    template <typename T>
    QUARRY_FORCE_INLINE Value(std::optional<T> const& value):
        Value { value ? Value { *value } : Value {} }
    {
    }

    /// Check if the value is null.
    [[nodiscard]] QUARRY_FORCE_INLINE bool IsNull() const noexcept
    {
        return std::holds_alternative<NullType>(_value);
    }

    /// Check if the value holds the specified type.
    template <typename T>
    [[nodiscard]] QUARRY_FORCE_INLINE bool Is() const noexcept
    {
        return std::holds_alternative<T>(_value);
    }

    /// Retrieve the value as the specified type, throwing std::bad_variant_access on mismatch.
    template <typename T>
    [[nodiscard]] QUARRY_FORCE_INLINE T const& Get() const
    {
        return std::get<T>(_value);
    }

    [[nodiscard]] InnerType const& Inner() const noexcept
    {
        return _value;
    }

    [[nodiscard]] std::optional<bool> TryGetBool() const noexcept
    {
        if (auto const* v = std::get_if<bool>(&_value))
            return *v;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<long long> TryGetInteger() const noexcept
    {
        if (auto const* v = std::get_if<long long>(&_value))
            return *v;
        if (auto const* v = std::get_if<bool>(&_value))
            return *v ? 1 : 0;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<double> TryGetDouble() const noexcept
    {
        if (auto const* v = std::get_if<double>(&_value))
            return *v;
        if (auto const* v = std::get_if<long long>(&_value))
            return static_cast<double>(*v);
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::string_view> TryGetString() const noexcept
    {
        if (auto const* v = std::get_if<std::string>(&_value))
            return std::string_view(*v);
        return std::nullopt;
    }

    /// Converts the value into the given C++ type.
    ///
    /// std::optional<T> maps null to std::nullopt. Any other mismatch throws std::bad_variant_access.
    template <typename T>
    [[nodiscard]] T As() const
    {
        if constexpr (detail::IsOptional<T>::value)
        {
            if (IsNull())
                return std::nullopt;
            return As<typename T::value_type>();
        }
        else if constexpr (std::same_as<T, bool>)
        {
            if (auto v = TryGetBool(); v)
                return *v;
            if (auto v = TryGetInteger(); v)
                return *v != 0;
            throw std::bad_variant_access();
        }
        else if constexpr (std::integral<T>)
        {
            if (auto v = TryGetInteger(); v)
                return static_cast<T>(*v);
            throw std::bad_variant_access();
        }
        else if constexpr (std::floating_point<T>)
        {
            if (auto v = TryGetDouble(); v)
                return static_cast<T>(*v);
            throw std::bad_variant_access();
        }
        else if constexpr (std::same_as<T, std::string>)
        {
            return std::get<std::string>(_value);
        }
        else
        {
            static_assert(std::same_as<T, Value>, "Unsupported attribute value type");
            return *this;
        }
    }

    /// Strict equality: both sides hold the same alternative with an equal value.
    bool operator==(Value const& other) const = default;

    /// Relaxed equality: integers and floating point values of equal magnitude are equivalent.
    [[nodiscard]] bool Equivalent(Value const& other) const noexcept;

    /// Total ordering over values. Null sorts first, numbers compare by magnitude,
    /// values of unrelated types order by their type.
    [[nodiscard]] std::weak_ordering Compare(Value const& other) const noexcept;

    [[nodiscard]] std::size_t Hash() const noexcept;

    [[nodiscard]] std::string ToString() const;

    /// Renders the value for diagnostics, quoting character data.
    [[nodiscard]] std::string Inspect() const;

  private:
    InnerType _value {};
};

/// The ordered values of a model's key properties.
using Key = std::vector<Value>;

struct QUARRY_API KeyHash
{
    std::size_t operator()(Key const& key) const noexcept;
};

QUARRY_API std::string ToString(Key const& key);

} // namespace Quarry

template <>
struct std::hash<Quarry::Value>
{
    std::size_t operator()(Quarry::Value const& value) const noexcept
    {
        return value.Hash();
    }
};

template <>
struct std::formatter<Quarry::Value>: formatter<string>
{
    auto format(Quarry::Value const& value, format_context& ctx) const -> format_context::iterator
    {
        return std::formatter<string>::format(value.ToString(), ctx);
    }
};
