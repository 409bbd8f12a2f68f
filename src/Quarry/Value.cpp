// SPDX-License-Identifier: Apache-2.0

#include "Value.hpp"

#include <functional>

namespace Quarry
{

namespace
{

constexpr std::weak_ordering CompareDoubles(double a, double b) noexcept
{
    if (a < b)
        return std::weak_ordering::less;
    if (b < a)
        return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
}

std::size_t HashCombine(std::size_t seed, std::size_t value) noexcept
{
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

} // namespace

bool Value::Equivalent(Value const& other) const noexcept
{
    if (*this == other)
        return true;

    auto const lhs = TryGetDouble();
    auto const rhs = other.TryGetDouble();
    return lhs && rhs && *lhs == *rhs;
}

std::weak_ordering Value::Compare(Value const& other) const noexcept
{
    if (IsNull() || other.IsNull())
        return other.IsNull() <=> IsNull();

    if (auto const lhs = TryGetDouble(), rhs = other.TryGetDouble(); lhs && rhs)
    {
        auto const* lhsInt = std::get_if<long long>(&_value);
        auto const* rhsInt = std::get_if<long long>(&other._value);
        if (lhsInt && rhsInt)
            return *lhsInt <=> *rhsInt;
        return CompareDoubles(*lhs, *rhs);
    }

    if (_value.index() != other._value.index())
        return _value.index() <=> other._value.index();

    // clang-format off
    return std::visit(detail::overloaded {
        [&](bool v) -> std::weak_ordering { return v <=> std::get<bool>(other._value); },
        [&](std::string const& v) -> std::weak_ordering { return v <=> std::get<std::string>(other._value); },
        [&](auto const&) -> std::weak_ordering { return std::weak_ordering::equivalent; }
    }, _value);
    // clang-format on
}

std::size_t Value::Hash() const noexcept
{
    // clang-format off
    auto const valueHash = std::visit(detail::overloaded {
        [](NullType) -> std::size_t { return 0; },
        [](bool v) { return std::hash<bool> {}(v); },
        [](long long v) { return std::hash<long long> {}(v); },
        [](double v) { return std::hash<double> {}(v); },
        [](std::string const& v) { return std::hash<std::string> {}(v); },
    }, _value);
    // clang-format on
    return HashCombine(_value.index(), valueHash);
}

std::string Value::ToString() const
{
    using namespace std::string_literals;

    // clang-format off
    return std::visit(detail::overloaded {
        [&](NullType) { return "NULL"s; },
        [&](bool v) { return v ? "true"s : "false"s; },
        [&](long long v) { return std::to_string(v); },
        [&](double v) { return std::format("{}", v); },
        [&](std::string const& v) { return v; },
    }, _value);
    // clang-format on
}

std::string Value::Inspect() const
{
    if (auto const* text = std::get_if<std::string>(&_value))
        return std::format("\"{}\"", *text);
    return ToString();
}

std::size_t KeyHash::operator()(Key const& key) const noexcept
{
    std::size_t seed = key.size();
    for (auto const& value: key)
        seed = HashCombine(seed, value.Hash());
    return seed;
}

std::string ToString(Key const& key)
{
    std::string result = "[";
    for (auto const& value: key)
    {
        if (result.size() > 1)
            result += ", ";
        result += value.Inspect();
    }
    result += "]";
    return result;
}

} // namespace Quarry
