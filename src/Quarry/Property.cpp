// SPDX-License-Identifier: Apache-2.0

#include "Error.hpp"
#include "Model.hpp"
#include "Property.hpp"
#include "Resource.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <ranges>

namespace Quarry
{

namespace
{

Value const& NullAttribute() noexcept
{
    static Value const null {};
    return null;
}

std::optional<long long> ParseInteger(std::string_view text) noexcept
{
    long long result {};
    auto const [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc {} || end != text.data() + text.size())
        return std::nullopt;
    return result;
}

std::optional<double> ParseFloat(std::string_view text) noexcept
{
    double result {};
    auto const [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc {} || end != text.data() + text.size())
        return std::nullopt;
    return result;
}

} // namespace

Property::Property(Model const& model, std::string name, PropertyType type, PropertyOptions options, std::size_t index):
    _model { &model },
    _name { std::move(name) },
    _type { type },
    _options { std::move(options) },
    _index { index }
{
    if (_options.serial)
    {
        _options.key = true;
        _type = PropertyType::Integer;
    }
}

std::unique_ptr<Property> Property::CloneFor(Model const& subclass, std::size_t index) const
{
    return std::make_unique<Property>(subclass, _name, _type, _options, index);
}

bool Property::HasDefault() const noexcept
{
    return IsDiscriminator() || !std::holds_alternative<std::monostate>(_options.defaultValue);
}

Value Property::DefaultFor(Resource const& resource) const
{
    if (auto const* value = std::get_if<Value>(&_options.defaultValue))
        return *value;

    if (auto const* function = std::get_if<DefaultFunction>(&_options.defaultValue))
        return Typecast((*function)(resource, *this));

    if (IsDiscriminator())
        return Value { resource.GetModel().Name() };

    return Value {};
}

Value Property::Typecast(Value value) const
{
    if (value.IsNull())
        return value;

    switch (_type)
    {
        case PropertyType::Boolean:
            if (value.Is<bool>())
                return value;
            if (auto const integer = value.TryGetInteger(); integer && (*integer == 0 || *integer == 1))
                return Value { *integer == 1 };
            if (auto const text = value.TryGetString(); text)
            {
                if (*text == "true" || *text == "1")
                    return Value { true };
                if (*text == "false" || *text == "0")
                    return Value { false };
            }
            return value;
        case PropertyType::Integer:
            if (value.Is<long long>())
                return value;
            if (auto const number = value.TryGetDouble(); number && *number == static_cast<double>(static_cast<long long>(*number)))
                return Value { static_cast<long long>(*number) };
            if (auto const text = value.TryGetString(); text)
                if (auto const integer = ParseInteger(*text); integer)
                    return Value { *integer };
            return value;
        case PropertyType::Float:
            if (auto const number = value.TryGetDouble(); number)
                return Value { *number };
            if (auto const text = value.TryGetString(); text)
                if (auto const number = ParseFloat(*text); number)
                    return Value { *number };
            return value;
        case PropertyType::String:
        case PropertyType::Text:
        case PropertyType::Class:
            if (value.Is<std::string>())
                return value;
            return Value { value.ToString() };
    }
    return value;
}

Value const& Property::Get(Resource& resource) const
{
    if (&resource.GetModel() != _model)
        return resource.GetModel().GetProperty(_name).Get(resource);

    if (!IsLoaded(resource))
    {
        if (resource.IsSaved())
            resource.LazyLoad(*this);
        else if (HasDefault())
            Set(resource, DefaultFor(resource));
    }

    return GetLoaded(resource);
}

Value const& Property::GetLoaded(Resource const& resource) const noexcept
{
    if (&resource.GetModel() != _model)
    {
        auto const* own = resource.GetModel().FindProperty(_name);
        return own ? own->GetLoaded(resource) : NullAttribute();
    }

    if (auto const* slot = resource.FindSlot(*this); slot)
        if (auto const* value = slot->Get(); value)
            return *value;
    return NullAttribute();
}

void Property::Set(Resource& resource, Value value) const
{
    if (&resource.GetModel() != _model)
        return resource.GetModel().GetProperty(_name).Set(resource, std::move(value));

    value = Typecast(std::move(value));

    auto& slot = resource.Slot(*this);
    auto const current = slot.Get() ? *slot.Get() : Value {};
    if (current == value)
    {
        if (!slot.IsLoaded())
            slot.EmplaceNil();
        return;
    }

    if (IsKey())
        resource._key.Reset();

    auto& originals = resource._originalValues;
    if (auto const i = originals.find(this); i != originals.end())
    {
        if (i->second == value)
            originals.erase(i);
    }
    else
        originals.emplace(this, current);

    Load(resource, std::move(value));
}

void Property::Load(Resource& resource, Value value) const
{
    if (&resource.GetModel() != _model)
        return resource.GetModel().GetProperty(_name).Load(resource, std::move(value));

    if (IsKey())
        resource._key.Reset();

    auto& slot = resource.Slot(*this);
    if (value.IsNull())
        slot.EmplaceNil();
    else
        slot.Emplace(std::move(value));
}

bool Property::IsLoaded(Resource const& resource) const noexcept
{
    if (&resource.GetModel() != _model)
    {
        auto const* own = resource.GetModel().FindProperty(_name);
        return own && own->IsLoaded(resource);
    }

    auto const* slot = resource.FindSlot(*this);
    return slot && slot->IsLoaded();
}

// {{{ PropertySet

Property const& PropertySet::Add(std::unique_ptr<Property> property)
{
    if (Contains(property->Name()))
        throw ArgumentError(std::format("Property {} is declared already", property->Name()));

    _properties.emplace_back(std::move(property));
    return *_properties.back();
}

Property const* PropertySet::Find(std::string_view name) const noexcept
{
    auto const i = std::ranges::find_if(_properties, [&](auto const& property) { return property->Name() == name; });
    return i != _properties.end() ? i->get() : nullptr;
}

Property const& PropertySet::Get(std::string_view name) const
{
    if (auto const* property = Find(name); property)
        return *property;

    throw ArgumentError(ErrorCode::UNKNOWN_PROPERTY, std::format("Unknown property {}", name));
}

std::vector<Property const*> PropertySet::All() const
{
    std::vector<Property const*> result;
    result.reserve(_properties.size());
    for (auto const& property: _properties)
        result.push_back(property.get());
    return result;
}

std::vector<Property const*> PropertySet::Key() const
{
    std::vector<Property const*> result;
    for (auto const& property: _properties)
        if (property->IsKey())
            result.push_back(property.get());
    return result;
}

Property const* PropertySet::Discriminator() const noexcept
{
    auto const i = std::ranges::find_if(_properties, [](auto const& property) { return property->IsDiscriminator(); });
    return i != _properties.end() ? i->get() : nullptr;
}

std::vector<Property const*> PropertySet::Eager() const
{
    std::vector<Property const*> result;
    for (auto const& property: _properties)
        if (!property->IsLazy())
            result.push_back(property.get());
    return result;
}

std::vector<Property const*> PropertySet::DefaultLoaded() const
{
    std::vector<Property const*> result;
    for (auto const& property: _properties)
        if (!property->IsLazy() && (property->IsKey() || property->IsDiscriminator() || property->HasDefault()))
            result.push_back(property.get());
    return result;
}

std::vector<Property const*> PropertySet::LazyLoadContext(Property const& property) const
{
    if (!property.IsLazy())
        return Eager();

    if (property.LazyGroups().empty())
        return { &property };

    std::vector<Property const*> result;
    for (auto const& candidate: _properties)
    {
        auto const inSameGroup = std::ranges::any_of(candidate->LazyGroups(), [&](std::string const& group) {
            return std::ranges::find(property.LazyGroups(), group) != property.LazyGroups().end();
        });
        if (inSameGroup)
            result.push_back(candidate.get());
    }
    return result;
}

// }}}

} // namespace Quarry
