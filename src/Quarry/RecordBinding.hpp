// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Model.hpp"
#include "Property.hpp"
#include "Resource.hpp"
#include "Value.hpp"

#include <reflection-cpp/reflection.hpp>

#include <concepts>
#include <optional>
#include <string>
#include <type_traits>

namespace Quarry
{

namespace detail
{
    template <typename T>
    struct UnwrapOptional
    {
        using type = T;
    };

    template <typename T>
    struct UnwrapOptional<std::optional<T>>
    {
        using type = T;
    };

    template <typename T>
    constexpr PropertyType PropertyTypeOf() noexcept
    {
        using U = typename UnwrapOptional<T>::type;
        if constexpr (std::same_as<U, bool>)
            return PropertyType::Boolean;
        else if constexpr (std::integral<U>)
            return PropertyType::Integer;
        else if constexpr (std::floating_point<U>)
            return PropertyType::Float;
        else
        {
            static_assert(std::same_as<U, std::string>, "Unsupported record member type");
            return PropertyType::String;
        }
    }
} // namespace detail

/// Declares one property per member of the given aggregate, named and typed after the member.
///
/// Members that are declared on the model already are left untouched.
template <typename Record>
void DeclarePropertiesOf(Model& model)
{
    Reflection::EnumerateMembers<Record>([&]<size_t I, typename FieldType>() {
        auto const name = std::string(Reflection::MemberNameOf<I, Record>);
        if (model.FindProperty(name))
            return;

        model.DeclareProperty(name,
                              detail::PropertyTypeOf<FieldType>(),
                              PropertyOptions { .nullable = detail::IsOptional<FieldType>::value });
    });
}

/// Turns an aggregate into an attribute map, suitable for Resource::SetAttributes() and Model::New().
template <typename Record>
AttributeMap ToAttributeMap(Record const& record)
{
    AttributeMap attributes;
    Reflection::CallOnMembers(record, [&]<typename Name, typename FieldType>(Name const& name, FieldType const& value) {
        attributes.emplace_back(std::string(name), Value { value });
    });
    return attributes;
}

/// Reads the attributes of a resource into an aggregate, lazy-loading them as needed.
///
/// Throws ArgumentError if the resource's model lacks a property for any member.
template <typename Record>
Record FromResource(Resource& resource)
{
    Record record {};
    Reflection::EnumerateMembers(record, [&]<auto I, typename FieldType>(FieldType& field) {
        field = resource.Get(Reflection::MemberNameOf<I, Record>).template As<FieldType>();
    });
    return record;
}

} // namespace Quarry
