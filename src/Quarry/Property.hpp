// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Value.hpp"

#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Quarry
{

class Model;
class Property;
class Resource;

/// Semantic type of a declared property.
enum class PropertyType : std::uint8_t
{
    Boolean,
    Integer,
    Float,
    String,
    Text,

    /// Single-table-inheritance discriminator. Holds the name of the model a row represents.
    Class,
};

enum class Visibility : std::uint8_t
{
    Public,
    Private,
};

/// Computes a default value for the given resource.
using DefaultFunction = std::function<Value(Resource const& resource, Property const& property)>;

/// No default, a constant default, or a computed default.
using DefaultRule = std::variant<std::monostate, Value, DefaultFunction>;

struct PropertyOptions
{
    bool nullable = true;
    DefaultRule defaultValue {};

    /// Part of the model's key.
    bool key = false;

    /// @brief Integer key assigned by the store on creation.
    ///
    /// @note A serial property is always a key property.
    bool serial = false;

    /// Not loaded by default. Fetched on first access together with its lazy-load groups.
    bool lazy = false;
    std::vector<std::string> lazyGroups {};

    Visibility reader = Visibility::Public;
    Visibility writer = Visibility::Public;
};

/// @brief Represents one declared attribute of a model.
///
/// A property is immutable once declared. It also acts as the accessor of the attribute on a
/// resource: all reads and writes of a resource's attribute go through its property, which keeps
/// the resource's loaded and original values consistent.
class QUARRY_API Property
{
  public:
    Property(Model const& model, std::string name, PropertyType type, PropertyOptions options, std::size_t index);

    Property(Property const&) = delete;
    Property(Property&&) = delete;
    Property& operator=(Property const&) = delete;
    Property& operator=(Property&&) = delete;
    ~Property() = default;

    /// Creates a copy of this property for the given subclass, placed at the given index.
    [[nodiscard]] std::unique_ptr<Property> CloneFor(Model const& subclass, std::size_t index) const;

    [[nodiscard]] std::string const& Name() const noexcept
    {
        return _name;
    }

    [[nodiscard]] PropertyType Type() const noexcept
    {
        return _type;
    }

    /// The model this property has been declared on (or copied to).
    [[nodiscard]] Model const& GetModel() const noexcept
    {
        return *_model;
    }

    /// Position of this property within its model's property list.
    [[nodiscard]] std::size_t Index() const noexcept
    {
        return _index;
    }

    [[nodiscard]] bool IsNullable() const noexcept
    {
        return _options.nullable;
    }

    [[nodiscard]] bool IsKey() const noexcept
    {
        return _options.key;
    }

    [[nodiscard]] bool IsSerial() const noexcept
    {
        return _options.serial;
    }

    [[nodiscard]] bool IsLazy() const noexcept
    {
        return _options.lazy;
    }

    [[nodiscard]] std::vector<std::string> const& LazyGroups() const noexcept
    {
        return _options.lazyGroups;
    }

    [[nodiscard]] bool IsDiscriminator() const noexcept
    {
        return _type == PropertyType::Class;
    }

    [[nodiscard]] bool IsReaderPublic() const noexcept
    {
        return _options.reader == Visibility::Public;
    }

    [[nodiscard]] bool IsWriterPublic() const noexcept
    {
        return _options.writer == Visibility::Public;
    }

    /// Tests whether the property has a default rule. Discriminators always have one.
    [[nodiscard]] bool HasDefault() const noexcept;

    /// Evaluates the default rule for the given resource.
    [[nodiscard]] Value DefaultFor(Resource const& resource) const;

    /// Converts the given value into this property's primitive type where possible.
    ///
    /// Values that cannot be converted are returned unchanged.
    [[nodiscard]] Value Typecast(Value value) const;

    /// @brief Reads the attribute.
    ///
    /// If the attribute is not loaded yet, a saved resource lazy-loads it (with its lazy-load group)
    /// and a new resource receives the default value, if any.
    Value const& Get(Resource& resource) const;

    /// Reads the attribute as loaded, without triggering a lazy load. Unloaded reads as null.
    [[nodiscard]] Value const& GetLoaded(Resource const& resource) const noexcept;

    /// @brief Writes the attribute and tracks its original value.
    ///
    /// The original value is recorded on the first mutation and forgotten again once the attribute
    /// is set back to it. Setting a loaded attribute to its current value is a no-op.
    void Set(Resource& resource, Value value) const;

    /// Writes the attribute as loaded from the store, without dirty tracking.
    void Load(Resource& resource, Value value) const;

    [[nodiscard]] bool IsLoaded(Resource const& resource) const noexcept;

  private:
    Model const* _model;
    std::string _name;
    PropertyType _type;
    PropertyOptions _options;
    std::size_t _index;
};

/// The ordered list of properties of a model, owning them.
class QUARRY_API PropertySet
{
  public:
    using Container = std::vector<std::unique_ptr<Property>>;

    Property const& Add(std::unique_ptr<Property> property);

    [[nodiscard]] Property const* Find(std::string_view name) const noexcept;

    /// Retrieves the property by name, throwing ArgumentError if there is none.
    [[nodiscard]] Property const& Get(std::string_view name) const;

    [[nodiscard]] bool Contains(std::string_view name) const noexcept
    {
        return Find(name) != nullptr;
    }

    [[nodiscard]] std::size_t Size() const noexcept
    {
        return _properties.size();
    }

    [[nodiscard]] Property const& operator[](std::size_t index) const noexcept
    {
        return *_properties[index];
    }

    [[nodiscard]] std::vector<Property const*> All() const;

    /// Key properties, in declaration order.
    [[nodiscard]] std::vector<Property const*> Key() const;

    /// The single-table-inheritance discriminator, or nullptr.
    [[nodiscard]] Property const* Discriminator() const noexcept;

    /// Properties that are not lazy.
    [[nodiscard]] std::vector<Property const*> Eager() const;

    /// Non-lazy properties needed to materialize a resource: keys, the discriminator
    /// and properties with a default rule.
    [[nodiscard]] std::vector<Property const*> DefaultLoaded() const;

    /// The properties fetched together with the given one on a lazy load.
    ///
    /// A lazy property brings its lazy-load groups (or just itself if it names none),
    /// an eager property brings all eager properties.
    [[nodiscard]] std::vector<Property const*> LazyLoadContext(Property const& property) const;

  private:
    Container _properties;
};

} // namespace Quarry

template <>
struct std::formatter<Quarry::PropertyType>: formatter<std::string_view>
{
    auto format(Quarry::PropertyType value, format_context& ctx) const -> format_context::iterator
    {
        using namespace std::string_view_literals;
        std::string_view name;
        switch (value)
        {
            case Quarry::PropertyType::Boolean:
                name = "Boolean"sv;
                break;
            case Quarry::PropertyType::Integer:
                name = "Integer"sv;
                break;
            case Quarry::PropertyType::Float:
                name = "Float"sv;
                break;
            case Quarry::PropertyType::String:
                name = "String"sv;
                break;
            case Quarry::PropertyType::Text:
                name = "Text"sv;
                break;
            case Quarry::PropertyType::Class:
                name = "Class"sv;
                break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};
