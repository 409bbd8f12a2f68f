// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Lazy.hpp"
#include "Model.hpp"
#include "Query.hpp"
#include "Repository.hpp"
#include "Value.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Quarry
{

class Callsite;
class Collection;
class Property;
class Relationship;

/// @brief One in-memory record, bound (or not yet bound) to a persisted row.
///
/// A resource is always owned by a std::shared_ptr, created through Model::New() or by loading
/// it from a repository. It tracks which attributes are loaded and the original values of the
/// attributes it changed since it was last persisted.
///
/// The lifecycle states are new, clean-saved, dirty-saved and destroyed. Persistence outcomes
/// are reported as boolean results, caller mistakes are thrown as Error.
class QUARRY_API Resource: public std::enable_shared_from_this<Resource>
{
    struct PrivateTag
    {
    };

  public:
    Resource(PrivateTag, Model const& model);

    Resource(Resource const&) = delete;
    Resource(Resource&&) = delete;
    Resource& operator=(Resource const&) = delete;
    Resource& operator=(Resource&&) = delete;
    ~Resource() = default;

    /// Creates a new resource of the given model and assigns the given attributes.
    static ResourcePtr Make(Model const& model, AttributeMap const& attributes = {});

    [[nodiscard]] Model const& GetModel() const noexcept
    {
        return *_model;
    }

    /// Reads an attribute by name, lazy-loading it if needed.
    Value const& Get(std::string_view name);

    /// Writes an attribute by name.
    void Set(std::string_view name, Value value);

    /// The values of all publicly readable attributes, lazy-loading as needed.
    [[nodiscard]] AttributeMap Attributes();

    /// @brief Mass-assigns the given attributes.
    ///
    /// Throws ArgumentError if any name is unknown or not publicly writable, in which case nothing is assigned.
    void SetAttributes(AttributeMap const& attributes);

    /// @brief Persists a new resource.
    ///
    /// Fails if the resource is not new or not dirty. Unloaded non-serial properties with a default
    /// receive their default value first.
    bool Create();

    /// @brief Persists the dirty attributes of a saved resource.
    ///
    /// Succeeds without a repository call if nothing is dirty, and fails without side effects if a
    /// dirty non-nullable attribute is null.
    bool Update();

    /// Mass-assigns the given attributes and persists them.
    bool Update(AttributeMap const& attributes);

    /// @brief Creates or updates the resource, then saves its loaded child associations.
    ///
    /// Foreign keys of loaded many-to-one parents that have a key are copied in first.
    bool Save();

    /// Deletes a saved resource. On success the resource becomes new again.
    bool Destroy();

    /// Re-fetches the loaded attributes (discarding pending changes to them) and reloads child associations.
    Resource& Reload();

    /// Marks the resource as not persisted and removes it from its identity map.
    void Reset();

    /// Fetches the lazy-load group of the given property in one repository call.
    void LazyLoad(Property const& property);

    /// @brief The key of the resource, or std::nullopt while any key component is null.
    ///
    /// Uses the original values of changed key properties, so the key identifies the persisted row.
    [[nodiscard]] std::optional<Key> GetKey() const;

    [[nodiscard]] bool IsNew() const noexcept
    {
        return !_saved;
    }

    [[nodiscard]] bool IsSaved() const noexcept
    {
        return _saved;
    }

    [[nodiscard]] bool IsDirty() const;

    [[nodiscard]] bool IsAttributeDirty(std::string_view name) const;

    [[nodiscard]] bool IsAttributeLoaded(std::string_view name) const;

    [[nodiscard]] std::vector<Property const*> LoadedAttributes() const;

    /// The pre-mutation values of changed attributes.
    [[nodiscard]] std::vector<PropertyValue> OriginalValues() const;

    /// The current values of changed attributes.
    [[nodiscard]] PropertyValueList DirtyAttributes() const;

    /// Builds a query selecting this resource by its key.
    [[nodiscard]] Query ToQuery() const;

    /// The repository this resource is bound to, or its model's default repository.
    [[nodiscard]] std::shared_ptr<Repository> GetRepository() const;

    /// The callsite this resource was loaded from, or nullptr.
    [[nodiscard]] std::shared_ptr<Callsite> const& GetCallsite() const noexcept
    {
        return _callsite;
    }

    /// Renders the resource for diagnostics, e.g. #<Product id=1 name=<not loaded>>.
    [[nodiscard]] std::string Inspect() const;

    /// Same model and strictly equal attributes.
    [[nodiscard]] bool Eql(Resource const& other) const;

    /// Same base model and equivalent attributes.
    bool operator==(Resource const& other) const;

    /// @brief Orders by the model's default order.
    ///
    /// Throws IncompatibleModelError if the other resource is not of this model.
    std::weak_ordering operator<=>(Resource const& other) const;

    [[nodiscard]] std::size_t Hash() const;

    /// @brief Retrieves the target of a many-to-one or one-to-one relationship, or nullptr.
    ///
    /// The target is loaded on first access and the traversal is tracked on the callsite.
    ResourcePtr GetOne(std::string_view relationshipName);

    /// Retrieves the collection of a one-to-many or many-to-many relationship.
    std::shared_ptr<Collection> GetMany(std::string_view relationshipName);

    /// Sets the target of a many-to-one or one-to-one relationship.
    void SetOne(std::string_view relationshipName, ResourcePtr target);

  private:
    friend class Collection;
    friend class Property;

    struct Association
    {
        std::shared_ptr<Relationship const> relationship;

        /// Target of a one-to-one relationship.
        Lazy<ResourcePtr> child {};

        /// Target of a many-to-one relationship. Not owned, parents are kept alive by their children's holders.
        std::weak_ptr<Resource> parent {};

        /// An assigned many-to-one target whose key has not been copied into this resource yet.
        ResourcePtr assignedParent {};

        /// Targets of a to-many relationship.
        std::shared_ptr<Collection> many {};
    };

    Lazy<Value>& Slot(Property const& property);
    Lazy<Value> const* FindSlot(Property const& property) const noexcept;
    ResourcePtr Self();
    Relationship const& RequireRelationship(std::string_view name) const;
    Association& AssociationFor(Relationship const& relationship);
    void TrackLink(Relationship const& relationship);
    ResourcePtr LoadParent(Relationship const& relationship, Association& association);
    void SyncParentKeys();
    bool SaveChildren();
    void ReloadChildren();
    bool CompareAttributes(Resource const& other, bool strict) const;
    void OnLoaded(std::shared_ptr<Repository> repository,
                  std::shared_ptr<Collection> const& collection,
                  std::shared_ptr<Callsite> const& callsite);

    Model const* _model;
    bool _saved = false;
    std::vector<Lazy<Value>> _attributes;
    std::unordered_map<Property const*, Value> _originalValues;
    mutable Lazy<Key> _key;
    std::shared_ptr<Repository> _repository;
    std::weak_ptr<Collection> _collection;
    std::shared_ptr<Callsite> _callsite;
    std::map<std::string, Association, std::less<>> _associations;
};

} // namespace Quarry

template <>
struct std::hash<Quarry::Resource>
{
    std::size_t operator()(Quarry::Resource const& resource) const
    {
        return resource.Hash();
    }
};

template <>
struct std::formatter<Quarry::Resource>: formatter<string>
{
    auto format(Quarry::Resource const& resource, format_context& ctx) const -> format_context::iterator
    {
        return std::formatter<string>::format(resource.Inspect(), ctx);
    }
};
