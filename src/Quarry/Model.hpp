// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Property.hpp"
#include "Query.hpp"
#include "Relationship.hpp"
#include "Value.hpp"

#include <map>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Quarry
{

class Collection;
class Registry;
class Repository;
class Resource;

using ResourcePtr = std::shared_ptr<Resource>;

/// Attribute name and value pairs, as used for mass assignment.
using AttributeMap = std::vector<std::pair<std::string, Value>>;

/// @brief Runtime metadata of one model.
///
/// A model owns its properties and its relationship tables (one per repository name).
/// Subclassing a model copies its properties, default order and relationships, and properties
/// declared later on an ancestor are propagated to all of its descendants.
///
/// Models are owned by a Registry.
class QUARRY_API Model
{
  public:
    Model(Registry& registry, std::string name, Model* parent = nullptr);

    Model(Model const&) = delete;
    Model(Model&&) = delete;
    Model& operator=(Model const&) = delete;
    Model& operator=(Model&&) = delete;
    ~Model();

    [[nodiscard]] std::string const& Name() const noexcept
    {
        return _name;
    }

    [[nodiscard]] Registry& GetRegistry() const noexcept
    {
        return *_registry;
    }

    /// The model this model has been derived from, or nullptr.
    [[nodiscard]] Model const* Parent() const noexcept
    {
        return _parent;
    }

    /// The root of this model's inheritance chain.
    [[nodiscard]] Model const& BaseModel() const noexcept;

    /// Tests whether this model is the given model or one of its descendants.
    [[nodiscard]] bool IsA(Model const& other) const noexcept;

    /// This model and all of its descendants.
    [[nodiscard]] std::vector<Model const*> SelfAndDescendants() const;

    /// Name of the repository resources of this model are persisted to unless bound otherwise.
    [[nodiscard]] std::string const& DefaultRepositoryName() const noexcept;

    void SetDefaultRepositoryName(std::string name);

    [[nodiscard]] std::shared_ptr<Repository> DefaultRepository() const;

    /// Declares a property on this model and all of its descendants.
    Property const& DeclareProperty(std::string name, PropertyType type, PropertyOptions options = {});

    [[nodiscard]] PropertySet const& Properties() const noexcept
    {
        return _properties;
    }

    [[nodiscard]] Property const* FindProperty(std::string_view name) const noexcept
    {
        return _properties.Find(name);
    }

    [[nodiscard]] Property const& GetProperty(std::string_view name) const
    {
        return _properties.Get(name);
    }

    [[nodiscard]] std::vector<Property const*> Key() const
    {
        return _properties.Key();
    }

    /// The single serial key property, or nullptr if the model has none or a composite key.
    [[nodiscard]] Property const* IdentityField() const noexcept;

    /// The single-table-inheritance discriminator, or nullptr.
    [[nodiscard]] Property const* Discriminator() const noexcept
    {
        return _properties.Discriminator();
    }

    /// The default sort order, which is the key in ascending order unless set explicitly.
    [[nodiscard]] std::vector<OrderBy> DefaultOrder() const;

    void SetDefaultOrder(std::vector<OrderBy> order);

    /// The relationship table for the given repository name.
    ///
    /// A repository without a table of its own reads the default repository's table.
    [[nodiscard]] RelationshipSet const& Relationships(std::string_view repositoryName) const;

    [[nodiscard]] RelationshipSet const& Relationships() const
    {
        return Relationships(DefaultRepositoryName());
    }

    /// The relationship table for the given repository name, created as a copy of the default
    /// repository's table if it does not exist yet.
    RelationshipSet& MutableRelationships(std::string_view repositoryName);

    /// Retrieves a relationship by name from the given repository's table, throwing ArgumentError if there is none.
    [[nodiscard]] Relationship const& GetRelationship(std::string_view name, std::string_view repositoryName) const;

    [[nodiscard]] Relationship const& GetRelationship(std::string_view name) const
    {
        return GetRelationship(name, DefaultRepositoryName());
    }

    /// @brief Declares a one-to-one, one-to-many or many-to-many relationship.
    ///
    /// The kind is selected from the cardinality and the presence of a through relationship.
    Relationship const& Has(Cardinality cardinality, std::string name, RelationshipOptions options = {});

    /// Declares a many-to-one relationship.
    Relationship const& BelongsTo(std::string name, RelationshipOptions options = {});

    /// Defines a subclass of this model in the same registry.
    Model& Inherit(std::string name);

    /// Creates a new, unsaved resource of this model with the given attributes assigned.
    [[nodiscard]] ResourcePtr New(AttributeMap const& attributes = {}) const;

    /// Builds a query selecting the resource with the given key.
    [[nodiscard]] Query ToQuery(std::shared_ptr<Repository> repository, Quarry::Key const& key) const;

    /// @brief Reads all resources of this model matching the given options from the default repository.
    ///
    /// The query is shaped by the callsite of the caller, so repeated reads from the same place in
    /// the code fetch exactly the fields that were needed there before.
    std::shared_ptr<Collection> All(QueryOptions const& options = {},
                                    std::source_location location = std::source_location::current()) const;

    /// Retrieves the resource with the given key, from the identity map if it is loaded already.
    ResourcePtr Get(Quarry::Key const& key, std::source_location location = std::source_location::current()) const;

  private:
    void DeclareRelationship(std::string const& repositoryName, std::shared_ptr<Relationship> relationship);
    std::string const& RelationshipTableName(RelationshipOptions const& options) const;

    Registry* _registry;
    std::string _name;
    Model* _parent;
    std::vector<Model*> _descendants;
    std::string _defaultRepositoryName;
    PropertySet _properties;
    std::vector<OrderBy> _defaultOrder;
    std::map<std::string, RelationshipSet, std::less<>> _relationships;
};

} // namespace Quarry
