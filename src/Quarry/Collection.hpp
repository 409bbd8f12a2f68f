// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Query.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Quarry
{

class Callsite;
class Relationship;
class Resource;

using ResourcePtr = std::shared_ptr<Resource>;

/// @brief A query together with the resources it produced.
///
/// Resources loaded through a collection remember it, so that lazy loads and reloads of one
/// resource fetch the same attributes for all of its siblings in a single repository call.
///
/// A collection that is the value of a to-many association loads its resources on first access.
class QUARRY_API Collection: public std::enable_shared_from_this<Collection>
{
    struct PrivateTag
    {
    };

  public:
    /// How rows read for already loaded resources are applied.
    enum class RefreshMode : std::uint8_t
    {
        /// Only attributes that are not loaded yet are set.
        FillUnloaded,

        /// Attributes are overwritten and pending changes to them are discarded.
        Overwrite,
    };

    Collection(PrivateTag, Query query, std::shared_ptr<Callsite> callsite);

    Collection(Collection const&) = delete;
    Collection(Collection&&) = delete;
    Collection& operator=(Collection const&) = delete;
    Collection& operator=(Collection&&) = delete;
    ~Collection() = default;

    /// Creates a loaded collection of the given resources.
    static std::shared_ptr<Collection> Make(Query query, std::vector<ResourcePtr> const& resources);

    /// Reads the query from its repository and materializes the rows.
    static std::shared_ptr<Collection> Load(Query query, std::shared_ptr<Callsite> callsite = nullptr);

    /// Creates the unloaded collection of the targets of a to-many relationship.
    static std::shared_ptr<Collection> ForRelationship(Relationship const& relationship, ResourcePtr const& source);

    [[nodiscard]] Query const& GetQuery() const noexcept
    {
        return _query;
    }

    /// The relationship this collection is the value of, or nullptr.
    [[nodiscard]] Relationship const* GetRelationship() const noexcept
    {
        return _relationship.get();
    }

    [[nodiscard]] bool IsLoaded() const noexcept
    {
        return _loaded;
    }

    /// @brief Retrieves the resources, loading them on first access.
    ///
    /// Throws UnsavedParentError for the association collection of a resource that was never saved.
    std::vector<ResourcePtr> const& All();

    [[nodiscard]] std::size_t Size()
    {
        return All().size();
    }

    [[nodiscard]] bool IsEmpty()
    {
        return All().empty();
    }

    /// The first resource, or nullptr.
    ResourcePtr First();

    /// Appends a resource. For an association collection, the foreign key is assigned if the source has a key.
    void Add(ResourcePtr resource);

    /// Saves every resource sequentially, stopping at the first failure.
    bool Save();

    /// Re-reads the given fields for all saved resources of this collection in one repository call.
    void Reload(std::vector<std::string> const& fields, RefreshMode mode = RefreshMode::Overwrite);

    /// Reloads the loaded attributes of every resource, and their child associations.
    void ReloadAll();

  private:
    void LoadRows(std::vector<Row> const& rows);
    ResourcePtr Materialize(Row const& row);
    void EnsureLoaded();

    Query _query;
    std::shared_ptr<Callsite> _callsite;
    std::shared_ptr<Relationship const> _relationship;
    std::weak_ptr<Resource> _source;
    std::vector<ResourcePtr> _resources;
    bool _loaded = false;
};

} // namespace Quarry
