// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "IdentityMap.hpp"
#include "Query.hpp"
#include "Value.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Quarry
{

class Model;
class Property;
class Resource;

struct PropertyValue
{
    Property const* property;
    Value value;
};

using PropertyValueList = std::vector<PropertyValue>;

/// @brief Abstract storage a model's resources are persisted to.
///
/// The public operations log each call through the current Logger and delegate to the
/// storage specific implementation. Implementations assign store generated serial values
/// to created resources through Property::Load().
///
/// A repository also owns the identity maps of the resources persisted to it, one per base model.
class QUARRY_API Repository
{
  public:
    explicit Repository(std::string name);

    Repository(Repository const&) = delete;
    Repository(Repository&&) = delete;
    Repository& operator=(Repository const&) = delete;
    Repository& operator=(Repository&&) = delete;
    virtual ~Repository() = default;

    [[nodiscard]] std::string const& Name() const noexcept
    {
        return _name;
    }

    /// Persists the given new resources. Returns the number of created rows.
    std::size_t Create(std::vector<std::shared_ptr<Resource>> const& resources);

    /// Writes the given attribute values to all rows matching the query. Returns the number of updated rows.
    std::size_t Update(PropertyValueList const& attributes, Query const& query);

    /// Deletes all rows matching the query. Returns the number of deleted rows.
    std::size_t Delete(Query const& query);

    /// Reads the fields of all rows matching the query.
    std::vector<Row> Read(Query const& query);

    /// The identity map of the given model's base model.
    IdentityMap& IdentityMapFor(Model const& model);

  protected:
    virtual std::size_t OnCreate(std::vector<std::shared_ptr<Resource>> const& resources) = 0;
    virtual std::size_t OnUpdate(PropertyValueList const& attributes, Query const& query) = 0;
    virtual std::size_t OnDelete(Query const& query) = 0;
    virtual std::vector<Row> OnRead(Query const& query) = 0;

  private:
    std::string _name;
    std::mutex _identityMapsMutex;
    std::map<std::string, std::unique_ptr<IdentityMap>, std::less<>> _identityMaps;
};

} // namespace Quarry
