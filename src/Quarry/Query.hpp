// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Value.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Quarry
{

class Model;
class Repository;

enum class SortDirection : std::uint8_t
{
    Ascending,
    Descending,
};

struct OrderBy
{
    std::string property;
    SortDirection direction = SortDirection::Ascending;

    bool operator==(OrderBy const&) const noexcept = default;
};

/// Selects rows whose property equals any of the given values.
struct Condition
{
    std::string property;
    std::vector<Value> values;

    bool operator==(Condition const&) const = default;
};

/// @brief The options a query is built from and updated with.
///
/// Unset members leave the corresponding part of the query untouched on Query::Update().
struct QueryOptions
{
    std::optional<std::vector<std::string>> fields {};
    std::optional<std::vector<std::string>> links {};
    std::vector<Condition> conditions {};
    std::optional<std::vector<OrderBy>> order {};
    std::optional<std::size_t> limit {};
    std::optional<std::size_t> offset {};
};

/// A row as read from a repository, by property name.
using Row = std::map<std::string, Value, std::less<>>;

/// @brief Describes what to fetch from a repository: fields, relationship links, conditions, order and window.
///
/// The key properties and the discriminator of the model are always part of the fields, so that
/// every row read can be identified and materialized as the right model.
class QUARRY_API Query
{
  public:
    Query(std::shared_ptr<Repository> repository, Model const& model, QueryOptions const& options = {});

    /// Builds a query selecting the resource of the given model with the given key.
    static Query ForKey(std::shared_ptr<Repository> repository,
                        Model const& model,
                        Key const& key,
                        QueryOptions const& options = {});

    /// @brief Merges the given options into this query.
    ///
    /// Fields and links are united, conditions are appended, and order, limit and offset are replaced.
    /// Unknown property or relationship names throw ArgumentError.
    Query& Update(QueryOptions const& options);

    [[nodiscard]] Repository& GetRepository() const noexcept
    {
        return *_repository;
    }

    [[nodiscard]] std::shared_ptr<Repository> const& RepositoryPtr() const noexcept
    {
        return _repository;
    }

    [[nodiscard]] Model const& GetModel() const noexcept
    {
        return *_model;
    }

    [[nodiscard]] std::vector<std::string> const& Fields() const noexcept
    {
        return _fields;
    }

    [[nodiscard]] bool HasField(std::string_view name) const noexcept;

    [[nodiscard]] std::vector<std::string> const& Links() const noexcept
    {
        return _links;
    }

    [[nodiscard]] std::vector<Condition> const& Conditions() const noexcept
    {
        return _conditions;
    }

    [[nodiscard]] std::vector<OrderBy> const& Order() const noexcept
    {
        return _order;
    }

    [[nodiscard]] std::optional<std::size_t> Limit() const noexcept
    {
        return _limit;
    }

    [[nodiscard]] std::size_t Offset() const noexcept
    {
        return _offset;
    }

    /// Tests whether the given row satisfies all conditions of this query.
    [[nodiscard]] bool Matches(Row const& row) const;

    [[nodiscard]] std::string ToString() const;

  private:
    void AddField(std::string_view name);
    void AddLink(std::string_view name);
    void RequireProperty(std::string_view name) const;

    std::shared_ptr<Repository> _repository;
    Model const* _model;
    std::vector<std::string> _fields;
    std::vector<std::string> _links;
    std::vector<Condition> _conditions;
    std::vector<OrderBy> _order;
    std::optional<std::size_t> _limit;
    std::size_t _offset = 0;
};

} // namespace Quarry

template <>
struct std::formatter<Quarry::Query>: formatter<string>
{
    auto format(Quarry::Query const& query, format_context& ctx) const -> format_context::iterator
    {
        return std::formatter<string>::format(query.ToString(), ctx);
    }
};
