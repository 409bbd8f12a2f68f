// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Lazy.hpp"
#include "Query.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <tuple>

namespace Quarry
{

class Model;

/// Opaque number identifying one static invocation point in the code.
using CallsiteSignature = std::uint64_t;

/// Derives a callsite signature from a source location.
[[nodiscard]] QUARRY_API CallsiteSignature SignatureOf(
    std::source_location location = std::source_location::current()) noexcept;

/// @brief Caches which fields and links are needed at one invocation point.
///
/// Queries issued from the callsite are widened to what resources loaded there were later
/// found to need, so that subsequent calls fetch it up front instead of lazily.
///
/// Callsites are created and memoized by a CallsiteRegistry and live as long as it does.
class QUARRY_API Callsite
{
  public:
    Callsite(Model const& model, std::string repositoryName, CallsiteSignature signature);

    Callsite(Callsite const&) = delete;
    Callsite(Callsite&&) = delete;
    Callsite& operator=(Callsite const&) = delete;
    Callsite& operator=(Callsite&&) = delete;
    ~Callsite() = default;

    [[nodiscard]] Model const& GetModel() const noexcept
    {
        return *_model;
    }

    [[nodiscard]] std::string const& RepositoryName() const noexcept
    {
        return _repositoryName;
    }

    [[nodiscard]] CallsiteSignature Signature() const noexcept
    {
        return _signature;
    }

    /// The property names to fetch, initially the model's default-loaded properties.
    [[nodiscard]] std::set<std::string> Fields() const;

    /// The relationship names to fetch, initially none.
    [[nodiscard]] std::set<std::string> Links() const;

    [[nodiscard]] bool HasLinks() const;

    /// Records that the given property was needed by a resource loaded through this callsite.
    void TrackField(std::string_view name);

    /// Records that the given relationship was traversed from a resource loaded through this callsite.
    void TrackLink(std::string_view name);

    [[nodiscard]] std::optional<std::string> IdentityField() const;
    [[nodiscard]] std::optional<std::string> InheritanceField() const;

    [[nodiscard]] bool IsInheritable() const
    {
        return InheritanceField().has_value();
    }

    /// The fields, and the links if there are any, in the shape consumed by Query::Update().
    [[nodiscard]] QueryOptions ToQueryOptions() const;

    /// Widens the given query to what this callsite needs.
    Query& Optimize(Query& query) const;

    /// Builds a fresh query for this callsite's model and repository.
    [[nodiscard]] Query ToQuery() const;

  private:
    std::set<std::string>& FieldsLocked() const;
    std::set<std::string>& LinksLocked() const;

    Model const* _model;
    std::string _repositoryName;
    CallsiteSignature _signature;

    mutable std::mutex _mutex;
    mutable Lazy<std::set<std::string>> _fields;
    mutable Lazy<std::set<std::string>> _links;
    mutable Lazy<std::string> _identityField;
    mutable Lazy<std::string> _inheritanceField;
};

/// @brief Creates and memoizes callsites.
///
/// There is exactly one callsite per signature, model and repository name, even under
/// concurrent first access.
class QUARRY_API CallsiteRegistry
{
  public:
    std::shared_ptr<Callsite> Get(Model const& model, std::string_view repositoryName, CallsiteSignature signature);

    [[nodiscard]] std::size_t Size() const;

  private:
    using CallsiteKey = std::tuple<CallsiteSignature, std::string, std::string>;

    mutable std::mutex _mutex;
    std::map<CallsiteKey, std::shared_ptr<Callsite>> _callsites;
};

} // namespace Quarry
