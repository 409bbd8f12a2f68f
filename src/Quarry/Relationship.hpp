// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Query.hpp"
#include "Value.hpp"

#include <cstdint>
#include <format>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Quarry
{

class Model;
class Resource;

enum class RelationshipKind : std::uint8_t
{
    OneToOne,
    OneToMany,
    ManyToMany,
    ManyToOne,
};

/// @brief Normalized (min, max) bounds of a relationship.
///
/// Constructed from an exact count, an inclusive range, or the unbounded count N (meaning 0..N).
/// Invalid bounds throw ArgumentError.
class QUARRY_API Cardinality
{
  public:
    static constexpr long long Infinite = std::numeric_limits<long long>::max();

    Cardinality(long long exact); // NOLINT(hicpp-explicit-conversions)
    Cardinality(long long min, long long max);

    static Cardinality Unbounded()
    {
        return Cardinality { 0, Infinite };
    }

    [[nodiscard]] long long Min() const noexcept
    {
        return _min;
    }

    [[nodiscard]] long long Max() const noexcept
    {
        return _max;
    }

    bool operator==(Cardinality const&) const noexcept = default;

  private:
    long long _min;
    long long _max;
};

/// The unbounded cardinality.
constexpr inline long long N = Cardinality::Infinite;

/// Selects the relationship kind declared by Model::Has().
[[nodiscard]] QUARRY_API RelationshipKind SelectRelationshipKind(Cardinality const& cardinality, bool hasThrough) noexcept;

struct RelationshipOptions
{
    /// Name of the target model. Derived from the relationship name if empty.
    std::string model {};

    /// Name of the relationship the target is reached through, making this a many-to-many relationship.
    std::string through {};

    /// Repository whose relationship table the declaration goes into. The model's default if empty.
    std::string repository {};

    std::string childRepository {};
    std::string parentRepository {};

    /// Foreign key property names on the child model.
    std::vector<std::string> childKey {};

    /// Key property names on the parent model.
    std::vector<std::string> parentKey {};
};

/// @brief A declared association between a source model and a target model.
///
/// For a many-to-one relationship the source is the child and the target the parent,
/// for all other kinds the source is the parent and the target the child.
/// Target models are referred to by name and resolved through the registry on first use.
/// Relationships are shared by their table and by the associations and collections using them,
/// so redeclaring a relationship leaves those users with the declaration they started with.
class QUARRY_API Relationship: public std::enable_shared_from_this<Relationship>
{
  public:
    Relationship(RelationshipKind kind,
                 std::string name,
                 Model& sourceModel,
                 Cardinality cardinality,
                 RelationshipOptions options);

    Relationship(Relationship const&) = delete;
    Relationship(Relationship&&) = delete;
    Relationship& operator=(Relationship const&) = delete;
    Relationship& operator=(Relationship&&) = delete;
    ~Relationship() = default;

    /// Creates a copy of this relationship for the given subclass, with self references pointing at the subclass.
    [[nodiscard]] std::shared_ptr<Relationship> CloneFor(Model& subclass) const;

    [[nodiscard]] RelationshipKind Kind() const noexcept
    {
        return _kind;
    }

    [[nodiscard]] std::string const& Name() const noexcept
    {
        return _name;
    }

    [[nodiscard]] Cardinality const& GetCardinality() const noexcept
    {
        return _cardinality;
    }

    [[nodiscard]] Model const& SourceModel() const noexcept
    {
        return *_sourceModel;
    }

    [[nodiscard]] std::string const& TargetModelName() const noexcept
    {
        return _targetModelName;
    }

    [[nodiscard]] std::string const& Through() const noexcept
    {
        return _options.through;
    }

    [[nodiscard]] bool IsToMany() const noexcept
    {
        return _kind == RelationshipKind::OneToMany || _kind == RelationshipKind::ManyToMany;
    }

    [[nodiscard]] bool IsToOne() const noexcept
    {
        return !IsToMany();
    }

    /// Resolves the target model through the registry.
    [[nodiscard]] Model const& TargetModel() const;

    [[nodiscard]] Model const& ChildModel() const;
    [[nodiscard]] Model const& ParentModel() const;

    [[nodiscard]] std::string ChildRepositoryName() const;
    [[nodiscard]] std::string ParentRepositoryName() const;

    /// The repository table this relationship has been declared in.
    [[nodiscard]] std::string const& RepositoryName() const noexcept
    {
        return _options.repository;
    }

    /// The relationship this many-to-many relationship goes through, or nullptr.
    [[nodiscard]] Relationship const* ThroughRelationship() const;

    /// @brief Foreign key property names on the child model.
    ///
    /// Default to "<relationship>_<key>" for many-to-one and "<parent model>_<key>" otherwise.
    /// Properties missing on the child model are declared as nullable integers on first use.
    [[nodiscard]] std::vector<std::string> ChildKey() const;

    /// Key property names on the parent model. Default to the parent model's key.
    [[nodiscard]] std::vector<std::string> ParentKey() const;

    /// @brief Builds the query for the targets of the given source resource.
    ///
    /// Throws UnsavedParentError if the source has no key.
    [[nodiscard]] Query TargetQuery(Resource const& source) const;

    /// Copies the parent's key into the child's foreign key properties.
    void AssignChildKey(Resource& child, Resource const& parent) const;

    /// The child's foreign key values, or std::nullopt if any of them is null.
    [[nodiscard]] std::optional<Key> ForeignKeyOf(Resource const& child) const;

  private:
    Model& TargetModelLocked() const;
    void ResolveKeysLocked() const;
    [[nodiscard]] Relationship const& ViaRelationship() const;

    RelationshipKind _kind;
    std::string _name;
    Model* _sourceModel;
    Cardinality _cardinality;
    RelationshipOptions _options;
    std::string _targetModelName;

    mutable std::mutex _mutex;
    mutable Model* _targetModel = nullptr;
    mutable std::optional<std::vector<std::string>> _childKey;
    mutable std::optional<std::vector<std::string>> _parentKey;
};

/// The relationship table of a model for one repository.
class QUARRY_API RelationshipSet
{
  public:
    RelationshipSet() = default;
    RelationshipSet(RelationshipSet&&) noexcept = default;
    RelationshipSet& operator=(RelationshipSet&&) noexcept = default;
    RelationshipSet(RelationshipSet const&) = delete;
    RelationshipSet& operator=(RelationshipSet const&) = delete;
    ~RelationshipSet() = default;

    /// Adds the relationship, replacing one of the same name.
    Relationship const& Set(std::shared_ptr<Relationship> relationship);

    [[nodiscard]] Relationship const* Find(std::string_view name) const noexcept;

    [[nodiscard]] bool Contains(std::string_view name) const noexcept
    {
        return Find(name) != nullptr;
    }

    [[nodiscard]] std::vector<Relationship const*> All() const;

    [[nodiscard]] std::size_t Size() const noexcept
    {
        return _relationships.size();
    }

    /// Copies every relationship for the given subclass.
    [[nodiscard]] RelationshipSet CloneFor(Model& subclass) const;

  private:
    std::vector<std::shared_ptr<Relationship>> _relationships;
};

} // namespace Quarry

template <>
struct std::formatter<Quarry::RelationshipKind>: formatter<std::string_view>
{
    auto format(Quarry::RelationshipKind value, format_context& ctx) const -> format_context::iterator
    {
        using namespace std::string_view_literals;
        std::string_view name;
        switch (value)
        {
            case Quarry::RelationshipKind::OneToOne:
                name = "OneToOne"sv;
                break;
            case Quarry::RelationshipKind::OneToMany:
                name = "OneToMany"sv;
                break;
            case Quarry::RelationshipKind::ManyToMany:
                name = "ManyToMany"sv;
                break;
            case Quarry::RelationshipKind::ManyToOne:
                name = "ManyToOne"sv;
                break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};
