// SPDX-License-Identifier: Apache-2.0

#include "Error.hpp"
#include "Model.hpp"
#include "Registry.hpp"
#include "Relationship.hpp"
#include "Repository.hpp"
#include "Resource.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>

namespace Quarry
{

namespace
{

std::string Camelize(std::string_view name)
{
    std::string result;
    result.reserve(name.size());
    bool upper = true;
    for (char const c: name)
    {
        if (c == '_')
        {
            upper = true;
            continue;
        }
        result += upper ? (char) std::toupper(static_cast<unsigned char>(c)) : c;
        upper = false;
    }
    return result;
}

std::string Singularize(std::string_view name)
{
    if (name.ends_with("ies"))
        return std::format("{}y", name.substr(0, name.size() - 3));
    if (name.ends_with('s') && !name.ends_with("ss"))
        return std::string(name.substr(0, name.size() - 1));
    return std::string(name);
}

std::string SnakeCase(std::string_view name)
{
    std::string result;
    for (auto const [i, c]: name | std::views::enumerate)
    {
        if (std::isupper(static_cast<unsigned char>(c)))
        {
            if (i != 0)
                result += '_';
            result += (char) std::tolower(c);
        }
        else
            result += c;
    }
    return result;
}

std::string DeriveTargetModelName(RelationshipKind kind, std::string_view name)
{
    switch (kind)
    {
        case RelationshipKind::OneToMany:
        case RelationshipKind::ManyToMany:
            return Camelize(Singularize(name));
        case RelationshipKind::OneToOne:
        case RelationshipKind::ManyToOne:
            break;
    }
    return Camelize(name);
}

} // namespace

// {{{ Cardinality

Cardinality::Cardinality(long long exact):
    Cardinality { exact == Infinite ? 0 : exact, exact }
{
}

Cardinality::Cardinality(long long min, long long max):
    _min { min },
    _max { max }
{
    if (min == Infinite && max == Infinite)
        throw ArgumentError(ErrorCode::INVALID_CARDINALITY, "Cardinality range cannot be N..N");

    if (min > max)
        throw ArgumentError(ErrorCode::INVALID_CARDINALITY,
                            std::format("Cardinality minimum {} exceeds maximum {}", min, max));

    if (min < 0)
        throw ArgumentError(ErrorCode::INVALID_CARDINALITY,
                            std::format("Cardinality minimum must be zero or positive, but was {}", min));

    if (max < 1)
        throw ArgumentError(ErrorCode::INVALID_CARDINALITY,
                            std::format("Cardinality maximum must be at least 1, but was {}", max));
}

RelationshipKind SelectRelationshipKind(Cardinality const& cardinality, bool hasThrough) noexcept
{
    if (hasThrough)
        return RelationshipKind::ManyToMany;
    if (cardinality.Max() > 1)
        return RelationshipKind::OneToMany;
    return RelationshipKind::OneToOne;
}

// }}}

// {{{ Relationship

Relationship::Relationship(RelationshipKind kind,
                           std::string name,
                           Model& sourceModel,
                           Cardinality cardinality,
                           RelationshipOptions options):
    _kind { kind },
    _name { std::move(name) },
    _sourceModel { &sourceModel },
    _cardinality { cardinality },
    _options { std::move(options) },
    _targetModelName { _options.model.empty() ? DeriveTargetModelName(_kind, _name) : _options.model }
{
    if (_options.repository.empty())
        _options.repository = sourceModel.DefaultRepositoryName();

    if (!_options.childKey.empty() && !_options.parentKey.empty()
        && _options.childKey.size() != _options.parentKey.size())
        throw ArgumentError(ErrorCode::INVALID_RELATIONSHIP_OPTION,
                            std::format("Child and parent key of {}.{} differ in size", sourceModel.Name(), _name));
}

std::shared_ptr<Relationship> Relationship::CloneFor(Model& subclass) const
{
    auto clone = std::make_shared<Relationship>(_kind, _name, subclass, _cardinality, _options);
    if (_targetModelName == _sourceModel->Name())
        clone->_targetModelName = subclass.Name();

    auto const _ = std::lock_guard { _mutex };
    clone->_childKey = _childKey;
    clone->_parentKey = _parentKey;
    return clone;
}

Model& Relationship::TargetModelLocked() const
{
    if (!_targetModel)
        _targetModel = &_sourceModel->GetRegistry().GetModel(_targetModelName);
    return *_targetModel;
}

Model const& Relationship::TargetModel() const
{
    auto const _ = std::lock_guard { _mutex };
    return TargetModelLocked();
}

Model const& Relationship::ChildModel() const
{
    if (_kind == RelationshipKind::ManyToOne)
        return *_sourceModel;
    return TargetModel();
}

Model const& Relationship::ParentModel() const
{
    if (_kind == RelationshipKind::ManyToOne)
        return TargetModel();
    return *_sourceModel;
}

std::string Relationship::ChildRepositoryName() const
{
    if (!_options.childRepository.empty())
        return _options.childRepository;
    return ChildModel().DefaultRepositoryName();
}

std::string Relationship::ParentRepositoryName() const
{
    if (!_options.parentRepository.empty())
        return _options.parentRepository;
    return ParentModel().DefaultRepositoryName();
}

Relationship const* Relationship::ThroughRelationship() const
{
    if (_options.through.empty())
        return nullptr;
    return _sourceModel->Relationships(_options.repository).Find(_options.through);
}

std::vector<std::string> Relationship::ChildKey() const
{
    auto const _ = std::lock_guard { _mutex };
    ResolveKeysLocked();
    return *_childKey;
}

std::vector<std::string> Relationship::ParentKey() const
{
    auto const _ = std::lock_guard { _mutex };
    ResolveKeysLocked();
    return *_parentKey;
}

void Relationship::ResolveKeysLocked() const
{
    if (_childKey && _parentKey)
        return;

    auto& target = TargetModelLocked();
    auto& parent = _kind == RelationshipKind::ManyToOne ? target : *_sourceModel;
    auto& child = _kind == RelationshipKind::ManyToOne ? *_sourceModel : target;

    std::vector<std::string> parentKey = _options.parentKey;
    if (parentKey.empty())
        for (auto const* property: parent.Key())
            parentKey.push_back(property->Name());

    for (auto const& name: parentKey)
        if (!parent.FindProperty(name))
            throw ArgumentError(ErrorCode::INVALID_RELATIONSHIP_OPTION,
                                std::format("Unknown parent key {}.{} of relationship {}", parent.Name(), name, _name));

    std::vector<std::string> childKey = _options.childKey;
    if (_kind == RelationshipKind::ManyToMany)
    {
        if (childKey.empty())
            for (auto const* property: target.Key())
                childKey.push_back(property->Name());
    }
    else
    {
        auto const prefix = _kind == RelationshipKind::ManyToOne ? _name : SnakeCase(parent.BaseModel().Name());
        if (childKey.empty())
            for (auto const& name: parentKey)
                childKey.push_back(std::format("{}_{}", prefix, name));

        if (childKey.size() != parentKey.size())
            throw ArgumentError(ErrorCode::INVALID_RELATIONSHIP_OPTION,
                                std::format("Child and parent key of relationship {} differ in size", _name));

        for (auto const [childName, parentName]: std::views::zip(childKey, parentKey))
            if (!child.FindProperty(childName))
                child.DeclareProperty(childName, parent.GetProperty(parentName).Type(), PropertyOptions {});
    }

    _parentKey = std::move(parentKey);
    _childKey = std::move(childKey);
}

Relationship const& Relationship::ViaRelationship() const
{
    auto const* through = ThroughRelationship();
    if (!through)
        throw ArgumentError(ErrorCode::INVALID_RELATIONSHIP_OPTION,
                            std::format("Unknown through relationship {} of {}", _options.through, _name));

    auto const& joinModel = through->TargetModel();
    for (auto const* candidate: joinModel.Relationships(through->ChildRepositoryName()).All())
        if (candidate->Kind() == RelationshipKind::ManyToOne && candidate->TargetModelName() == _targetModelName)
            return *candidate;

    throw ArgumentError(ErrorCode::INVALID_RELATIONSHIP_OPTION,
                        std::format("Model {} has no many-to-one relationship to {}", joinModel.Name(), _targetModelName));
}

Query Relationship::TargetQuery(Resource const& source) const
{
    auto const& target = TargetModel();

    if (_kind == RelationshipKind::ManyToOne)
    {
        auto const childKey = ChildKey();
        auto const parentKey = ParentKey();
        QueryOptions options;
        for (auto const [childName, parentName]: std::views::zip(childKey, parentKey))
            options.conditions.emplace_back(Condition {
                .property = parentName,
                .values = { source.GetModel().GetProperty(childName).GetLoaded(source) },
            });
        auto repository = _sourceModel->GetRegistry().GetRepository(ParentRepositoryName());
        return Query(std::move(repository), target, options);
    }

    if (source.IsNew() || !source.GetKey())
        throw UnsavedParentError(
            std::format("Cannot traverse {}.{} from a resource that has not been saved", source.GetModel().Name(), _name));

    auto repository = _sourceModel->GetRegistry().GetRepository(ChildRepositoryName());

    if (_kind == RelationshipKind::ManyToMany)
    {
        auto const& via = ViaRelationship();
        auto joinQuery = ThroughRelationship()->TargetQuery(source);
        joinQuery.Update(QueryOptions { .fields = via.ChildKey() });
        auto const rows = joinQuery.GetRepository().Read(joinQuery);

        QueryOptions options;
        for (auto const [childName, parentName]: std::views::zip(via.ChildKey(), via.ParentKey()))
        {
            auto& condition = options.conditions.emplace_back(Condition { .property = parentName, .values = {} });
            for (auto const& row: rows)
                if (auto const i = row.find(childName); i != row.end() && !i->second.IsNull())
                    condition.values.push_back(i->second);
        }
        return Query(std::move(repository), target, options);
    }

    auto const childKey = ChildKey();
    auto const parentKey = ParentKey();
    QueryOptions options;
    for (auto const [childName, parentName]: std::views::zip(childKey, parentKey))
    {
        auto const& value = source.GetModel().GetProperty(parentName).GetLoaded(source);
        if (value.IsNull())
            throw UnsavedParentError(
                std::format("Cannot traverse {}.{}: parent key {} is null", source.GetModel().Name(), _name, parentName));
        options.conditions.emplace_back(Condition { .property = childName, .values = { value } });
    }
    return Query(std::move(repository), target, options);
}

void Relationship::AssignChildKey(Resource& child, Resource const& parent) const
{
    for (auto const [childName, parentName]: std::views::zip(ChildKey(), ParentKey()))
        child.GetModel().GetProperty(childName).Set(child, parent.GetModel().GetProperty(parentName).GetLoaded(parent));
}

std::optional<Key> Relationship::ForeignKeyOf(Resource const& child) const
{
    Key key;
    for (auto const& name: ChildKey())
    {
        auto const& value = child.GetModel().GetProperty(name).GetLoaded(child);
        if (value.IsNull())
            return std::nullopt;
        key.push_back(value);
    }
    return key;
}

// }}}

// {{{ RelationshipSet

Relationship const& RelationshipSet::Set(std::shared_ptr<Relationship> relationship)
{
    auto const i = std::ranges::find_if(
        _relationships, [&](auto const& existing) { return existing->Name() == relationship->Name(); });
    if (i != _relationships.end())
    {
        *i = std::move(relationship);
        return **i;
    }

    _relationships.emplace_back(std::move(relationship));
    return *_relationships.back();
}

Relationship const* RelationshipSet::Find(std::string_view name) const noexcept
{
    auto const i =
        std::ranges::find_if(_relationships, [&](auto const& relationship) { return relationship->Name() == name; });
    return i != _relationships.end() ? i->get() : nullptr;
}

std::vector<Relationship const*> RelationshipSet::All() const
{
    std::vector<Relationship const*> result;
    result.reserve(_relationships.size());
    for (auto const& relationship: _relationships)
        result.push_back(relationship.get());
    return result;
}

RelationshipSet RelationshipSet::CloneFor(Model& subclass) const
{
    RelationshipSet result;
    for (auto const& relationship: _relationships)
        result._relationships.emplace_back(relationship->CloneFor(subclass));
    return result;
}

// }}}

} // namespace Quarry
