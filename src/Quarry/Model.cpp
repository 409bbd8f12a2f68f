// SPDX-License-Identifier: Apache-2.0

#include "Callsite.hpp"
#include "Collection.hpp"
#include "Error.hpp"
#include "Model.hpp"
#include "Registry.hpp"
#include "Repository.hpp"
#include "Resource.hpp"

#include <algorithm>
#include <format>

namespace Quarry
{

Model::Model(Registry& registry, std::string name, Model* parent):
    _registry { &registry },
    _name { std::move(name) },
    _parent { parent }
{
    if (!_parent)
        return;

    _parent->_descendants.push_back(this);

    for (std::size_t i = 0; i < _parent->_properties.Size(); ++i)
        _properties.Add(_parent->_properties[i].CloneFor(*this, i));

    _defaultOrder = _parent->_defaultOrder;

    for (auto const& [repositoryName, relationships]: _parent->_relationships)
        _relationships.emplace(repositoryName, relationships.CloneFor(*this));
}

Model::~Model() = default;

Model const& Model::BaseModel() const noexcept
{
    auto const* model = this;
    while (model->_parent)
        model = model->_parent;
    return *model;
}

bool Model::IsA(Model const& other) const noexcept
{
    for (auto const* model = this; model; model = model->_parent)
        if (model == &other)
            return true;
    return false;
}

std::vector<Model const*> Model::SelfAndDescendants() const
{
    std::vector<Model const*> result { this };
    for (auto const* descendant: _descendants)
        std::ranges::copy(descendant->SelfAndDescendants(), std::back_inserter(result));
    return result;
}

std::string const& Model::DefaultRepositoryName() const noexcept
{
    if (!_defaultRepositoryName.empty())
        return _defaultRepositoryName;
    if (_parent)
        return _parent->DefaultRepositoryName();
    return _registry->DefaultRepositoryName();
}

void Model::SetDefaultRepositoryName(std::string name)
{
    _defaultRepositoryName = std::move(name);
}

std::shared_ptr<Repository> Model::DefaultRepository() const
{
    return _registry->GetRepository(DefaultRepositoryName());
}

Property const& Model::DeclareProperty(std::string name, PropertyType type, PropertyOptions options)
{
    for (auto* descendant: _descendants)
        if (!descendant->_properties.Contains(name))
            descendant->DeclareProperty(name, type, options);

    return _properties.Add(std::make_unique<Property>(*this, std::move(name), type, std::move(options), _properties.Size()));
}

Property const* Model::IdentityField() const noexcept
{
    Property const* result = nullptr;
    for (std::size_t i = 0; i < _properties.Size(); ++i)
    {
        auto const& property = _properties[i];
        if (!property.IsKey())
            continue;
        if (result || !property.IsSerial())
            return nullptr;
        result = &property;
    }
    return result;
}

std::vector<OrderBy> Model::DefaultOrder() const
{
    if (!_defaultOrder.empty())
        return _defaultOrder;

    std::vector<OrderBy> result;
    for (auto const* property: Key())
        result.emplace_back(OrderBy { .property = property->Name(), .direction = SortDirection::Ascending });
    return result;
}

void Model::SetDefaultOrder(std::vector<OrderBy> order)
{
    for (auto const& [property, direction]: order)
        (void) _properties.Get(property);

    _defaultOrder = std::move(order);
}

RelationshipSet const& Model::Relationships(std::string_view repositoryName) const
{
    if (auto const i = _relationships.find(repositoryName); i != _relationships.end())
        return i->second;

    if (auto const i = _relationships.find(DefaultRepositoryName()); i != _relationships.end())
        return i->second;

    static RelationshipSet const empty {};
    return empty;
}

RelationshipSet& Model::MutableRelationships(std::string_view repositoryName)
{
    if (auto const i = _relationships.find(repositoryName); i != _relationships.end())
        return i->second;

    auto relationships = [&] {
        if (auto const i = _relationships.find(DefaultRepositoryName()); i != _relationships.end())
            return i->second.CloneFor(*this);
        return RelationshipSet {};
    }();

    return _relationships.emplace(std::string(repositoryName), std::move(relationships)).first->second;
}

Relationship const& Model::GetRelationship(std::string_view name, std::string_view repositoryName) const
{
    if (auto const* relationship = Relationships(repositoryName).Find(name); relationship)
        return *relationship;

    throw ArgumentError(ErrorCode::UNKNOWN_RELATIONSHIP, std::format("Unknown relationship {}.{}", _name, name));
}

std::string const& Model::RelationshipTableName(RelationshipOptions const& options) const
{
    return options.repository.empty() ? DefaultRepositoryName() : options.repository;
}

Relationship const& Model::Has(Cardinality cardinality, std::string name, RelationshipOptions options)
{
    auto const repositoryName = RelationshipTableName(options);

    if (!options.through.empty() && !Relationships(repositoryName).Contains(options.through))
        throw ArgumentError(ErrorCode::INVALID_RELATIONSHIP_OPTION,
                            std::format("Unknown through relationship {} for {}.{}", options.through, _name, name));

    auto const kind = SelectRelationshipKind(cardinality, !options.through.empty());
    DeclareRelationship(repositoryName,
                        std::make_shared<Relationship>(kind, name, *this, cardinality, std::move(options)));
    return *Relationships(repositoryName).Find(name);
}

Relationship const& Model::BelongsTo(std::string name, RelationshipOptions options)
{
    if (!options.through.empty())
        throw ArgumentError(ErrorCode::INVALID_RELATIONSHIP_OPTION,
                            std::format("A many-to-one relationship cannot go through {}", options.through));

    auto const repositoryName = RelationshipTableName(options);
    DeclareRelationship(repositoryName,
                        std::make_shared<Relationship>(
                            RelationshipKind::ManyToOne, name, *this, Cardinality { 1 }, std::move(options)));
    return *Relationships(repositoryName).Find(name);
}

void Model::DeclareRelationship(std::string const& repositoryName, std::shared_ptr<Relationship> relationship)
{
    // Declare the foreign key properties right away if the target model is known already.
    if (relationship->Kind() != RelationshipKind::ManyToMany && _registry->FindModel(relationship->TargetModelName()))
        (void) relationship->ChildKey();

    auto const& declared = MutableRelationships(repositoryName).Set(std::move(relationship));

    for (auto* descendant: _descendants)
        descendant->DeclareRelationship(repositoryName, declared.CloneFor(*descendant));
}

Model& Model::Inherit(std::string name)
{
    return _registry->DefineModel(std::move(name), this);
}

ResourcePtr Model::New(AttributeMap const& attributes) const
{
    return Resource::Make(*this, attributes);
}

Query Model::ToQuery(std::shared_ptr<Repository> repository, Quarry::Key const& key) const
{
    return Query::ForKey(std::move(repository), *this, key);
}

std::shared_ptr<Collection> Model::All(QueryOptions const& options, std::source_location location) const
{
    auto callsite = _registry->Callsites().Get(*this, DefaultRepositoryName(), SignatureOf(location));
    auto query = callsite->ToQuery();
    query.Update(options);
    return Collection::Load(std::move(query), std::move(callsite));
}

ResourcePtr Model::Get(Quarry::Key const& key, std::source_location location) const
{
    auto repository = DefaultRepository();
    if (auto resource = repository->IdentityMapFor(*this).Get(key); resource && resource->GetModel().IsA(*this))
        return resource;

    auto callsite = _registry->Callsites().Get(*this, DefaultRepositoryName(), SignatureOf(location));
    auto query = Query::ForKey(std::move(repository), *this, key, callsite->ToQueryOptions());
    return Collection::Load(std::move(query), std::move(callsite))->First();
}

} // namespace Quarry
