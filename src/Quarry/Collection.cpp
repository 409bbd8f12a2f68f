// SPDX-License-Identifier: Apache-2.0

#include "Callsite.hpp"
#include "Collection.hpp"
#include "Error.hpp"
#include "Model.hpp"
#include "Registry.hpp"
#include "Relationship.hpp"
#include "Repository.hpp"
#include "Resource.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <unordered_map>

namespace Quarry
{

namespace
{

std::optional<Key> KeyOfRow(Model const& model, Row const& row)
{
    Key key;
    for (auto const* property: model.Key())
    {
        auto const i = row.find(property->Name());
        if (i == row.end() || i->second.IsNull())
            return std::nullopt;
        key.push_back(property->Typecast(i->second));
    }
    if (key.empty())
        return std::nullopt;
    return key;
}

void ApplyRow(Resource& resource, Row const& row, Collection::RefreshMode mode, auto&& eraseOriginal)
{
    for (auto const& [name, value]: row)
    {
        auto const* property = resource.GetModel().FindProperty(name);
        if (!property)
            continue;

        switch (mode)
        {
            case Collection::RefreshMode::FillUnloaded:
                if (!property->IsLoaded(resource))
                    property->Load(resource, property->Typecast(value));
                break;
            case Collection::RefreshMode::Overwrite:
                property->Load(resource, property->Typecast(value));
                eraseOriginal(*property);
                break;
        }
    }
}

} // namespace

Collection::Collection(PrivateTag, Query query, std::shared_ptr<Callsite> callsite):
    _query { std::move(query) },
    _callsite { std::move(callsite) }
{
}

std::shared_ptr<Collection> Collection::Make(Query query, std::vector<ResourcePtr> const& resources)
{
    auto collection = std::make_shared<Collection>(PrivateTag {}, std::move(query), nullptr);
    collection->_resources = resources;
    collection->_loaded = true;
    return collection;
}

std::shared_ptr<Collection> Collection::Load(Query query, std::shared_ptr<Callsite> callsite)
{
    auto collection = std::make_shared<Collection>(PrivateTag {}, std::move(query), std::move(callsite));
    collection->EnsureLoaded();
    return collection;
}

std::shared_ptr<Collection> Collection::ForRelationship(Relationship const& relationship, ResourcePtr const& source)
{
    auto const& target = relationship.TargetModel();
    auto repository = target.GetRegistry().GetRepository(relationship.ChildRepositoryName());

    auto collection = std::make_shared<Collection>(PrivateTag {}, Query(std::move(repository), target), nullptr);
    collection->_relationship = relationship.shared_from_this();
    collection->_source = source;
    return collection;
}

void Collection::EnsureLoaded()
{
    if (_loaded)
        return;

    if (_relationship)
    {
        auto const source = _source.lock();
        if (!source)
            throw UnmanagedResourceError(
                std::format("The source of relationship {} has been released", _relationship->Name()));

        _query = _relationship->TargetQuery(*source);
    }

    LoadRows(_query.GetRepository().Read(_query));
    _loaded = true;
}

std::vector<ResourcePtr> const& Collection::All()
{
    EnsureLoaded();
    return _resources;
}

ResourcePtr Collection::First()
{
    auto const& resources = All();
    return resources.empty() ? nullptr : resources.front();
}

void Collection::Add(ResourcePtr resource)
{
    if (_relationship)
    {
        auto const source = _source.lock();

        if (!_loaded && source && source->IsSaved())
            EnsureLoaded();
        _loaded = true;

        if (source && source->GetKey() && _relationship->Kind() == RelationshipKind::OneToMany)
            _relationship->AssignChildKey(*resource, *source);
    }

    if (std::ranges::find(_resources, resource) == _resources.end())
        _resources.emplace_back(std::move(resource));
}

bool Collection::Save()
{
    if (!_loaded)
        return true;

    auto const source = _source.lock();
    for (auto const& resource: _resources)
    {
        if (_relationship && source && _relationship->Kind() == RelationshipKind::OneToMany)
            _relationship->AssignChildKey(*resource, *source);

        if (!resource->Save())
            return false;
    }
    return true;
}

void Collection::Reload(std::vector<std::string> const& fields, RefreshMode mode)
{
    auto const& model = _query.GetModel();

    std::unordered_map<Key, ResourcePtr, KeyHash> members;
    for (auto const& resource: _resources)
        if (resource->IsSaved())
            if (auto key = resource->GetKey(); key)
                members.emplace(std::move(*key), resource);

    if (members.empty())
        return;

    QueryOptions options;
    options.fields = std::vector<std::string> {};
    for (auto const& field: fields)
        if (model.FindProperty(field))
            options.fields->push_back(field);

    auto const keyProperties = model.Key();
    for (auto const&& [index, property]: keyProperties | std::views::enumerate)
    {
        auto& condition = options.conditions.emplace_back(Condition { .property = property->Name(), .values = {} });
        for (auto const& [key, resource]: members)
            if (std::ranges::find(condition.values, key[index]) == condition.values.end())
                condition.values.push_back(key[index]);
    }

    auto const query = Query(_query.RepositoryPtr(), model, options);
    for (auto const& row: query.GetRepository().Read(query))
    {
        auto const key = KeyOfRow(model, row);
        if (!key)
            continue;

        auto const i = members.find(*key);
        if (i == members.end())
            continue;

        auto& resource = *i->second;
        ApplyRow(resource, row, mode, [&](Property const& property) { resource._originalValues.erase(&property); });
    }
}

void Collection::ReloadAll()
{
    if (!_loaded)
        return;

    std::vector<std::string> fields;
    for (auto const& resource: _resources)
        for (auto const* property: resource->LoadedAttributes())
            if (std::ranges::find(fields, property->Name()) == fields.end())
                fields.push_back(property->Name());

    Reload(fields, RefreshMode::Overwrite);

    for (auto const& resource: _resources)
        if (resource->IsSaved())
            resource->ReloadChildren();
}

void Collection::LoadRows(std::vector<Row> const& rows)
{
    for (auto const& row: rows)
        if (auto resource = Materialize(row); resource)
            _resources.emplace_back(std::move(resource));
}

ResourcePtr Collection::Materialize(Row const& row)
{
    auto const& queryModel = _query.GetModel();

    // Single-table inheritance: the discriminator names the model the row represents.
    auto const* model = &queryModel;
    if (auto const* discriminator = queryModel.Discriminator(); discriminator)
        if (auto const i = row.find(discriminator->Name()); i != row.end())
            if (auto const name = i->second.TryGetString(); name)
                if (auto const* subclass = queryModel.GetRegistry().FindModel(*name); subclass && subclass->IsA(queryModel))
                    model = subclass;

    auto const key = KeyOfRow(queryModel, row);
    auto const& repository = _query.RepositoryPtr();
    auto& identityMap = repository->IdentityMapFor(queryModel);

    auto resource = key ? identityMap.Get(*key) : nullptr;
    if (resource)
        ApplyRow(*resource, row, RefreshMode::FillUnloaded, [](Property const&) {});
    else
    {
        resource = Resource::Make(*model);
        ApplyRow(*resource, row, RefreshMode::FillUnloaded, [](Property const&) {});
        if (key)
            identityMap.Set(*key, resource);
    }

    resource->OnLoaded(repository, shared_from_this(), _callsite);
    return resource;
}

} // namespace Quarry
