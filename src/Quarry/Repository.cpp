// SPDX-License-Identifier: Apache-2.0

#include "Logger.hpp"
#include "Model.hpp"
#include "Property.hpp"
#include "Repository.hpp"
#include "Resource.hpp"

#include <format>

namespace Quarry
{

Repository::Repository(std::string name):
    _name { std::move(name) }
{
}

std::size_t Repository::Create(std::vector<std::shared_ptr<Resource>> const& resources)
{
    auto const description = [&] {
        if (resources.empty())
            return std::format("{}: nothing", _name);
        return std::format("{}: {} {}", _name, resources.size(), resources.front()->GetModel().Name());
    }();

    auto logger = detail::ScopedRepositoryCallLogger(RepositoryOperation::Create, description);
    auto const count = OnCreate(resources);
    logger += count;
    return count;
}

std::size_t Repository::Update(PropertyValueList const& attributes, Query const& query)
{
    std::string names;
    for (auto const& [property, value]: attributes)
    {
        if (!names.empty())
            names += ", ";
        names += std::format("{}={}", property->Name(), value.Inspect());
    }

    auto logger =
        detail::ScopedRepositoryCallLogger(RepositoryOperation::Update, std::format("{} SET {}", query, names));
    auto const count = OnUpdate(attributes, query);
    logger += count;
    return count;
}

std::size_t Repository::Delete(Query const& query)
{
    auto logger = detail::ScopedRepositoryCallLogger(RepositoryOperation::Delete, query.ToString());
    auto const count = OnDelete(query);
    logger += count;
    return count;
}

std::vector<Row> Repository::Read(Query const& query)
{
    auto logger = detail::ScopedRepositoryCallLogger(RepositoryOperation::Read, query.ToString());
    auto rows = OnRead(query);
    logger += rows.size();
    return rows;
}

IdentityMap& Repository::IdentityMapFor(Model const& model)
{
    auto const& baseModelName = model.BaseModel().Name();

    auto const _ = std::lock_guard { _identityMapsMutex };
    auto i = _identityMaps.find(baseModelName);
    if (i == _identityMaps.end())
        i = _identityMaps.emplace(baseModelName, std::make_unique<IdentityMap>()).first;
    return *i->second;
}

} // namespace Quarry
