// SPDX-License-Identifier: Apache-2.0

#include "Error.hpp"
#include "Model.hpp"
#include "Query.hpp"
#include "Repository.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace Quarry
{

Query::Query(std::shared_ptr<Repository> repository, Model const& model, QueryOptions const& options):
    _repository { std::move(repository) },
    _model { &model },
    _order { model.DefaultOrder() }
{
    if (!options.fields)
        for (auto const* property: model.Properties().Eager())
            AddField(property->Name());

    // Rows of a subclass are told apart from their siblings by the discriminator.
    if (auto const* discriminator = model.Discriminator(); discriminator && model.Parent())
    {
        auto& condition = _conditions.emplace_back(Condition { .property = discriminator->Name(), .values = {} });
        for (auto const* descendant: model.SelfAndDescendants())
            condition.values.emplace_back(descendant->Name());
    }

    Update(options);

    for (auto const* property: model.Key())
        AddField(property->Name());

    if (auto const* discriminator = model.Discriminator(); discriminator)
        AddField(discriminator->Name());
}

Query Query::ForKey(std::shared_ptr<Repository> repository,
                    Model const& model,
                    Key const& key,
                    QueryOptions const& options)
{
    auto const keyProperties = model.Key();
    if (keyProperties.size() != key.size())
        throw ArgumentError(std::format(
            "Key {} does not match the {} key properties of {}", Quarry::ToString(key), keyProperties.size(), model.Name()));

    auto query = Query(std::move(repository), model, options);
    for (auto const [property, value]: std::views::zip(keyProperties, key))
        query._conditions.emplace_back(Condition { .property = property->Name(), .values = { value } });
    return query;
}

Query& Query::Update(QueryOptions const& options)
{
    if (options.fields)
        for (auto const& name: *options.fields)
        {
            RequireProperty(name);
            AddField(name);
        }

    if (options.links)
        for (auto const& name: *options.links)
        {
            if (!_model->Relationships(_repository->Name()).Contains(name))
                throw ArgumentError(ErrorCode::UNKNOWN_RELATIONSHIP,
                                    std::format("Unknown relationship {}.{}", _model->Name(), name));
            AddLink(name);
        }

    for (auto const& condition: options.conditions)
    {
        RequireProperty(condition.property);
        _conditions.push_back(condition);
    }

    if (options.order)
    {
        for (auto const& orderBy: *options.order)
            RequireProperty(orderBy.property);
        _order = *options.order;
    }

    if (options.limit)
        _limit = options.limit;

    if (options.offset)
        _offset = *options.offset;

    return *this;
}

bool Query::HasField(std::string_view name) const noexcept
{
    return std::ranges::find(_fields, name) != _fields.end();
}

bool Query::Matches(Row const& row) const
{
    return std::ranges::all_of(_conditions, [&](Condition const& condition) {
        auto const i = row.find(condition.property);
        auto const value = i != row.end() ? i->second : Value {};
        return std::ranges::any_of(condition.values, [&](Value const& candidate) { return candidate.Equivalent(value); });
    });
}

std::string Query::ToString() const
{
    std::string result = std::format("{} [", _model->Name());
    for (auto const&& [index, field]: _fields | std::views::enumerate)
        result += std::format("{}{}", index ? ", " : "", field);
    result += ']';

    if (!_links.empty())
    {
        result += " LINKS [";
        for (auto const&& [index, link]: _links | std::views::enumerate)
            result += std::format("{}{}", index ? ", " : "", link);
        result += ']';
    }

    for (auto const&& [index, condition]: _conditions | std::views::enumerate)
    {
        result += std::format(" {} {} IN (", index ? "AND" : "WHERE", condition.property);
        for (auto const&& [valueIndex, value]: condition.values | std::views::enumerate)
            result += std::format("{}{}", valueIndex ? ", " : "", value.Inspect());
        result += ')';
    }

    for (auto const&& [index, orderBy]: _order | std::views::enumerate)
        result += std::format("{}{} {}",
                              index ? ", " : " ORDER BY ",
                              orderBy.property,
                              orderBy.direction == SortDirection::Ascending ? "ASC" : "DESC");

    if (_limit)
        result += std::format(" LIMIT {}", *_limit);

    if (_offset)
        result += std::format(" OFFSET {}", _offset);

    return result;
}

void Query::AddField(std::string_view name)
{
    if (!HasField(name))
        _fields.emplace_back(name);
}

void Query::AddLink(std::string_view name)
{
    if (std::ranges::find(_links, name) == _links.end())
        _links.emplace_back(name);
}

void Query::RequireProperty(std::string_view name) const
{
    if (!_model->FindProperty(name))
        throw ArgumentError(ErrorCode::UNKNOWN_PROPERTY, std::format("Unknown property {}.{}", _model->Name(), name));
}

} // namespace Quarry
