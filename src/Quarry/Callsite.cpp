// SPDX-License-Identifier: Apache-2.0

#include "Callsite.hpp"
#include "Error.hpp"
#include "Logger.hpp"
#include "Model.hpp"
#include "Registry.hpp"

#include <format>
#include <functional>
#include <string_view>

namespace Quarry
{

CallsiteSignature SignatureOf(std::source_location location) noexcept
{
    // FNV-1a over file name, line and column.
    CallsiteSignature hash = 14695981039346656037ULL;
    auto const mix = [&](std::uint64_t value) {
        hash ^= value;
        hash *= 1099511628211ULL;
    };

    for (char const c: std::string_view(location.file_name()))
        mix(static_cast<unsigned char>(c));
    mix(location.line());
    mix(location.column());
    return hash;
}

Callsite::Callsite(Model const& model, std::string repositoryName, CallsiteSignature signature):
    _model { &model },
    _repositoryName { std::move(repositoryName) },
    _signature { signature }
{
    Logger::GetLogger().OnCallsiteCreated(*this);
}

std::set<std::string>& Callsite::FieldsLocked() const
{
    if (auto* fields = _fields.Get(); fields)
        return *fields;

    std::set<std::string> fields;
    for (auto const* property: _model->Properties().DefaultLoaded())
        fields.insert(property->Name());
    return _fields.Emplace(std::move(fields));
}

std::set<std::string>& Callsite::LinksLocked() const
{
    if (auto* links = _links.Get(); links)
        return *links;
    return _links.Emplace({});
}

std::set<std::string> Callsite::Fields() const
{
    auto const _ = std::lock_guard { _mutex };
    return FieldsLocked();
}

std::set<std::string> Callsite::Links() const
{
    auto const _ = std::lock_guard { _mutex };
    return LinksLocked();
}

bool Callsite::HasLinks() const
{
    auto const _ = std::lock_guard { _mutex };
    return !LinksLocked().empty();
}

void Callsite::TrackField(std::string_view name)
{
    if (!_model->FindProperty(name))
        throw ArgumentError(ErrorCode::UNKNOWN_PROPERTY, std::format("Unknown property {}.{}", _model->Name(), name));

    auto const _ = std::lock_guard { _mutex };
    FieldsLocked().emplace(name);
}

void Callsite::TrackLink(std::string_view name)
{
    if (!_model->Relationships(_repositoryName).Contains(name))
        throw ArgumentError(ErrorCode::UNKNOWN_RELATIONSHIP,
                            std::format("Unknown relationship {}.{}", _model->Name(), name));

    auto const _ = std::lock_guard { _mutex };
    LinksLocked().emplace(name);
}

std::optional<std::string> Callsite::IdentityField() const
{
    auto const _ = std::lock_guard { _mutex };
    auto const* name = _identityField.Ensure([&]() -> std::optional<std::string> {
        if (auto const* property = _model->IdentityField(); property)
            return property->Name();
        return std::nullopt;
    });
    if (name)
        return *name;
    return std::nullopt;
}

std::optional<std::string> Callsite::InheritanceField() const
{
    auto const _ = std::lock_guard { _mutex };
    auto const* name = _inheritanceField.Ensure([&]() -> std::optional<std::string> {
        if (auto const* property = _model->Discriminator(); property)
            return property->Name();
        return std::nullopt;
    });
    if (name)
        return *name;
    return std::nullopt;
}

QueryOptions Callsite::ToQueryOptions() const
{
    auto const _ = std::lock_guard { _mutex };

    auto const& fields = FieldsLocked();
    auto const& links = LinksLocked();

    QueryOptions options;
    options.fields = std::vector<std::string>(fields.begin(), fields.end());
    if (!links.empty())
        options.links = std::vector<std::string>(links.begin(), links.end());
    return options;
}

Query& Callsite::Optimize(Query& query) const
{
    return query.Update(ToQueryOptions());
}

Query Callsite::ToQuery() const
{
    return Query(_model->GetRegistry().GetRepository(_repositoryName), *_model, ToQueryOptions());
}

std::shared_ptr<Callsite> CallsiteRegistry::Get(Model const& model,
                                                std::string_view repositoryName,
                                                CallsiteSignature signature)
{
    auto key = CallsiteKey { signature, model.Name(), std::string(repositoryName) };

    auto const _ = std::lock_guard { _mutex };
    if (auto const i = _callsites.find(key); i != _callsites.end())
        return i->second;

    auto callsite = std::make_shared<Callsite>(model, std::string(repositoryName), signature);
    _callsites.emplace(std::move(key), callsite);
    return callsite;
}

std::size_t CallsiteRegistry::Size() const
{
    auto const _ = std::lock_guard { _mutex };
    return _callsites.size();
}

} // namespace Quarry
