// SPDX-License-Identifier: Apache-2.0

#include "Error.hpp"
#include "Registry.hpp"
#include "Repository.hpp"

#include <format>

namespace Quarry
{

Registry::Registry(Settings settings):
    _settings { std::move(settings) }
{
}

Registry::~Registry() = default;

Model& Registry::DefineModel(std::string name, Model* parent)
{
    auto const _ = std::lock_guard { _mutex };

    if (_models.contains(name))
        throw ArgumentError(ErrorCode::UNKNOWN_MODEL, std::format("Model {} is defined already", name));

    auto model = std::make_unique<Model>(*this, name, parent);
    auto& result = *model;
    _models.emplace(std::move(name), std::move(model));
    return result;
}

Model& Registry::GetModel(std::string_view name) const
{
    if (auto* model = FindModel(name); model)
        return *model;

    throw ArgumentError(ErrorCode::UNKNOWN_MODEL, std::format("Unknown model {}", name));
}

Model* Registry::FindModel(std::string_view name) const noexcept
{
    auto const _ = std::lock_guard { _mutex };
    if (auto const i = _models.find(name); i != _models.end())
        return i->second.get();
    return nullptr;
}

void Registry::AddRepository(std::shared_ptr<Repository> repository)
{
    auto const _ = std::lock_guard { _mutex };
    auto name = repository->Name();
    _repositories.insert_or_assign(std::move(name), std::move(repository));
}

std::shared_ptr<Repository> Registry::GetRepository(std::string_view name) const
{
    {
        auto const _ = std::lock_guard { _mutex };
        if (auto const i = _repositories.find(name); i != _repositories.end())
            return i->second;
    }

    throw ArgumentError(ErrorCode::UNKNOWN_REPOSITORY, std::format("Unknown repository {}", name));
}

} // namespace Quarry
