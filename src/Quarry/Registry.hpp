// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Callsite.hpp"
#include "Model.hpp"
#include "Settings.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace Quarry
{

class Repository;

/// @brief Owns the models, the repositories and the callsites of one application.
///
/// Models refer to each other and to repositories by name, resolved through their registry.
class QUARRY_API Registry
{
  public:
    explicit Registry(Settings settings = {});

    Registry(Registry const&) = delete;
    Registry(Registry&&) = delete;
    Registry& operator=(Registry const&) = delete;
    Registry& operator=(Registry&&) = delete;
    ~Registry();

    [[nodiscard]] Settings const& GetSettings() const noexcept
    {
        return _settings;
    }

    [[nodiscard]] std::string const& DefaultRepositoryName() const noexcept
    {
        return _settings.defaultRepositoryName;
    }

    /// Defines a new model, optionally derived from the given parent model.
    ///
    /// Throws ArgumentError if a model of that name exists already.
    Model& DefineModel(std::string name, Model* parent = nullptr);

    /// Retrieves a model by name, throwing ArgumentError if there is none.
    [[nodiscard]] Model& GetModel(std::string_view name) const;

    [[nodiscard]] Model* FindModel(std::string_view name) const noexcept;

    /// Registers a repository under its name, replacing one of the same name.
    void AddRepository(std::shared_ptr<Repository> repository);

    /// Retrieves a repository by name, throwing ArgumentError if there is none.
    [[nodiscard]] std::shared_ptr<Repository> GetRepository(std::string_view name) const;

    [[nodiscard]] CallsiteRegistry& Callsites() noexcept
    {
        return _callsites;
    }

  private:
    Settings _settings;
    mutable std::mutex _mutex;
    std::map<std::string, std::unique_ptr<Model>, std::less<>> _models;
    std::map<std::string, std::shared_ptr<Repository>, std::less<>> _repositories;
    CallsiteRegistry _callsites;
};

} // namespace Quarry
