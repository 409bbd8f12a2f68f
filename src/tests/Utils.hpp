// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Quarry/Callsite.hpp"
#include "../Quarry/Collection.hpp"
#include "../Quarry/Error.hpp"
#include "../Quarry/Logger.hpp"
#include "../Quarry/Model.hpp"
#include "../Quarry/Property.hpp"
#include "../Quarry/Query.hpp"
#include "../Quarry/Registry.hpp"
#include "../Quarry/Relationship.hpp"
#include "../Quarry/Repository.hpp"
#include "../Quarry/Resource.hpp"
#include "../Quarry/Settings.hpp"
#include "../Quarry/Value.hpp"

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <print>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace std
{

// Add support for Quarry values to std::ostream,
// so that we can get them pretty-printed in REQUIRE() and CHECK() macros.

inline ostream& operator<<(ostream& os, Quarry::Value const& value)
{
    return os << value.Inspect();
}

} // namespace std

class TestSuiteLogger: public Quarry::Logger
{
  private:
    template <typename... Args>
    void WriteInfo(std::format_string<Args...> const& fmt, Args&&... args)
    {
        auto message = std::format(fmt, std::forward<Args>(args)...);
        message = std::format("[{}] {}", "Quarry", message);
        try
        {
            UNSCOPED_INFO(message);
        }
        catch (...)
        {
            std::println("{}", message);
        }
    }

  public:
    static TestSuiteLogger& GetLogger() noexcept
    {
        static TestSuiteLogger theLogger;
        return theLogger;
    }

    void OnWarning(std::string_view const& message) override
    {
        WriteInfo("Warning: {}", message);
    }

    void OnError(Quarry::ErrorCode errorCode, std::string_view const& message, std::source_location sourceLocation) override
    {
        WriteInfo("Error ({}): {}", errorCode, message);
        WriteInfo("  Source: {}:{}", sourceLocation.file_name(), sourceLocation.line());
    }

    void OnCallsiteCreated(Quarry::Callsite const& /*callsite*/) override {}

    void OnRepositoryCallStart(Quarry::RepositoryOperation operation, std::string_view const& description) override
    {
        WriteInfo("{} {}", operation, description);
    }

    void OnRepositoryCallEnd(std::size_t /*affectedRows*/) override {}

    void OnLazyLoad(Quarry::Resource const& resource, std::vector<Quarry::Property const*> const& /*properties*/) override
    {
        WriteInfo("Lazy loading {}", resource.Inspect());
    }
};

// Records the events it receives, and restores the previous logger when it goes out of scope.
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class ScopedRecordingLogger: public Quarry::Logger
{
  private:
    Quarry::Logger& _previousLogger = Quarry::Logger::GetLogger();

  public:
    std::atomic<std::size_t> callsitesCreated = 0;
    std::atomic<std::size_t> repositoryCalls = 0;
    std::atomic<std::size_t> lazyLoads = 0;
    std::vector<std::string> warnings;
    std::vector<Quarry::ErrorCode> errors;
    std::vector<std::vector<std::string>> lazyLoadedProperties;

    ScopedRecordingLogger()
    {
        Quarry::Logger::SetLogger(*this);
    }

    ~ScopedRecordingLogger() override
    {
        Quarry::Logger::SetLogger(_previousLogger);
    }

    void OnWarning(std::string_view const& message) override
    {
        warnings.emplace_back(message);
    }

    void OnError(Quarry::ErrorCode errorCode,
                 std::string_view const& /*message*/,
                 std::source_location /*sourceLocation*/) override
    {
        errors.push_back(errorCode);
    }

    void OnCallsiteCreated(Quarry::Callsite const& /*callsite*/) override
    {
        ++callsitesCreated;
    }

    void OnRepositoryCallStart(Quarry::RepositoryOperation /*operation*/, std::string_view const& /*description*/) override
    {
        ++repositoryCalls;
    }

    void OnRepositoryCallEnd(std::size_t /*affectedRows*/) override {}

    void OnLazyLoad(Quarry::Resource const& /*resource*/, std::vector<Quarry::Property const*> const& properties) override
    {
        ++lazyLoads;
        auto& names = lazyLoadedProperties.emplace_back();
        for (auto const* property: properties)
            names.push_back(property->Name());
    }
};

/// A repository keeping its rows in memory, one table per base model.
class InMemoryRepository: public Quarry::Repository
{
  public:
    using Table = std::vector<Quarry::Row>;

    struct Counters
    {
        std::size_t creates = 0;
        std::size_t reads = 0;
        std::size_t updates = 0;
        std::size_t deletes = 0;
    };

    using Repository::Repository;

    /// Makes every call of the given operation fail until reset.
    std::optional<Quarry::RepositoryOperation> failing;

    Counters counters {};

    /// The queries passed to Read(), in order.
    std::vector<Quarry::Query> readQueries;

    Table& TableOf(Quarry::Model const& model)
    {
        return _tables[model.BaseModel().Name()];
    }

    /// Inserts a row directly, bypassing the resource layer.
    void Insert(Quarry::Model const& model, Quarry::Row row)
    {
        TableOf(model).emplace_back(std::move(row));
    }

    [[nodiscard]] std::size_t TotalCalls() const noexcept
    {
        return counters.creates + counters.reads + counters.updates + counters.deletes;
    }

  protected:
    std::size_t OnCreate(std::vector<std::shared_ptr<Quarry::Resource>> const& resources) override
    {
        ++counters.creates;
        if (failing == Quarry::RepositoryOperation::Create)
            return 0;

        for (auto const& resource: resources)
        {
            auto const& model = resource->GetModel();
            auto& table = TableOf(model);

            Quarry::Row row;
            for (auto const* property: model.Properties().All())
            {
                if (property->IsSerial() && property->GetLoaded(*resource).IsNull())
                    property->Load(*resource, Quarry::Value { NextSerial(table, property->Name()) });
                row.insert_or_assign(property->Name(), property->GetLoaded(*resource));
            }
            table.emplace_back(std::move(row));
        }
        return resources.size();
    }

    std::size_t OnUpdate(Quarry::PropertyValueList const& attributes, Quarry::Query const& query) override
    {
        ++counters.updates;
        if (failing == Quarry::RepositoryOperation::Update)
            return 0;

        std::size_t count = 0;
        for (auto& row: TableOf(query.GetModel()))
        {
            if (!query.Matches(row))
                continue;
            for (auto const& [property, value]: attributes)
                row.insert_or_assign(property->Name(), value);
            ++count;
        }
        return count;
    }

    std::size_t OnDelete(Quarry::Query const& query) override
    {
        ++counters.deletes;
        if (failing == Quarry::RepositoryOperation::Delete)
            return 0;

        return std::erase_if(TableOf(query.GetModel()), [&](Quarry::Row const& row) { return query.Matches(row); });
    }

    std::vector<Quarry::Row> OnRead(Quarry::Query const& query) override
    {
        ++counters.reads;
        readQueries.push_back(query);
        if (failing == Quarry::RepositoryOperation::Read)
            return {};

        std::vector<Quarry::Row> result;
        for (auto const& row: TableOf(query.GetModel()))
        {
            if (!query.Matches(row))
                continue;

            auto& projected = result.emplace_back();
            for (auto const& field: query.Fields())
                if (auto const i = row.find(field); i != row.end())
                    projected.insert_or_assign(field, i->second);
        }

        std::ranges::stable_sort(result, [&](Quarry::Row const& a, Quarry::Row const& b) {
            for (auto const& [property, direction]: query.Order())
            {
                auto const ordering = ValueOf(a, property).Compare(ValueOf(b, property));
                if (ordering != 0)
                    return direction == Quarry::SortDirection::Ascending ? ordering < 0 : ordering > 0;
            }
            return false;
        });

        auto const offset = std::min(query.Offset(), result.size());
        result.erase(result.begin(), result.begin() + static_cast<std::ptrdiff_t>(offset));
        if (auto const limit = query.Limit(); limit && *limit < result.size())
            result.resize(*limit);

        return result;
    }

  private:
    static Quarry::Value ValueOf(Quarry::Row const& row, std::string const& name)
    {
        if (auto const i = row.find(name); i != row.end())
            return i->second;
        return {};
    }

    static long long NextSerial(Table const& table, std::string const& name)
    {
        long long next = 1;
        for (auto const& row: table)
            if (auto const i = row.find(name); i != row.end())
                if (auto const value = i->second.TryGetInteger(); value && *value >= next)
                    next = *value + 1;
        return next;
    }

    std::map<std::string, Table, std::less<>> _tables;
};

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class QuarryTestFixture
{
  public:
    using MainProgramArgs = std::tuple<int, char**>;

    static std::variant<MainProgramArgs, int> Initialize(int argc, char** argv)
    {
        Quarry::Logger::SetLogger(TestSuiteLogger::GetLogger());

        using namespace std::string_view_literals;
        int i = 1;
        for (; i < argc; ++i)
        {
            if (argv[i] == "--trace"sv)
                Quarry::Logger::SetLogger(Quarry::Logger::TraceLogger());
            else if (argv[i] == "--help"sv || argv[i] == "-h"sv)
            {
                std::println("{} [--trace] [[--] [Catch2 flags ...]]", argv[0]);
                return { EXIT_SUCCESS };
            }
            else if (argv[i] == "--"sv)
            {
                ++i;
                break;
            }
            else
                break;
        }

        if (i < argc)
            argv[i - 1] = argv[0];

        return MainProgramArgs { argc - (i - 1), argv + (i - 1) };
    }

    QuarryTestFixture():
        repository { std::make_shared<InMemoryRepository>("default") }
    {
        registry.AddRepository(repository);
    }

    virtual ~QuarryTestFixture() = default;

    /// Product{id serial, type discriminator, name not null, category_id, active}
    Quarry::Model& DefineProduct()
    {
        using namespace Quarry;
        auto& product = registry.DefineModel("Product");
        product.DeclareProperty("id", PropertyType::Integer, PropertyOptions { .nullable = false, .serial = true });
        product.DeclareProperty("type", PropertyType::Class);
        product.DeclareProperty("name", PropertyType::String, PropertyOptions { .nullable = false });
        product.DeclareProperty("category_id", PropertyType::Integer);
        product.DeclareProperty("active", PropertyType::Boolean);
        return product;
    }

    /// Category{id serial, name}
    Quarry::Model& DefineCategory()
    {
        using namespace Quarry;
        auto& category = registry.DefineModel("Category");
        category.DeclareProperty("id", PropertyType::Integer, PropertyOptions { .nullable = false, .serial = true });
        category.DeclareProperty("name", PropertyType::String);
        return category;
    }

    Quarry::Registry registry;
    std::shared_ptr<InMemoryRepository> repository;
};

/// Runs the callable and returns the code of the Quarry::Error it throws, if any.
template <typename Callable>
std::optional<Quarry::ErrorCode> ThrownErrorCode(Callable&& callable)
{
    try
    {
        std::forward<Callable>(callable)();
    }
    catch (Quarry::Error const& error)
    {
        return error.Code();
    }
    return std::nullopt;
}
