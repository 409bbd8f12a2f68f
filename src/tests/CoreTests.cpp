// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <Quarry/Lazy.hpp>
#include <Quarry/Settings.hpp>
#include <Quarry/Value.hpp>

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <optional>
#include <string>
#include <unordered_set>

using namespace std::string_view_literals;
using namespace Quarry;

int main(int argc, char** argv)
{
    auto result = QuarryTestFixture::Initialize(argc, argv);
    if (auto const* exitCode = std::get_if<int>(&result))
        return *exitCode;

    std::tie(argc, argv) = std::get<QuarryTestFixture::MainProgramArgs>(result);

    return Catch::Session().run(argc, argv);
}

TEST_CASE("Value.Construction", "[Value]")
{
    CHECK(Value {}.IsNull());
    CHECK(Value { nullptr }.IsNull());
    CHECK(Value { NullValue }.IsNull());
    CHECK(Value { true }.Is<bool>());
    CHECK(Value { 42 }.Is<long long>());
    CHECK(Value { 42U }.Is<long long>());
    CHECK(Value { 1.5 }.Is<double>());
    CHECK(Value { "text" }.Is<std::string>());
    CHECK(Value { "text"sv }.Is<std::string>());
    CHECK(Value { std::optional<int> {} }.IsNull());
    CHECK(Value { std::optional<int> { 7 } }.Get<long long>() == 7);
}

TEST_CASE("Value.Equality", "[Value]")
{
    CHECK(Value { 1 } == Value { 1 });
    CHECK(Value { 1 } != Value { 1.0 });
    CHECK(Value { 1 }.Equivalent(Value { 1.0 }));
    CHECK(!Value { 1 }.Equivalent(Value { "1" }));
    CHECK(Value {}.Equivalent(Value {}));
    CHECK(!Value {}.Equivalent(Value { 0 }));
}

TEST_CASE("Value.Compare", "[Value]")
{
    CHECK(Value {}.Compare(Value { 0 }) < 0);
    CHECK(Value { 0 }.Compare(Value {}) > 0);
    CHECK(Value {}.Compare(Value {}) == 0);
    CHECK(Value { 1 }.Compare(Value { 2 }) < 0);
    CHECK(Value { 2 }.Compare(Value { 1.5 }) > 0);
    CHECK(Value { 2 }.Compare(Value { 2.0 }) == 0);
    CHECK(Value { "abc" }.Compare(Value { "abd" }) < 0);
    CHECK(Value { false }.Compare(Value { true }) < 0);
}

TEST_CASE("Value.As", "[Value]")
{
    CHECK(Value { 3 }.As<int>() == 3);
    CHECK(Value { 3 }.As<double>() == 3.0);
    CHECK(Value { "x" }.As<std::string>() == "x");
    CHECK(Value { true }.As<bool>());
    CHECK(!Value {}.As<std::optional<int>>().has_value());
    CHECK(Value { 5 }.As<std::optional<int>>() == 5);
    CHECK_THROWS_AS(Value { "x" }.As<int>(), std::bad_variant_access);
}

TEST_CASE("Value.ToString", "[Value]")
{
    CHECK(Value {}.ToString() == "NULL");
    CHECK(Value { true }.ToString() == "true");
    CHECK(Value { 12 }.ToString() == "12");
    CHECK(Value { "abc" }.ToString() == "abc");
    CHECK(Value { "abc" }.Inspect() == "\"abc\"");
    CHECK(std::format("{}", Value { 12 }) == "12");
    CHECK(ToString(Key { 1, "a" }) == R"([1, "a"])");
}

TEST_CASE("Value.Hash", "[Value]")
{
    auto const keys = std::unordered_set<Key, KeyHash> { Key { 1 }, Key { 1 }, Key { 2 }, Key { 1, "a" } };
    CHECK(keys.size() == 3);
    CHECK(std::hash<Value> {}(Value { "a" }) == std::hash<Value> {}(Value { "a"sv }));
}

TEST_CASE("Lazy", "[Lazy]")
{
    auto cell = Lazy<int> {};
    CHECK(cell.GetState() == Lazy<int>::State::Unloaded);
    CHECK(cell.Get() == nullptr);

    cell.EmplaceNil();
    CHECK(cell.IsLoaded());
    CHECK(cell.IsNil());
    CHECK(cell.Get() == nullptr);

    auto calls = 0;
    auto const loader = [&]() -> std::optional<int> {
        ++calls;
        return 17;
    };

    // A cell loaded as nothing is not recomputed.
    CHECK(cell.Ensure(loader) == nullptr);
    CHECK(calls == 0);

    cell.Reset();
    CHECK(*cell.Ensure(loader) == 17);
    CHECK(*cell.Ensure(loader) == 17);
    CHECK(calls == 1);
    CHECK(cell.GetState() == Lazy<int>::State::Loaded);
}

TEST_CASE("Settings.ParseSettingsString", "[Settings]")
{
    auto const settings = ParseSettingsString(" log = Trace ; default_repository={main};garbage");
    REQUIRE(settings.size() == 2);
    CHECK(settings.at("LOG") == "Trace");
    CHECK(settings.at("DEFAULT_REPOSITORY") == "main");
}

TEST_CASE("Settings.Parse", "[Settings]")
{
    auto logger = ScopedRecordingLogger {};

    auto const settings = Settings::Parse("LOG=standard;DEFAULT_REPOSITORY=archive;COLOR=yes");
    CHECK(settings.logLevel == Settings::LogLevel::Standard);
    CHECK(settings.defaultRepositoryName == "archive");
    REQUIRE(logger.warnings.size() == 1);
    CHECK(logger.warnings.front().find("COLOR") != std::string::npos);

    CHECK(Settings::Parse("").defaultRepositoryName == "default");
    CHECK(Settings::Parse("LOG=none").logLevel == Settings::LogLevel::Null);

    CHECK(ThrownErrorCode([] { (void) Settings::Parse("LOG=verbose"); }) == ErrorCode::INVALID_SETTING);
    CHECK(ThrownErrorCode([] { (void) Settings::Parse("DEFAULT_REPOSITORY= "); }) == ErrorCode::INVALID_SETTING);
}

TEST_CASE("Settings.Apply", "[Settings]")
{
    auto& previous = Logger::GetLogger();

    Settings { .logLevel = Settings::LogLevel::Trace }.Apply();
    CHECK(&Logger::GetLogger() == &Logger::TraceLogger());

    Settings {}.Apply();
    CHECK(&Logger::GetLogger() == &Logger::NullLogger());

    Logger::SetLogger(previous);
}

TEST_CASE("Settings.Registry", "[Settings]")
{
    auto registry = Registry { Settings::Parse("DEFAULT_REPOSITORY=archive") };
    CHECK(registry.DefaultRepositoryName() == "archive");

    auto& model = registry.DefineModel("Note");
    CHECK(model.DefaultRepositoryName() == "archive");
    CHECK(ThrownErrorCode([&] { (void) model.DefaultRepository(); }) == ErrorCode::UNKNOWN_REPOSITORY);

    registry.AddRepository(std::make_shared<InMemoryRepository>("archive"));
    CHECK(model.DefaultRepository()->Name() == "archive");
}

TEST_CASE("Error", "[Error]")
{
    auto logger = ScopedRecordingLogger {};

    auto const error = ArgumentError(ErrorCode::UNKNOWN_MODEL, "Unknown model Foo");
    CHECK(error.Code() == ErrorCode::UNKNOWN_MODEL);
    CHECK(std::string_view(error.what()) == "Unknown model Foo");
    CHECK(std::format("{}", ErrorCode::UNSAVED_PARENT) == "unsaved parent");
    CHECK(std::error_code(ErrorCode::UNKNOWN_MODEL).category().name() == "Quarry"sv);

    // Errors are reported to the logger as they are raised.
    REQUIRE(logger.errors.size() == 1);
    CHECK(logger.errors.front() == ErrorCode::UNKNOWN_MODEL);
}

TEST_CASE_METHOD(QuarryTestFixture, "Logger.RepositoryCalls", "[Logger]")
{
    auto& product = DefineProduct();
    auto logger = ScopedRecordingLogger {};

    auto resource = product.New({ { "name", "Widget" } });
    REQUIRE(resource->Save());
    CHECK(logger.repositoryCalls.load() == 1);

    REQUIRE(resource->Destroy());
    CHECK(logger.repositoryCalls.load() == 2);
}
