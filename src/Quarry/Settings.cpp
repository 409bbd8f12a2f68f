// SPDX-License-Identifier: Apache-2.0

#include "Error.hpp"
#include "Logger.hpp"
#include "Settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <ranges>

namespace Quarry
{

namespace
{

constexpr std::string_view DropQuotation(std::string_view value) noexcept
{
    if (!value.empty() && value.front() == '{' && value.back() == '}')
    {
        value.remove_prefix(1);
        value.remove_suffix(1);
    }
    return value;
}

constexpr std::string_view Trim(std::string_view value) noexcept
{
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
        value.remove_prefix(1);

    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
        value.remove_suffix(1);

    return value;
}

std::string ToUpperCaseString(std::string_view input)
{
    std::string result { input };
    std::ranges::transform(result, result.begin(), [](char c) { return (char) std::toupper(c); });
    return result;
}

std::string ToLowerCaseString(std::string_view input)
{
    std::string result { input };
    std::ranges::transform(result, result.begin(), [](char c) { return (char) std::tolower(c); });
    return result;
}

Settings::LogLevel ParseLogLevel(std::string_view value)
{
    auto const name = ToLowerCaseString(value);
    if (name == "null" || name == "none" || name.empty())
        return Settings::LogLevel::Null;
    if (name == "standard")
        return Settings::LogLevel::Standard;
    if (name == "trace")
        return Settings::LogLevel::Trace;

    throw Error(ErrorCode::INVALID_SETTING, std::format("Invalid log level '{}'", value));
}

} // end namespace

SettingsMap ParseSettingsString(std::string_view settingsString)
{
    auto pairs = settingsString | std::views::split(';') | std::views::transform([](auto pair_view) {
                     return std::string_view(pair_view.begin(), pair_view.end());
                 });

    SettingsMap result;

    for (auto const& pair: pairs)
    {
        auto separatorPosition = pair.find('=');
        if (separatorPosition != std::string_view::npos)
        {
            auto const key = Trim(pair.substr(0, separatorPosition));
            auto const value = DropQuotation(Trim(pair.substr(separatorPosition + 1)));
            result.insert_or_assign(ToUpperCaseString(key), std::string(value));
        }
    }

    return result;
}

Settings Settings::Parse(std::string_view settingsString)
{
    Settings settings;

    for (auto const& [key, value]: ParseSettingsString(settingsString))
    {
        if (key == "DEFAULT_REPOSITORY")
        {
            if (value.empty())
                throw Error(ErrorCode::INVALID_SETTING, "DEFAULT_REPOSITORY must not be empty");
            settings.defaultRepositoryName = value;
        }
        else if (key == "LOG")
            settings.logLevel = ParseLogLevel(value);
        else
            Logger::GetLogger().OnWarning(std::format("Ignoring unknown setting '{}'", key));
    }

    return settings;
}

Settings Settings::FromEnvironment()
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    if (auto const* value = std::getenv("QUARRY_SETTINGS"); value && *value)
        return Parse(value);

    return Settings {};
}

void Settings::Apply() const
{
    switch (logLevel)
    {
        case LogLevel::Null:
            Logger::SetLogger(Logger::NullLogger());
            break;
        case LogLevel::Standard:
            Logger::SetLogger(Logger::StandardLogger());
            break;
        case LogLevel::Trace:
            Logger::SetLogger(Logger::TraceLogger());
            break;
    }
}

} // namespace Quarry
