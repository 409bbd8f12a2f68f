// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace Quarry
{

using SettingsMap = std::map<std::string, std::string>;

/// Parses a settings string of the form "KEY=value;KEY2={value}" into a map.
///
/// Keys are trimmed and upper-cased. Values are trimmed and may be wrapped in curly braces.
/// Pairs without a '=' are ignored.
QUARRY_API SettingsMap ParseSettingsString(std::string_view settingsString);

/// Process-level configuration of Quarry.
struct QUARRY_API Settings
{
    enum class LogLevel : std::uint8_t
    {
        Null,
        Standard,
        Trace,
    };

    /// Name of the repository models fall back to when they do not name one.
    std::string defaultRepositoryName = "default";

    LogLevel logLevel = LogLevel::Null;

    /// Builds settings from a settings string.
    ///
    /// Recognized keys are DEFAULT_REPOSITORY and LOG (null, standard or trace).
    /// Unknown keys are reported as a warning and otherwise ignored.
    static Settings Parse(std::string_view settingsString);

    /// Builds settings from the QUARRY_SETTINGS environment variable, or the defaults if it is unset.
    static Settings FromEnvironment();

    /// Installs the configured logger.
    void Apply() const;
};

} // namespace Quarry
