// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Error.hpp"

#include <cstdint>
#include <format>
#include <source_location>
#include <string_view>
#include <vector>

namespace Quarry
{

class Callsite;
class Property;
class Resource;

/// The kind of call issued against a Repository.
enum class RepositoryOperation : std::uint8_t
{
    Create,
    Read,
    Update,
    Delete,
};

/// Represents a logger for Quarry operations.
class QUARRY_API Logger
{
  public:
    Logger() = default;
    Logger(Logger const& /*other*/) = default;
    Logger(Logger&& /*other*/) = default;
    Logger& operator=(Logger const& /*other*/) = default;
    Logger& operator=(Logger&& /*other*/) = default;
    virtual ~Logger() = default;

    /// Invoked on a warning.
    virtual void OnWarning(std::string_view const& message) = 0;

    /// Invoked when a caller-contract violation is reported.
    virtual void OnError(ErrorCode errorCode,
                         std::string_view const& message,
                         std::source_location sourceLocation = std::source_location::current()) = 0;

    /// Invoked when a new callsite has been constructed.
    virtual void OnCallsiteCreated(Callsite const& callsite) = 0;

    /// Invoked right before a repository call is issued.
    virtual void OnRepositoryCallStart(RepositoryOperation operation, std::string_view const& description) = 0;

    /// Invoked right after a repository call returned, with the number of affected (or read) rows.
    virtual void OnRepositoryCallEnd(std::size_t affectedRows) = 0;

    /// Invoked when a lazy-load group is fetched for a resource.
    virtual void OnLazyLoad(Resource const& resource, std::vector<Property const*> const& properties) = 0;

    class Null;

    /// Retrieves a null logger that does nothing.
    static Null& NullLogger() noexcept;

    /// Retrieves a logger that logs warnings and errors to standard output.
    static Logger& StandardLogger();

    /// Retrieves a logger that additionally traces callsites, repository calls and lazy loads.
    static Logger& TraceLogger();

    /// Retrieves the currently configured logger.
    static Logger& GetLogger();

    /// Sets the current logger.
    ///
    /// The ownership of the logger is not transferred and remains with the caller.
    static void SetLogger(Logger& logger);
};

class Logger::Null: public Logger
{
  public:
    void OnWarning(std::string_view const& /*message*/) override {}
    void OnError(ErrorCode /*errorCode*/,
                 std::string_view const& /*message*/,
                 std::source_location /*sourceLocation*/) override
    {
    }
    void OnCallsiteCreated(Callsite const& /*callsite*/) override {}
    void OnRepositoryCallStart(RepositoryOperation /*operation*/, std::string_view const& /*description*/) override {}
    void OnRepositoryCallEnd(std::size_t /*affectedRows*/) override {}
    void OnLazyLoad(Resource const& /*resource*/, std::vector<Property const*> const& /*properties*/) override {}
};

namespace detail
{

    /// Brackets a single repository call with start/end notifications to the current logger.
    class ScopedRepositoryCallLogger
    {
      public:
        QUARRY_FORCE_INLINE ScopedRepositoryCallLogger(RepositoryOperation operation, std::string_view description)
        {
            Logger::GetLogger().OnRepositoryCallStart(operation, description);
        }

        ScopedRepositoryCallLogger(ScopedRepositoryCallLogger const&) = delete;
        ScopedRepositoryCallLogger(ScopedRepositoryCallLogger&&) = delete;
        ScopedRepositoryCallLogger& operator=(ScopedRepositoryCallLogger const&) = delete;
        ScopedRepositoryCallLogger& operator=(ScopedRepositoryCallLogger&&) = delete;

        QUARRY_FORCE_INLINE ScopedRepositoryCallLogger& operator+=(std::size_t affectedRows) noexcept
        {
            _affectedRows += affectedRows;
            return *this;
        }

        QUARRY_FORCE_INLINE ~ScopedRepositoryCallLogger()
        {
            Logger::GetLogger().OnRepositoryCallEnd(_affectedRows);
        }

      private:
        std::size_t _affectedRows {};
    };

} // namespace detail

} // namespace Quarry

template <>
struct std::formatter<Quarry::RepositoryOperation>: formatter<std::string_view>
{
    auto format(Quarry::RepositoryOperation value, format_context& ctx) const -> format_context::iterator
    {
        using namespace std::string_view_literals;
        std::string_view name;
        switch (value)
        {
            case Quarry::RepositoryOperation::Create:
                name = "Create"sv;
                break;
            case Quarry::RepositoryOperation::Read:
                name = "Read"sv;
                break;
            case Quarry::RepositoryOperation::Update:
                name = "Update"sv;
                break;
            case Quarry::RepositoryOperation::Delete:
                name = "Delete"sv;
                break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};
