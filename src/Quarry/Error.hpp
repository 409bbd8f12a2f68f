// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "Api.hpp"

#include <cstdint>
#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace Quarry
{

/// Classifies the caller-contract violations reported by Quarry.
///
/// Persistence outcomes (a create, update or delete not affecting the expected number of rows)
/// are not errors. They are reported as boolean results.
enum class ErrorCode : std::uint8_t
{
    UNKNOWN_PROPERTY = 1,
    INACCESSIBLE_PROPERTY,
    INCOMPATIBLE_MODEL,
    INVALID_CARDINALITY,
    INVALID_RELATIONSHIP_OPTION,
    UNKNOWN_RELATIONSHIP,
    UNKNOWN_MODEL,
    UNKNOWN_REPOSITORY,
    UNSAVED_PARENT,
    UNMANAGED_RESOURCE,
    INVALID_SETTING,
};

struct ErrorCategory: std::error_category
{
    static ErrorCategory const& get() noexcept
    {
        static ErrorCategory const category;
        return category;
    }

    [[nodiscard]] char const* name() const noexcept override
    {
        return "Quarry";
    }

    [[nodiscard]] std::string message(int code) const override
    {
        using namespace std::string_literals;
        switch (static_cast<ErrorCode>(code))
        {
            case ErrorCode::UNKNOWN_PROPERTY:
                return "unknown property"s;
            case ErrorCode::INACCESSIBLE_PROPERTY:
                return "inaccessible property"s;
            case ErrorCode::INCOMPATIBLE_MODEL:
                return "incompatible model"s;
            case ErrorCode::INVALID_CARDINALITY:
                return "invalid cardinality"s;
            case ErrorCode::INVALID_RELATIONSHIP_OPTION:
                return "invalid relationship option"s;
            case ErrorCode::UNKNOWN_RELATIONSHIP:
                return "unknown relationship"s;
            case ErrorCode::UNKNOWN_MODEL:
                return "unknown model"s;
            case ErrorCode::UNKNOWN_REPOSITORY:
                return "unknown repository"s;
            case ErrorCode::UNSAVED_PARENT:
                return "unsaved parent"s;
            case ErrorCode::UNMANAGED_RESOURCE:
                return "unmanaged resource"s;
            case ErrorCode::INVALID_SETTING:
                return "invalid setting"s;
        }
        return std::format("Quarry error code {}", code);
    }
};

inline std::error_code make_error_code(ErrorCode e)
{
    return { static_cast<int>(e), ErrorCategory::get() };
}

/// Base class of all exceptions thrown by Quarry.
///
/// Constructing an error reports it to the currently configured Logger.
class QUARRY_API Error: public std::runtime_error
{
  public:
    Error(ErrorCode code,
          std::string_view message,
          std::source_location sourceLocation = std::source_location::current());

    [[nodiscard]] ErrorCode Code() const noexcept
    {
        return _code;
    }

  private:
    ErrorCode _code;
};

/// Raised on programming mistakes in the caller: unknown or inaccessible attributes,
/// invalid relationship declarations, unknown models, repositories or relationships.
class QUARRY_API ArgumentError: public Error
{
  public:
    using Error::Error;

    explicit ArgumentError(std::string_view message,
                           std::source_location sourceLocation = std::source_location::current()):
        Error(ErrorCode::UNKNOWN_PROPERTY, message, sourceLocation)
    {
    }
};

/// Raised when ordering two resources of unrelated models.
class QUARRY_API IncompatibleModelError: public Error
{
  public:
    explicit IncompatibleModelError(std::string_view message,
                                    std::source_location sourceLocation = std::source_location::current()):
        Error(ErrorCode::INCOMPATIBLE_MODEL, message, sourceLocation)
    {
    }
};

/// Raised on an attempt to traverse a to-many association from a resource that has never been saved.
///
/// The parent has no key yet, so there is no foreign key value to query the children with.
class QUARRY_API UnsavedParentError: public Error
{
  public:
    explicit UnsavedParentError(std::string_view message,
                                std::source_location sourceLocation = std::source_location::current()):
        Error(ErrorCode::UNSAVED_PARENT, message, sourceLocation)
    {
    }
};

/// Raised when persisting a resource that is not owned by a std::shared_ptr.
class QUARRY_API UnmanagedResourceError: public Error
{
  public:
    explicit UnmanagedResourceError(std::string_view message,
                                    std::source_location sourceLocation = std::source_location::current()):
        Error(ErrorCode::UNMANAGED_RESOURCE, message, sourceLocation)
    {
    }
};

} // namespace Quarry

template <>
struct std::is_error_code_enum<Quarry::ErrorCode>: public std::true_type
{
};

template <>
struct std::formatter<Quarry::ErrorCode>: formatter<std::string>
{
    auto format(Quarry::ErrorCode value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(Quarry::ErrorCategory::get().message(static_cast<int>(value)), ctx);
    }
};
