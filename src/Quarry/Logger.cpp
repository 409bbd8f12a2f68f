// SPDX-License-Identifier: Apache-2.0

#include "Callsite.hpp"
#include "Logger.hpp"
#include "Model.hpp"
#include "Property.hpp"
#include "Resource.hpp"

#include <chrono>
#include <format>
#include <memory>
#include <print>
#include <ranges>
#include <sstream>
#include <string>

#if __has_include(<stacktrace>)
    #include <stacktrace>
#endif

namespace Quarry
{

namespace
{

class StandardLogger: public Logger
{
  private:
    std::chrono::time_point<std::chrono::system_clock> _currentTime;
    std::string _currentTimeStr;

  public:
    void Tick()
    {
        _currentTime = std::chrono::system_clock::now();
        auto const nowMs = time_point_cast<std::chrono::milliseconds>(_currentTime);
        _currentTimeStr = std::format("{:%F %X}.{:03}", _currentTime, nowMs.time_since_epoch().count() % 1'000);
    }

    template <typename... Args>
    void WriteMessage(std::format_string<Args...> const& fmt, Args&&... args)
    {
        std::println("[{}] {}", _currentTimeStr, std::format(fmt, std::forward<Args>(args)...));
    }

    void OnWarning(std::string_view const& message) override
    {
        Tick();
        WriteMessage("Warning: {}", message);
    }

    void OnError(ErrorCode errorCode, std::string_view const& message, std::source_location /*sourceLocation*/) override
    {
        Tick();
        WriteMessage("Error ({}): {}", errorCode, message);
    }

    void OnCallsiteCreated(Callsite const& /*callsite*/) override {}
    void OnRepositoryCallStart(RepositoryOperation /*operation*/, std::string_view const& /*description*/) override {}
    void OnRepositoryCallEnd(std::size_t /*affectedRows*/) override {}
    void OnLazyLoad(Resource const& /*resource*/, std::vector<Property const*> const& /*properties*/) override {}
};

class TraceLogger: public StandardLogger
{
    enum class State : uint8_t
    {
        Idle,
        Calling,
    };

    State _state = State::Idle;
    RepositoryOperation _operation {};
    std::string _description;
    std::chrono::steady_clock::time_point _startedAt {};

  public:
    void OnError(ErrorCode errorCode, std::string_view const& message, std::source_location sourceLocation) override
    {
        StandardLogger::OnError(errorCode, message, sourceLocation);
        WriteDetails(sourceLocation);
    }

    void OnCallsiteCreated(Callsite const& callsite) override
    {
        Tick();
        WriteMessage("New callsite {} for model {}, instantiated from repository {}",
                     callsite.Signature(),
                     callsite.GetModel().Name(),
                     callsite.RepositoryName());
    }

    void OnRepositoryCallStart(RepositoryOperation operation, std::string_view const& description) override
    {
        _state = State::Calling;
        _operation = operation;
        _description = description;
        _startedAt = std::chrono::steady_clock::now();
    }

    void OnRepositoryCallEnd(std::size_t affectedRows) override
    {
        if (_state != State::Calling)
            return;

        Tick();

        auto const stoppedAt = std::chrono::steady_clock::now();
        auto const duration = std::chrono::duration_cast<std::chrono::microseconds>(stoppedAt - _startedAt);
        auto const seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
        auto const microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration - seconds);
        auto const durationStr = std::format("{}.{:06}", seconds.count(), microseconds.count());

        auto const rowCountStr = [&]() -> std::string {
            if (affectedRows == 1)
                return "[1 row]";
            return std::format("[{} rows]", affectedRows);
        }();

        WriteMessage("[{}] {} {} {}", durationStr, rowCountStr, _operation, _description);

        _description.clear();
        _state = State::Idle;
    }

    void OnLazyLoad(Resource const& resource, std::vector<Property const*> const& properties) override
    {
        std::stringstream names;
        for (auto const&& [index, property]: properties | std::views::enumerate)
        {
            if (index)
                names << ", ";
            names << property->Name();
        }

        Tick();
        WriteMessage("Lazy loading [{}] for {}", names.str(), resource.Inspect());
    }

  private:
    void WriteDetails(std::source_location sourceLocation)
    {
        WriteMessage("  Source: {}:{}", sourceLocation.file_name(), sourceLocation.line());
        if (!_description.empty())
            WriteMessage("  Repository call: {} {}", _operation, _description);
        WriteMessage("  Stack trace:");

#if __has_include(<stacktrace>)
        auto stackTrace = std::stacktrace::current(1, 25);
        for (std::size_t const i: std::views::iota(std::size_t(0), stackTrace.size()))
            WriteMessage("    [{:>2}] {}", i, stackTrace[i]);
#endif
    }
};

} // namespace

Logger::Null& Logger::NullLogger() noexcept
{
    static Logger::Null theNullLogger {};
    return theNullLogger;
}

static std::unique_ptr<StandardLogger> theStdLogger {};

Logger& Logger::StandardLogger()
{
    if (!theStdLogger)
        theStdLogger = std::make_unique<Quarry::StandardLogger>();

    return *theStdLogger;
}

static std::unique_ptr<TraceLogger> theTraceLogger {};

Logger& Logger::TraceLogger()
{
    if (!theTraceLogger)
        theTraceLogger = std::make_unique<Quarry::TraceLogger>();

    return *theTraceLogger;
}

static Logger* theDefaultLogger = &Logger::NullLogger();

Logger& Logger::GetLogger()
{
    return *theDefaultLogger;
}

void Logger::SetLogger(Logger& logger)
{
    theDefaultLogger = &logger;
}

} // namespace Quarry
