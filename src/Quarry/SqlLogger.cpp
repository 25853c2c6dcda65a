// SPDX-License-Identifier: Apache-2.0

#include "DataBinder/SqlVariant.hpp"
#include "SqlConnectInfo.hpp"
#include "SqlConnection.hpp"
#include "SqlLogger.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <format>
#include <memory>
#include <mutex>
#include <print>
#include <ranges>
#include <sstream>
#include <thread>
#include <vector>

#if __has_include(<stacktrace>)
    #include <stacktrace>
#endif

namespace
{

class SqlStandardLogger: public SqlLogger
{
  private:
    std::mutex _outputMutex;

  public:
    explicit SqlStandardLogger(SupportBindLogging supportBindLogging = SupportBindLogging::No):
        SqlLogger { supportBindLogging }
    {
    }

    template <typename... Args>
    void WriteMessage(std::format_string<Args...> const& fmt, Args&&... args)
    {
        auto const now = std::chrono::system_clock::now();
        auto const nowMs = time_point_cast<std::chrono::milliseconds>(now);
        auto const timestamp = std::format("{:%F %X}.{:03}", now, nowMs.time_since_epoch().count() % 1'000);

        auto const _ = std::lock_guard { _outputMutex };
        std::println("[{}] {}", timestamp, std::format(fmt, std::forward<Args>(args)...));
    }

    void OnWarning(std::string_view const& message) override
    {
        WriteMessage("Warning: {}", message);
    }

    void OnError(SqlError error, std::source_location /*sourceLocation*/) override
    {
        WriteMessage("SQL Error: {}", error);
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location /*sourceLocation*/) override
    {
        WriteMessage("SQL Error:");
        WriteMessage("  SQLSTATE: {}", errorInfo.sqlState);
        WriteMessage("  Native error code: {}", errorInfo.nativeErrorCode);
        WriteMessage("  Message: {}", errorInfo.message);
    }

    void OnError(SqlQueryError const& error, std::source_location /*sourceLocation*/) override
    {
        WriteMessage("Query Error: {}", error.what());
    }

    void OnConnectionOpened(SqlConnection const& /*connection*/) override {}
    void OnConnectionClosed(SqlConnection const& /*connection*/) override {}
    void OnCompile(std::string_view const& /*query*/, std::size_t /*parameterCount*/) override {}
    void OnDispatch(std::string_view const& /*query*/) override {}
    void OnExecuteDirect(std::string_view const& /*query*/) override {}
    void OnPrepare(std::string_view const& /*query*/) override {}
    void OnBind(std::string_view const& /*name*/, std::string /*value*/) override {}
    void OnExecute(std::string_view const& /*query*/) override {}
    void OnFetchRow() override {}
    void OnFetchEnd() override {}
};

class SqlTraceLogger: public SqlStandardLogger
{
    enum class State : uint8_t
    {
        Idle,
        Preparing,
        Executing,
        Fetching,
        Error
    };

    // Statements run concurrently on the workers of the asynchronous executor,
    // so each thread traces its own statement.
    struct StatementTrace
    {
        State state = State::Idle;
        std::string lastPreparedQuery;
        std::chrono::steady_clock::time_point startedAt {};
        std::vector<std::pair<std::string, std::string>> binds;
        size_t fetchRowCount {};
    };

    static StatementTrace& Current() noexcept
    {
        thread_local StatementTrace trace {};
        return trace;
    }

  public:
    explicit SqlTraceLogger(SupportBindLogging supportBindLogging = SupportBindLogging::Yes):
        SqlStandardLogger { supportBindLogging }
    {
    }

    void OnError(SqlError error, std::source_location sourceLocation) override
    {
        Current().state = State::Error;
        SqlStandardLogger::OnError(error, sourceLocation);
        WriteDetails(sourceLocation);
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        Current().state = State::Error;
        SqlStandardLogger::OnError(errorInfo, sourceLocation);
        WriteDetails(sourceLocation);
    }

    void OnError(SqlQueryError const& error, std::source_location sourceLocation) override
    {
        SqlStandardLogger::OnError(error, sourceLocation);
        WriteMessage("  Source: {}:{}", sourceLocation.file_name(), sourceLocation.line());
    }

    void OnConnectionOpened(SqlConnection const& connection) override
    {
        Current().state = State::Idle;
        WriteMessage("Connection {} opened: {}", connection.ConnectionId(), connection.ConnectionString().Sanitized());
    }

    void OnConnectionClosed(SqlConnection const& connection) override
    {
        Current().state = State::Idle;
        WriteMessage("Connection {} closed.", connection.ConnectionId());
    }

    void OnCompile(std::string_view const& query, std::size_t parameterCount) override
    {
        WriteMessage("Compiled [{} parameters]: {}", parameterCount, query);
    }

    void OnDispatch(std::string_view const& query) override
    {
        WriteMessage("Dispatching to worker: {}", query);
    }

    void OnPrepare(std::string_view const& query) override
    {
        auto& trace = Current();
        if (trace.state == State::Executing || trace.state == State::Fetching)
            OnFetchEnd();

        trace.state = State::Preparing;
        trace.lastPreparedQuery = query;
        trace.startedAt = std::chrono::steady_clock::now();
    }

    void OnBind(std::string_view const& name, std::string value) override
    {
        Current().binds.emplace_back(name, std::move(value));
    }

    void OnExecuteDirect(std::string_view const& query) override
    {
        auto& trace = Current();
        if (trace.state == State::Executing || trace.state == State::Fetching)
            OnFetchEnd();

        trace.state = State::Executing;
        trace.lastPreparedQuery = query;
        trace.startedAt = std::chrono::steady_clock::now();
    }

    void OnExecute(std::string_view const& query) override
    {
        auto& trace = Current();
        if (trace.state == State::Executing)
            OnFetchEnd();

        trace.state = State::Executing;
        trace.lastPreparedQuery = query;
        trace.startedAt = std::chrono::steady_clock::now();
        trace.fetchRowCount = 0;
    }

    void OnFetchRow() override
    {
        auto& trace = Current();
        trace.state = State::Fetching;
        ++trace.fetchRowCount;
    }

    void OnFetchEnd() override
    {
        auto& trace = Current();
        if (trace.state != State::Executing && trace.state != State::Fetching)
            return;

        auto const stoppedAt = std::chrono::steady_clock::now();
        auto const duration = std::chrono::duration_cast<std::chrono::microseconds>(stoppedAt - trace.startedAt);
        auto const seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
        auto const microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration - seconds);
        auto const durationStr = std::format("{}.{:06}", seconds.count(), microseconds.count());

        auto const rowCountStr = [&]() -> std::string {
            if (trace.fetchRowCount == 0)
                return "";
            if (trace.fetchRowCount == 1)
                return " [1 row]";
            return std::format(" [{} rows]", trace.fetchRowCount);
        }();

        if (trace.binds.empty())
        {
            WriteMessage("[{}]{} {}", durationStr, rowCountStr, trace.lastPreparedQuery);
        }
        else
        {
            std::stringstream output;
            for (auto const& [index, bind]: trace.binds | std::views::enumerate)
            {
                auto const& [name, value] = bind;
                if (index != 0)
                    output << ", ";

                if (name.empty())
                    output << value;
                else
                    output << std::format("{}={}", name, value);
            }

            WriteMessage("[{}]{} {} WITH [{}]", durationStr, rowCountStr, trace.lastPreparedQuery, output.str());
        }

        trace.lastPreparedQuery.clear();
        trace.state = State::Idle;
        trace.fetchRowCount = 0;
        trace.binds.clear();
    }

  private:
    void WriteDetails(std::source_location sourceLocation)
    {
        WriteMessage("  Source: {}:{}", sourceLocation.file_name(), sourceLocation.line());
        if (!Current().lastPreparedQuery.empty())
            WriteMessage("  Query: {}", Current().lastPreparedQuery);
        WriteMessage("  Stack trace:");

#if __has_include(<stacktrace>)
        auto stackTrace = std::stacktrace::current(1, 25);
        for (std::size_t const i: std::views::iota(std::size_t(0), stackTrace.size()))
            WriteMessage("    [{:>2}] {}", i, stackTrace[i]);
#endif
    }
};

} // namespace

SqlLogger::Null& SqlLogger::NullLogger() noexcept
{
    static SqlLogger::Null theNullLogger {};
    return theNullLogger;
}

SqlLogger& SqlLogger::StandardLogger()
{
    static SqlStandardLogger theStdLogger {};
    return theStdLogger;
}

SqlLogger& SqlLogger::TraceLogger()
{
    static SqlTraceLogger theTraceLogger { SupportBindLogging::Yes };
    return theTraceLogger;
}

static std::atomic<SqlLogger*> theDefaultLogger = &SqlLogger::NullLogger();

SqlLogger& SqlLogger::GetLogger()
{
    return *theDefaultLogger.load();
}

void SqlLogger::SetLogger(SqlLogger& logger)
{
    theDefaultLogger = &logger;
}
