// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include <Quarry/SqlConnectInfo.hpp>
#include <Quarry/SqlConnection.hpp>
#include <Quarry/SqlExecutor.hpp>
#include <Quarry/SqlLogger.hpp>
#include <Quarry/SqlQuery.hpp>
#include <Quarry/SqlQueryFormatter.hpp>
#include <Quarry/SqlSchema.hpp>
#include <Quarry/SqlStatement.hpp>

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <print>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#if __has_include(<stacktrace>)
    #include <stacktrace>
#endif

// Refer to an in-memory SQLite database (and assuming the sqliteodbc driver is installed)
// See:
// - https://www.sqlite.org/inmemorydb.html
// - http://www.ch-werner.de/sqliteodbc/
//
auto const inline DefaultTestConnectionString = SqlConnectionString {
    .value = std::format("DRIVER={};Database={}",
#if defined(_WIN32) || defined(_WIN64)
                         "SQLite3 ODBC Driver",
#else
                         "SQLite3",
#endif
                         "file::memory:"),
};

// Reports logger events to Catch2. Events from worker threads are buffered and reported by the main thread.
class TestSuiteSqlLogger: public SqlLogger::Null
{
  private:
    std::mutex m_mutex;
    std::thread::id m_mainThread = std::this_thread::get_id();
    std::vector<std::string> m_pending;
    std::string m_lastPreparedQuery;

    template <typename... Args>
    void WriteInfo(std::format_string<Args...> const& fmt, Args&&... args)
    {
        auto message = std::format(fmt, std::forward<Args>(args)...);
        auto const _ = std::lock_guard { m_mutex };
        if (std::this_thread::get_id() != m_mainThread)
        {
            m_pending.emplace_back(std::move(message));
            return;
        }

        try
        {
            for (auto const& pending: m_pending)
                UNSCOPED_INFO(pending);
            m_pending.clear();
            UNSCOPED_INFO(message);
        }
        catch (...)
        {
            std::println("{}", message);
        }
    }

    template <typename... Args>
    void WriteWarning(std::format_string<Args...> const& fmt, Args&&... args)
    {
        if (std::this_thread::get_id() != m_mainThread)
            WriteInfo(fmt, std::forward<Args>(args)...);
        else
            WARN(std::format(fmt, std::forward<Args>(args)...));
    }

  public:
    static TestSuiteSqlLogger& GetLogger() noexcept
    {
        static TestSuiteSqlLogger theLogger;
        return theLogger;
    }

    void OnError(SqlError error, std::source_location sourceLocation) override
    {
        WriteWarning("SQL Error: {}", error);
        WriteDetails(sourceLocation);
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        WriteWarning("SQL Error: {}", errorInfo);
        WriteDetails(sourceLocation);
    }

    // Most query errors raised during the test run are expected ones.
    void OnError(SqlQueryError const& error, std::source_location sourceLocation) override
    {
        WriteInfo("Query error: {} at {}:{}", error.what(), sourceLocation.file_name(), sourceLocation.line());
    }

    void OnWarning(std::string_view const& message) override
    {
        WriteWarning("{}", message);
    }

    void OnCompile(std::string_view const& query, std::size_t parameterCount) override
    {
        WriteInfo("Compile: {} ({} parameters)", query, parameterCount);
    }

    void OnDispatch(std::string_view const& query) override
    {
        WriteInfo("Dispatch: {}", query);
    }

    void OnExecuteDirect(std::string_view const& query) override
    {
        WriteInfo("ExecuteDirect: {}", query);
    }

    void OnPrepare(std::string_view const& query) override
    {
        auto const _ = std::lock_guard { m_mutex };
        m_lastPreparedQuery = query;
    }

    void OnExecute(std::string_view const& query) override
    {
        WriteInfo("Execute: {}", query);
    }

  private:
    void WriteDetails(std::source_location sourceLocation)
    {
        WriteInfo("  Source: {}:{}", sourceLocation.file_name(), sourceLocation.line());
        if (!m_lastPreparedQuery.empty())
            WriteInfo("  Query: {}", m_lastPreparedQuery);
        WriteInfo("  Stack trace:");

#if __has_include(<stacktrace>)
        auto stackTrace = std::stacktrace::current(1, 25);
        for (std::size_t const i: std::views::iota(std::size_t(0), stackTrace.size()))
            WriteInfo("    [{:>2}] {}", i, stackTrace[i]);
#endif
    }
};

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class SqlTestFixture
{
  public:
    static inline SqlConfiguration configuration {};
    static inline bool databaseAvailable = false;

    using MainProgramArgs = std::tuple<int, char**>;

    static std::variant<MainProgramArgs, int> Initialize(int argc, char** argv)
    {
        SqlLogger::SetLogger(TestSuiteSqlLogger::GetLogger());

        configuration = SqlConfiguration::FromEnvironment();
        if (configuration.connectionString.value == SqlDefaultConnectionString)
            configuration.connectionString = DefaultTestConnectionString;

        using namespace std::string_view_literals;
        int i = 1;
        for (; i < argc; ++i)
        {
            if (argv[i] == "--trace-sql"sv)
                configuration.traceSql = true;
            else if (argv[i] == "--help"sv || argv[i] == "-h"sv)
            {
                std::println("{} [--trace-sql] [[--] [Catch2 flags ...]]", argv[0]);
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

        configuration.Apply();
        std::println("Using ODBC connection string: '{}'", configuration.connectionString.Sanitized());

        SqlConnection::SetPostConnectedHook(&SqlTestFixture::PostConnectedHook);

        auto sqlConnection = SqlConnection();
        databaseAvailable = sqlConnection.IsAlive();
        if (databaseAvailable)
            std::println("Running database test cases against: {} ({}) (identified as: {})",
                         sqlConnection.ServerName(),
                         sqlConnection.ServerVersion(),
                         sqlConnection.ServerType());
        else
            std::println("No database available, skipping database test cases: {}", sqlConnection.LastError());

        return MainProgramArgs { argc - (i - 1), argv + (i - 1) };
    }

    static void PostConnectedHook(SqlConnection& connection)
    {
        if (connection.ServerType() == SqlServerType::SQLITE)
        {
            auto stmt = SqlStatement { connection };
            // Enable foreign key constraints for SQLite
            stmt.ExecuteDirect("PRAGMA foreign_keys = ON");
        }
    }

    virtual ~SqlTestFixture() = default;
};

// {{{ shared schemas

inline SqlTableSchema const& UsersTable()
{
    static auto const table = SqlTableSchema {
        "users",
        {
            { .name = "id", .type = SqlColumnType::Integer, .primaryKey = true },
            { .name = "name", .type = SqlColumnType::Text },
            { .name = "age", .type = SqlColumnType::Integer, .nullable = true },
            { .name = "email", .type = SqlColumnType::Text, .nullable = true },
            { .name = "score", .type = SqlColumnType::Float, .nullable = true },
            { .name = "active", .type = SqlColumnType::Boolean, .nullable = true },
            { .name = "profile", .type = SqlColumnType::Structured, .nullable = true },
        },
    };
    return table;
}

inline SqlTableSchema const& OrdersTable()
{
    static auto const table = SqlTableSchema {
        "orders",
        {
            { .name = "id", .type = SqlColumnType::Integer, .primaryKey = true },
            { .name = "user_id", .type = SqlColumnType::ForeignKey },
            { .name = "total", .type = SqlColumnType::Float },
            { .name = "note", .type = SqlColumnType::Text, .nullable = true },
        },
    };
    return table;
}

// }}}

// {{{ compilation helpers

struct QueryExpectations
{
    std::string_view sqlite;
    std::string_view postgres;
    std::string_view mysql;
    std::string_view sqlServer;
    std::string_view oracle;
};

[[nodiscard]] inline std::string NormalizeText(std::string_view const& text)
{
    auto result = std::string(text);

    // Remove any newlines and reduce all whitespace to a single space
    std::ranges::replace_if(result, [](char c) { return std::isspace(static_cast<unsigned char>(c)); }, ' ');
    result.erase(std::unique(result.begin(), result.end(), [](char a, char b) { return a == ' ' && b == ' '; }),
                 result.end());

    // trim leading and trailing whitespace
    while (!result.empty() && result.front() == ' ')
        result.erase(result.begin());

    while (!result.empty() && result.back() == ' ')
        result.pop_back();

    return result;
}

struct NamedFormatter
{
    std::string_view name;
    SqlQueryFormatter const& formatter;
};

inline std::vector<NamedFormatter> AllFormatters()
{
    return {
        { .name = "SQLite", .formatter = SqlQueryFormatter::Sqlite() },
        { .name = "PostgreSQL", .formatter = SqlQueryFormatter::PostgreSQL() },
        { .name = "MySQL", .formatter = SqlQueryFormatter::MySQL() },
        { .name = "SQL Server", .formatter = SqlQueryFormatter::SqlServer() },
        { .name = "Oracle", .formatter = SqlQueryFormatter::OracleSQL() },
    };
}

template <typename TheSqlQuery>
    requires(std::is_invocable_v<TheSqlQuery, SqlQueryBuilder&>)
void checkSqlQueryBuilder(TheSqlQuery const& sqlQueryBuilder,
                          QueryExpectations const& expectations,
                          std::function<void(SqlCompiledQuery const&)> const& postCheck = {},
                          std::source_location const& location = std::source_location::current())
{
    INFO(std::format("Test source location: {}:{}", location.file_name(), location.line()));

    auto const checkOne = [&](SqlQueryFormatter const& formatter, std::string_view name, std::string_view query) {
        INFO("Testing " << name);
        auto queryBuilder = SqlQueryBuilder(formatter);
        auto const compiled = sqlQueryBuilder(queryBuilder).Compile();
        auto const actual = NormalizeText(compiled.sql);
        auto const expected = NormalizeText(query);
        REQUIRE(actual == expected);
        REQUIRE(compiled.PlaceholderCount() == compiled.parameters.size());
        if (postCheck)
            postCheck(compiled);
    };

    checkOne(SqlQueryFormatter::Sqlite(), "SQLite", expectations.sqlite);
    checkOne(SqlQueryFormatter::PostgreSQL(), "PostgreSQL", expectations.postgres);
    checkOne(SqlQueryFormatter::MySQL(), "MySQL", expectations.mysql);
    checkOne(SqlQueryFormatter::SqlServer(), "SQL Server", expectations.sqlServer);
    checkOne(SqlQueryFormatter::OracleSQL(), "Oracle", expectations.oracle);
}

/// Invokes the callable and returns the error of the given type it raised, if any.
template <typename Error, typename Callable>
std::optional<Error> CatchError(Callable&& callable)
{
    try
    {
        (void) std::forward<Callable>(callable)();
    }
    catch (Error const& error)
    {
        return error;
    }
    return std::nullopt;
}

// }}}

// {{{ execution helpers

/// Execution collaborator recording every query it is handed, answering with a canned result set.
class RecordingExecutor final: public SqlExecutor
{
  public:
    explicit RecordingExecutor(SqlExecutionConvention convention,
                               SqlQueryFormatter const& formatter = SqlQueryFormatter::PostgreSQL()) noexcept:
        m_convention { convention },
        m_formatter { &formatter }
    {
    }

    [[nodiscard]] SqlExecutionConvention Convention() const noexcept override
    {
        return m_convention;
    }

    [[nodiscard]] SqlQueryFormatter const& QueryFormatter() const noexcept override
    {
        return *m_formatter;
    }

    SqlResultSet Execute(SqlCompiledQuery const& query) override
    {
        if (m_convention != SqlExecutionConvention::Blocking)
            return SqlExecutor::Execute(query);

        m_executed.emplace_back(query);
        return m_result;
    }

    boost::asio::awaitable<SqlResultSet> ExecuteAsync(SqlCompiledQuery query) override
    {
        if (m_convention != SqlExecutionConvention::NonBlocking)
            co_return co_await SqlExecutor::ExecuteAsync(std::move(query));

        m_executed.emplace_back(std::move(query));
        co_return m_result;
    }

    void SetResult(SqlResultSet result)
    {
        m_result = std::move(result);
    }

    [[nodiscard]] std::vector<SqlCompiledQuery> const& Executed() const noexcept
    {
        return m_executed;
    }

  private:
    SqlExecutionConvention m_convention;
    SqlQueryFormatter const* m_formatter;
    SqlResultSet m_result;
    std::vector<SqlCompiledQuery> m_executed;
};

/// Drives the given awaitable to completion on a private io_context and returns its result.
template <typename T>
T RunAwaitable(boost::asio::awaitable<T> awaitable)
{
    auto context = boost::asio::io_context {};
    auto future = boost::asio::co_spawn(context, std::move(awaitable), boost::asio::use_future);
    context.run();
    return future.get();
}

// }}}

// {{{ ostream support for Quarry, for debugging purposes

inline std::ostream& operator<<(std::ostream& os, SqlVariant const& value)
{
    return os << std::format("SqlVariant {{ {}: {} }}", value.Type(), value);
}

inline std::ostream& operator<<(std::ostream& os, SqlValueType type)
{
    return os << std::format("{}", type);
}

inline std::ostream& operator<<(std::ostream& os, SqlRowMap const& row)
{
    return os << std::format("{}", row);
}

inline std::ostream& operator<<(std::ostream& os, SqlCompiledQuery const& query)
{
    return os << std::format("{}", query);
}

// }}}
