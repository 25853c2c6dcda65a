// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "DataBinder/SqlVariant.hpp"
#include "SqlConnectInfo.hpp"
#include "SqlQuery/Core.hpp"
#include "SqlQueryFormatter.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>

class SqlConnection;

/// How a collaborator expects to be driven.
enum class SqlExecutionConvention : uint8_t
{
    /// Execution runs on the caller's thread and returns the result directly.
    Blocking,

    /// Execution is awaited from a coroutine and completes on a worker thread.
    NonBlocking,
};

/// Label of one result column, as reported by the database.
struct SqlResultColumn
{
    std::string tableName;
    std::string columnName;

    bool operator==(SqlResultColumn const&) const = default;
};

/// Rows produced by executing a compiled query, in the order the database returned them.
struct SqlResultSet
{
    std::vector<SqlResultColumn> columns;
    std::vector<std::vector<SqlVariant>> rows;

    // Number of rows affected by a statement without a result set.
    std::size_t affectedRows = 0;
};

/// @brief Executes compiled queries against a database.
///
/// A collaborator supports exactly one calling convention. Invoking the other form raises
/// SqlCallingConventionMismatchError without touching the database.
class QUARRY_API SqlExecutor
{
  public:
    SqlExecutor() = default;
    SqlExecutor(SqlExecutor&&) = delete;
    SqlExecutor(SqlExecutor const&) = delete;
    SqlExecutor& operator=(SqlExecutor&&) = delete;
    SqlExecutor& operator=(SqlExecutor const&) = delete;
    virtual ~SqlExecutor() = default;

    [[nodiscard]] virtual SqlExecutionConvention Convention() const noexcept = 0;

    /// Retrieves the formatter queries for this collaborator have to be compiled with.
    [[nodiscard]] virtual SqlQueryFormatter const& QueryFormatter() const noexcept = 0;

    /// Executes the query on the caller's thread.
    virtual SqlResultSet Execute(SqlCompiledQuery const& query);

    /// Executes the query asynchronously.
    virtual boost::asio::awaitable<SqlResultSet> ExecuteAsync(SqlCompiledQuery query);
};

/// Blocking collaborator running every query through the given ODBC connection on the caller's thread.
class QUARRY_API SqlBlockingExecutor final: public SqlExecutor
{
  public:
    explicit SqlBlockingExecutor(SqlConnection& connection) noexcept:
        m_connection { connection }
    {
    }

    [[nodiscard]] SqlExecutionConvention Convention() const noexcept override
    {
        return SqlExecutionConvention::Blocking;
    }

    [[nodiscard]] SqlQueryFormatter const& QueryFormatter() const noexcept override;

    SqlResultSet Execute(SqlCompiledQuery const& query) override;

  private:
    SqlConnection& m_connection;
};

/// @brief Non-blocking collaborator dispatching every query to a pool of worker threads.
///
/// Each execution opens its own connection on the worker, runs the query, fetches all rows and
/// closes the connection before the awaiting coroutine is resumed on its own executor.
/// No connection handle outlives a single execution.
class QUARRY_API SqlAsyncExecutor final: public SqlExecutor
{
  public:
    /// Constructs a collaborator, probing the server type once through a temporary connection.
    ///
    /// @throws SqlException if the probing connection cannot be established.
    SqlAsyncExecutor(SqlConnectionString connectionString, std::size_t threads);

    /// Constructs a collaborator compiling for the given formatter, without probing the server.
    SqlAsyncExecutor(SqlConnectionString connectionString, SqlQueryFormatter const& formatter, std::size_t threads);

    /// Waits for all running executions to finish.
    ~SqlAsyncExecutor() override;

    [[nodiscard]] SqlExecutionConvention Convention() const noexcept override
    {
        return SqlExecutionConvention::NonBlocking;
    }

    [[nodiscard]] SqlQueryFormatter const& QueryFormatter() const noexcept override
    {
        return *m_formatter;
    }

    boost::asio::awaitable<SqlResultSet> ExecuteAsync(SqlCompiledQuery query) override;

  private:
    SqlConnectionString m_connectionString;
    SqlQueryFormatter const* m_formatter;
    boost::asio::thread_pool m_pool;
};
