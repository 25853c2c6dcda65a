// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"
#include "SqlExecutor.hpp"
#include "SqlStatement.hpp"

#include <optional>
#include <ranges>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace
{

SqlResultSet FetchResultSet(SqlStatement& stmt)
{
    auto result = SqlResultSet {};

    auto const columnCount = stmt.NumColumnsAffected();
    if (columnCount == 0)
    {
        result.affectedRows = stmt.NumRowsAffected();
        return result;
    }

    result.columns.reserve(columnCount);
    for (auto const i: std::views::iota(SQLUSMALLINT { 1 }, static_cast<SQLUSMALLINT>(columnCount + 1)))
        result.columns.emplace_back(SqlResultColumn { .tableName = stmt.ColumnTableName(i),
                                                      .columnName = stmt.ColumnLabel(i) });

    while (stmt.FetchRow())
    {
        auto& row = result.rows.emplace_back();
        row.reserve(columnCount);
        for (auto const i: std::views::iota(SQLUSMALLINT { 1 }, static_cast<SQLUSMALLINT>(columnCount + 1)))
            row.emplace_back(stmt.GetColumn<SqlVariant>(i));
    }

    return result;
}

SqlResultSet ExecuteOnConnection(SqlConnection& connection, SqlCompiledQuery const& query)
{
    auto stmt = SqlStatement { connection };
    stmt.Prepare(query.sql);
    stmt.ExecuteWithVariants(query.parameters);
    return FetchResultSet(stmt);
}

SqlConnection OpenConnection(SqlConnectionString const& connectionString)
{
    auto connection = SqlConnection { std::nullopt };
    if (!connection.Connect(connectionString))
        throw SqlException(connection.LastError());
    return connection;
}

boost::asio::awaitable<SqlResultSet> RunOnWorker(SqlConnectionString connectionString, SqlCompiledQuery query)
{
    auto connection = OpenConnection(connectionString);
    co_return ExecuteOnConnection(connection, query);
}

} // end namespace

SqlResultSet SqlExecutor::Execute(SqlCompiledQuery const& /*query*/)
{
    throw SqlCallingConventionMismatchError("This collaborator does not support blocking execution");
}

boost::asio::awaitable<SqlResultSet> SqlExecutor::ExecuteAsync(SqlCompiledQuery /*query*/)
{
    throw SqlCallingConventionMismatchError("This collaborator does not support non-blocking execution");
}

SqlQueryFormatter const& SqlBlockingExecutor::QueryFormatter() const noexcept
{
    return m_connection.QueryFormatter();
}

SqlResultSet SqlBlockingExecutor::Execute(SqlCompiledQuery const& query)
{
    return ExecuteOnConnection(m_connection, query);
}

SqlAsyncExecutor::SqlAsyncExecutor(SqlConnectionString connectionString, std::size_t threads):
    m_connectionString { std::move(connectionString) },
    m_formatter { &OpenConnection(m_connectionString).QueryFormatter() },
    m_pool { threads }
{
}

SqlAsyncExecutor::SqlAsyncExecutor(SqlConnectionString connectionString,
                                   SqlQueryFormatter const& formatter,
                                   std::size_t threads):
    m_connectionString { std::move(connectionString) },
    m_formatter { &formatter },
    m_pool { threads }
{
}

SqlAsyncExecutor::~SqlAsyncExecutor()
{
    m_pool.join();
}

boost::asio::awaitable<SqlResultSet> SqlAsyncExecutor::ExecuteAsync(SqlCompiledQuery query)
{
    SqlLogger::GetLogger().OnDispatch(query.sql);
    co_return co_await boost::asio::co_spawn(
        m_pool, RunOnWorker(m_connectionString, std::move(query)), boost::asio::use_awaitable);
}
