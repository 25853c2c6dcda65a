// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlConnection.hpp"
#include "SqlDataBinder.hpp"
#include "Utils.hpp"

#include <concepts>
#include <format>
#include <functional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sql.h>
#include <sqlext.h>
#include <sqlspi.h>
#include <sqltypes.h>

/// @brief Prepared ODBC statement on a borrowed connection.
///
/// Lifecycle: Prepare(), ExecuteWithVariants(), then FetchRow() until it yields false.
/// Statements without a result set report their affected row count instead.
class SqlStatement final: public SqlDataBinderCallback
{
  public:
    QUARRY_API explicit SqlStatement(SqlConnection& connection);

    SqlStatement(SqlStatement&&) noexcept = delete;
    SqlStatement& operator=(SqlStatement&&) noexcept = delete;
    SqlStatement(SqlStatement const&) noexcept = delete;
    SqlStatement& operator=(SqlStatement const&) noexcept = delete;

    QUARRY_API ~SqlStatement() noexcept final;

    [[nodiscard]] SqlErrorInfo LastError() const
    {
        return SqlErrorInfo::fromStatementHandle(m_hStmt);
    }

    /// Prepares the given query, discarding any previously prepared one.
    QUARRY_API void Prepare(std::string_view query);

    /// Binds the given values to the positional markers of the prepared query and executes it.
    ///
    /// @throws std::invalid_argument if the number of values does not match the number of markers.
    QUARRY_API void ExecuteWithVariants(std::vector<SqlVariant> const& args);

    /// Executes the given query without preparing it and without parameters.
    QUARRY_API void ExecuteDirect(std::string_view query,
                                  std::source_location location = std::source_location::current());

    [[nodiscard]] QUARRY_API size_t NumRowsAffected() const;

    /// Number of columns of the current result set, zero for statements not yielding one.
    [[nodiscard]] QUARRY_API size_t NumColumnsAffected() const;

    /// Label of the given 1-based result column, as reported by the driver.
    [[nodiscard]] QUARRY_API std::string ColumnLabel(SQLUSMALLINT column) const;

    /// Base table of the given 1-based result column, empty if the driver does not know.
    [[nodiscard]] QUARRY_API std::string ColumnTableName(SQLUSMALLINT column) const;

    /// Advances to the next row. Closes the cursor and returns false at the end of the result set.
    [[nodiscard]] QUARRY_API bool FetchRow();

    template <SqlGetColumnNativeType T>
    [[nodiscard]] T GetColumn(SQLUSMALLINT column) const;

  private:
    QUARRY_API void RequireSuccess(SQLRETURN error,
                                   std::source_location sourceLocation = std::source_location::current()) const;
    QUARRY_API void PlanPostExecuteCallback(std::function<void()>&& cb) override;
    [[nodiscard]] QUARRY_API SqlServerType ServerType() const noexcept override;

    SqlConnection* m_connection;
    SQLHSTMT m_hStmt {};
    std::string m_preparedQuery;
    SQLSMALLINT m_expectedParameterCount {};
    std::vector<std::function<void()>> m_postExecuteCallbacks;
};

template <SqlGetColumnNativeType T>
inline T SqlStatement::GetColumn(SQLUSMALLINT column) const
{
    T result {};
    SQLLEN indicator {};
    RequireSuccess(SqlDataBinder<T>::GetColumn(m_hStmt, column, &result, &indicator, *this));
    if constexpr (!std::same_as<T, SqlVariant>)
        if (indicator == SQL_NULL_DATA)
            throw std::runtime_error { std::format("Column {} is NULL", column) };
    return result;
}
