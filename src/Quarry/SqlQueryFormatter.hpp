// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlDialect.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

/// API to format the dialect-specific fragments of SQL queries.
///
/// A formatter carries the dialect profile it renders for, so the compiler never consults global state
/// to decide on quoting, parameter markers or row limiting syntax.
class [[nodiscard]] QUARRY_API SqlQueryFormatter
{
  public:
    SqlQueryFormatter() = default;
    SqlQueryFormatter(SqlQueryFormatter&&) = default;
    SqlQueryFormatter(SqlQueryFormatter const&) = default;
    SqlQueryFormatter& operator=(SqlQueryFormatter&&) = default;
    SqlQueryFormatter& operator=(SqlQueryFormatter const&) = default;
    virtual ~SqlQueryFormatter() = default;

    /// Retrieves the feature profile of the dialect this formatter renders for.
    [[nodiscard]] virtual SqlDialect const& Dialect() const noexcept = 0;

    /// Quotes a table or column name, escaping the closing quote character by doubling it.
    [[nodiscard]] std::string QuoteIdentifier(std::string_view identifier) const;

    /// Renders the parameter marker for the given 1-based parameter position.
    [[nodiscard]] std::string Placeholder(std::size_t position) const;

    /// Renders the row limiting clause of a SELECT statement, including its leading space.
    ///
    /// @param limit     maximum number of rows to return, if any.
    /// @param offset    number of rows to skip, if any.
    /// @param hasOrderBy whether the statement already carries an ORDER BY clause.
    [[nodiscard]] virtual std::string SelectLimitOffset(std::optional<std::size_t> limit,
                                                        std::optional<std::size_t> offset,
                                                        bool hasOrderBy) const = 0;

    /// Renders the row limiting clause of an UPDATE or DELETE statement, including its leading space.
    [[nodiscard]] virtual std::string StatementLimit(std::size_t limit) const;

    /// Retrieves the SQL query formatter for SQLite.
    static SqlQueryFormatter const& Sqlite();

    /// Retrieves the SQL query formatter for Microsoft SQL server.
    static SqlQueryFormatter const& SqlServer();

    /// Retrieves the SQL query formatter for PostgreSQL.
    static SqlQueryFormatter const& PostgreSQL();

    /// Retrieves the SQL query formatter for MySQL.
    static SqlQueryFormatter const& MySQL();

    /// Retrieves the SQL query formatter for Oracle database.
    static SqlQueryFormatter const& OracleSQL();

    /// Retrieves the SQL query formatter for the given SqlServerType.
    static SqlQueryFormatter const* Get(SqlServerType serverType) noexcept;

    /// Retrieves the SQL query formatter for statements executed through ODBC.
    ///
    /// ODBC parameter markers are always `?`, so dialects with numbered markers are rendered sequentially.
    /// Unknown servers are addressed with ANSI quoting, as SQLite does.
    static SqlQueryFormatter const& ForOdbc(SqlServerType serverType) noexcept;
};
