// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Builder.hpp"

#include <optional>
#include <string>
#include <vector>

/// @ingroup QueryBuilder
/// @{

/// @brief Query builder for building INSERT INTO ... queries.
///
/// All rows of a bulk insert must name the same columns, in any order. The column order of the
/// statement is taken from the first row.
///
/// @see SqlQueryBuilder
class [[nodiscard]] SqlInsertQueryBuilder final: public detail::SqlStatementBuilder,
                                                 public detail::SqlReturningClauseBuilder<SqlInsertQueryBuilder>
{
  public:
    SqlInsertQueryBuilder(SqlQueryFormatter const& formatter,
                          SqlExecutor* executor,
                          SqlColumnCollisionPolicy collisionPolicy,
                          SqlTableSchema table) noexcept:
        detail::SqlStatementBuilder { formatter, executor, collisionPolicy },
        m_table { std::move(table) }
    {
    }

    /// Appends a single row to insert.
    QUARRY_API SqlInsertQueryBuilder& Values(SqlValueRow row);

    /// Appends the given rows to insert.
    QUARRY_API SqlInsertQueryBuilder& Values(std::vector<SqlValueRow> rows);

    [[nodiscard]] QUARRY_API SqlInsertStatement Statement() const;

    [[nodiscard]] QUARRY_API SqlCompiledQuery Compile() const;

    [[nodiscard]] QUARRY_API std::string ToSql() const;

    /// Executes the statement on a blocking collaborator.
    ///
    /// @returns the inserted rows if a RETURNING clause was requested, nothing otherwise.
    QUARRY_API std::optional<std::vector<SqlRowMap>> Execute();

    /// Executes the statement on a non-blocking collaborator.
    QUARRY_API boost::asio::awaitable<std::optional<std::vector<SqlRowMap>>> ExecuteAsync();

  private:
    SqlTableSchema m_table;
    std::vector<SqlValueRow> m_rows;
};

/// @}
