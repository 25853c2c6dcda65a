// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Builder.hpp"

#include <optional>
#include <string>
#include <vector>

/// @ingroup QueryBuilder
/// @{

/// @brief Query builder for building UPDATE ... queries.
///
/// @see SqlQueryBuilder
class [[nodiscard]] SqlUpdateQueryBuilder final: public detail::SqlStatementBuilder,
                                                 public detail::SqlWhereClauseBuilder<SqlUpdateQueryBuilder>,
                                                 public detail::SqlReturningClauseBuilder<SqlUpdateQueryBuilder>
{
  public:
    SqlUpdateQueryBuilder(SqlQueryFormatter const& formatter,
                          SqlExecutor* executor,
                          SqlColumnCollisionPolicy collisionPolicy,
                          SqlTableSchema table) noexcept:
        detail::SqlStatementBuilder { formatter, executor, collisionPolicy },
        m_table { std::move(table) }
    {
    }

    /// Adds the given assignments to the SET clause. A column assigned twice keeps the later value.
    QUARRY_API SqlUpdateQueryBuilder& Set(SqlValueRow assignments);

    /// Adds a single column to the SET clause.
    QUARRY_API SqlUpdateQueryBuilder& Set(std::string columnName, SqlVariant value);

    /// Limits the number of updated rows, rejected by dialects without UPDATE ... LIMIT support.
    QUARRY_API SqlUpdateQueryBuilder& Limit(long long count);

    [[nodiscard]] QUARRY_API SqlUpdateStatement Statement() const;

    [[nodiscard]] QUARRY_API SqlCompiledQuery Compile() const;

    [[nodiscard]] QUARRY_API std::string ToSql() const;

    /// Executes the statement on a blocking collaborator.
    ///
    /// @returns the updated rows if a RETURNING clause was requested, nothing otherwise.
    QUARRY_API std::optional<std::vector<SqlRowMap>> Execute();

    /// Executes the statement on a non-blocking collaborator.
    QUARRY_API boost::asio::awaitable<std::optional<std::vector<SqlRowMap>>> ExecuteAsync();

  private:
    SqlTableSchema m_table;
    SqlValueRow m_assignments;
    std::optional<std::size_t> m_limit;
};

/// @}
