// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Builder.hpp"

#include <optional>
#include <string>
#include <vector>

/// @ingroup QueryBuilder
/// @{

/// @brief Query builder for building DELETE FROM ... queries.
///
/// @see SqlQueryBuilder
class [[nodiscard]] SqlDeleteQueryBuilder final: public detail::SqlStatementBuilder,
                                                 public detail::SqlWhereClauseBuilder<SqlDeleteQueryBuilder>,
                                                 public detail::SqlReturningClauseBuilder<SqlDeleteQueryBuilder>
{
  public:
    SqlDeleteQueryBuilder(SqlQueryFormatter const& formatter,
                          SqlExecutor* executor,
                          SqlColumnCollisionPolicy collisionPolicy,
                          SqlTableSchema table) noexcept:
        detail::SqlStatementBuilder { formatter, executor, collisionPolicy },
        m_table { std::move(table) }
    {
    }

    /// Limits the number of deleted rows, rejected by dialects without DELETE ... LIMIT support.
    QUARRY_API SqlDeleteQueryBuilder& Limit(long long count);

    [[nodiscard]] QUARRY_API SqlDeleteStatement Statement() const;

    [[nodiscard]] QUARRY_API SqlCompiledQuery Compile() const;

    [[nodiscard]] QUARRY_API std::string ToSql() const;

    /// Executes the statement on a blocking collaborator.
    ///
    /// @returns the deleted rows if a RETURNING clause was requested, nothing otherwise.
    QUARRY_API std::optional<std::vector<SqlRowMap>> Execute();

    /// Executes the statement on a non-blocking collaborator.
    QUARRY_API boost::asio::awaitable<std::optional<std::vector<SqlRowMap>>> ExecuteAsync();

  private:
    SqlTableSchema m_table;
    std::optional<std::size_t> m_limit;
};

/// @}
