// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "SqlQuery/Delete.hpp"
#include "SqlQuery/Insert.hpp"
#include "SqlQuery/Select.hpp"
#include "SqlQuery/Update.hpp"

#include <concepts>

/// @brief API Entry point for building SQL queries.
///
/// A builder constructed from a formatter can only compile. A builder constructed from an execution
/// collaborator compiles for the collaborator's formatter and can execute the statements it builds.
///
/// @ingroup QueryBuilder
class [[nodiscard]] SqlQueryBuilder final
{
  public:
    explicit SqlQueryBuilder(SqlQueryFormatter const& formatter,
                             SqlColumnCollisionPolicy collisionPolicy = SqlColumnCollisionPolicy::LastWins) noexcept:
        m_formatter { &formatter },
        m_collisionPolicy { collisionPolicy }
    {
    }

    explicit SqlQueryBuilder(SqlExecutor& executor,
                             SqlColumnCollisionPolicy collisionPolicy = SqlColumnCollisionPolicy::LastWins) noexcept:
        m_formatter { &executor.QueryFormatter() },
        m_executor { &executor },
        m_collisionPolicy { collisionPolicy }
    {
    }

    /// Initiates SELECT query building with the given projection. No projection selects all columns.
    template <std::convertible_to<SqlProjectionItem>... Items>
    SqlSelectQueryBuilder Select(Items&&... items) const
    {
        auto builder = SqlSelectQueryBuilder { *m_formatter, m_executor, m_collisionPolicy };
        builder.Fields(std::forward<Items>(items)...);
        return builder;
    }

    /// Initiates SELECT DISTINCT query building with the given projection.
    template <std::convertible_to<SqlProjectionItem>... Items>
    SqlSelectQueryBuilder SelectDistinct(Items&&... items) const
    {
        auto builder = Select(std::forward<Items>(items)...);
        builder.Distinct();
        return builder;
    }

    /// Initiates INSERT query building.
    QUARRY_API SqlInsertQueryBuilder Insert(SqlTableSchema table) const;

    /// Initiates UPDATE query building.
    QUARRY_API SqlUpdateQueryBuilder Update(SqlTableSchema table) const;

    /// Initiates DELETE query building.
    QUARRY_API SqlDeleteQueryBuilder Delete(SqlTableSchema table) const;

  private:
    SqlQueryFormatter const* m_formatter;
    SqlExecutor* m_executor {};
    SqlColumnCollisionPolicy m_collisionPolicy;
};
