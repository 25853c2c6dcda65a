// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../SqlQueryFormatter.hpp"
#include "Core.hpp"
#include "Statements.hpp"

#include <string>
#include <vector>

/// @brief Turns statement descriptions into SQL text and ordered parameters for one dialect.
///
/// Compilation is a pure function of the statement and the formatter: it has no side effects besides
/// logging, and compiling the same statement twice yields equal results. All checks run before any text
/// is produced, so a failing compilation never leaves partial output behind.
///
/// Checks are applied in this order:
///  1. structural completeness (target table, values of an insert, assignments of an update)
///  2. column set consistency of bulk inserts
///  3. unknown columns
///  4. payload types
///  5. dialect capabilities
///
/// @ingroup QueryBuilder
class QUARRY_API SqlQueryCompiler
{
  public:
    explicit SqlQueryCompiler(SqlQueryFormatter const& formatter) noexcept:
        m_formatter { &formatter }
    {
    }

    [[nodiscard]] SqlQueryFormatter const& Formatter() const noexcept
    {
        return *m_formatter;
    }

    [[nodiscard]] SqlCompiledQuery Compile(SqlSelectStatement const& statement) const;
    [[nodiscard]] SqlCompiledQuery Compile(SqlInsertStatement const& statement) const;
    [[nodiscard]] SqlCompiledQuery Compile(SqlUpdateStatement const& statement) const;
    [[nodiscard]] SqlCompiledQuery Compile(SqlDeleteStatement const& statement) const;

    /// Retrieves the result row keys of a SELECT, one per projection item.
    ///
    /// An empty list means the projection is `*` and the keys are the column labels reported by the database.
    [[nodiscard]] static std::vector<std::string> ResultKeys(SqlSelectStatement const& statement);

  private:
    SqlQueryFormatter const* m_formatter;
};
