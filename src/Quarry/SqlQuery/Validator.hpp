// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../SqlSchema.hpp"
#include "Core.hpp"

#include <cstddef>
#include <optional>
#include <vector>

/// @brief Checks insert and update payloads against the semantic column types of a table.
///
/// The validator is a pure function of the schema and the payload, it never consults a dialect.
///
/// @ingroup QueryBuilder
class QUARRY_API SqlValueValidator
{
  public:
    /// Retrieves the value types a column accepts, null last when the column is nullable.
    [[nodiscard]] static std::vector<SqlValueType> AcceptedTypes(SqlColumnSchema const& column);

    /// Tests whether the given value may be stored in the given column.
    [[nodiscard]] static bool Accepts(SqlColumnSchema const& column, SqlVariant const& value) noexcept;

    /// Validates every row of an insert.
    ///
    /// Rows are checked in order, columns within a row in their declaration order, so the first
    /// offending value in row-major order is reported.
    ///
    /// @throws SqlInvalidColumnError if a row names a column the table does not declare.
    /// @throws SqlTypeMismatchError for the first value of the wrong type. The row index is only
    ///         reported when more than one row is inserted.
    static void ValidateRows(SqlTableSchema const& table, std::vector<SqlValueRow> const& rows);

    /// Validates the assignments of an update.
    static void ValidateAssignments(SqlTableSchema const& table, SqlValueRow const& assignments);

  private:
    static void ValidateRow(SqlTableSchema const& table,
                            SqlValueRow const& row,
                            std::optional<std::size_t> rowIndex);
};
