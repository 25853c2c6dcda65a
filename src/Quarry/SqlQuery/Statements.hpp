// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../SqlSchema.hpp"
#include "Condition.hpp"
#include "Core.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// @ingroup QueryBuilder
/// @{

/// @brief One item of a SELECT projection.
///
/// Constructible from a column name in the forms `"name"`, `"table.name"`, `"name AS alias"` and
/// `"table.name AS alias"` (the `AS` keyword is matched case-insensitively), from a SqlColumnRef and from a
/// SqlQualifiedTableColumnName.
struct QUARRY_API SqlProjectionItem
{
    std::optional<std::string> tableName;
    std::string columnName;
    std::optional<std::string> alias;

    // Whether the caller spelled out the table, which makes the result key "table.column".
    bool qualified = false;

    SqlProjectionItem(std::string_view text);
    SqlProjectionItem(char const* text):
        SqlProjectionItem(std::string_view { text })
    {
    }
    SqlProjectionItem(std::string const& text):
        SqlProjectionItem(std::string_view { text })
    {
    }
    SqlProjectionItem(SqlColumnRef const& column);
    SqlProjectionItem(SqlQualifiedTableColumnName const& column);

    /// Retrieves the key under which this item appears in a materialized result row.
    [[nodiscard]] std::string ResultKey() const;

    bool operator==(SqlProjectionItem const&) const = default;
};

/// A joined table together with its join predicate.
struct SqlJoinClause
{
    SqlJoinType type = SqlJoinType::INNER;
    SqlTableSchema table;
    SqlCondition on;
};

/// RETURNING clause of a data modifying statement. No columns means all columns.
struct SqlReturningClause
{
    std::vector<std::string> columns;
};

struct SqlSelectStatement
{
    std::optional<SqlTableSchema> table;
    bool distinct = false;
    std::vector<SqlProjectionItem> projection;
    std::vector<SqlJoinClause> joins;
    std::optional<SqlCondition> where;
    std::vector<SqlOrderByItem> orderBy;
    std::optional<std::size_t> limit;
    std::optional<std::size_t> offset;
};

struct SqlInsertStatement
{
    SqlTableSchema table;
    std::vector<SqlValueRow> rows;
    std::optional<SqlReturningClause> returning;
};

struct SqlUpdateStatement
{
    SqlTableSchema table;
    SqlValueRow assignments;
    std::optional<SqlCondition> where;
    std::optional<std::size_t> limit;
    std::optional<SqlReturningClause> returning;
};

struct SqlDeleteStatement
{
    SqlTableSchema table;
    std::optional<SqlCondition> where;
    std::optional<std::size_t> limit;
    std::optional<SqlReturningClause> returning;
};

/// @}
