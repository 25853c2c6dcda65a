// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../DataBinder/SqlVariant.hpp"
#include "../SqlRowMap.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// @defgroup QueryBuilder Query Builder
///
/// The query builder is a high level API for building SQL queries using high level C++ syntax.

/// @brief SqlQualifiedTableColumnName represents a column name qualified with a table name.
/// @ingroup QueryBuilder
struct SqlQualifiedTableColumnName
{
    std::string_view tableName;
    std::string_view columnName;
};

/// @brief Reference to a column of a table, optionally aliased.
///
/// Column references are immutable values; two references are equal if table, column and alias match.
///
/// @ingroup QueryBuilder
struct SqlColumnRef
{
    std::string tableName;
    std::string columnName;
    std::optional<std::string> alias;

    /// Returns a copy of this reference carrying the given alias.
    [[nodiscard]] SqlColumnRef As(std::string_view newAlias) const
    {
        return SqlColumnRef { .tableName = tableName, .columnName = columnName, .alias = std::string(newAlias) };
    }

    bool operator==(SqlColumnRef const&) const = default;
};

/// @ingroup QueryBuilder
enum class SqlResultOrdering : uint8_t
{
    ASCENDING,
    DESCENDING
};

/// One item of an ORDER BY clause.
///
/// @ingroup QueryBuilder
struct SqlOrderByItem
{
    SqlColumnRef column;
    SqlResultOrdering ordering = SqlResultOrdering::ASCENDING;

    bool operator==(SqlOrderByItem const&) const = default;
};

/// @ingroup QueryBuilder
enum class SqlJoinType : uint8_t
{
    INNER,
    LEFT,
    RIGHT,
    FULL
};

constexpr std::string_view JoinTypeKeyword(SqlJoinType joinType) noexcept
{
    switch (joinType)
    {
        case SqlJoinType::INNER:
            return "INNER";
        case SqlJoinType::LEFT:
            return "LEFT OUTER";
        case SqlJoinType::RIGHT:
            return "RIGHT OUTER";
        case SqlJoinType::FULL:
            return "FULL OUTER";
    }
    return "INNER";
}

/// Column to value assignments of an insert or update payload.
using SqlValueRow = SqlRowMap;

/// @brief The rendered SQL text of a statement together with its ordered parameters.
///
/// The Nth parameter marker in the text corresponds to the Nth entry in the parameter sequence.
///
/// @ingroup QueryBuilder
struct SqlCompiledQuery
{
    std::string sql;
    std::vector<SqlVariant> parameters;

    /// Counts the parameter markers in the SQL text, skipping quoted identifiers.
    [[nodiscard]] QUARRY_API std::size_t PlaceholderCount() const noexcept;

    bool operator==(SqlCompiledQuery const&) const = default;
};

template <>
struct std::formatter<SqlCompiledQuery>: std::formatter<std::string>
{
    auto format(SqlCompiledQuery const& query, format_context& ctx) const -> format_context::iterator
    {
        std::string params;
        for (auto const& parameter: query.parameters)
        {
            if (!params.empty())
                params += ", ";
            params += parameter.ToString();
        }
        return std::formatter<std::string>::format(std::format("{} [{}]", query.sql, params), ctx);
    }
};
