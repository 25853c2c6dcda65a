// SPDX-License-Identifier: Apache-2.0

#include "../SqlError.hpp"
#include "Validator.hpp"

#include <algorithm>
#include <ranges>

std::vector<SqlValueType> SqlValueValidator::AcceptedTypes(SqlColumnSchema const& column)
{
    std::vector<SqlValueType> accepted;
    switch (column.type)
    {
        case SqlColumnType::Text:
            accepted = { SqlValueType::Text };
            break;
        case SqlColumnType::Integer:
        case SqlColumnType::ForeignKey:
            accepted = { SqlValueType::Integer };
            break;
        case SqlColumnType::Float:
            accepted = { SqlValueType::Float, SqlValueType::Integer };
            break;
        case SqlColumnType::Boolean:
            accepted = { SqlValueType::Boolean };
            break;
        case SqlColumnType::Structured:
            accepted = { SqlValueType::Structured };
            break;
    }
    if (column.nullable)
        accepted.emplace_back(SqlValueType::Null);
    return accepted;
}

bool SqlValueValidator::Accepts(SqlColumnSchema const& column, SqlVariant const& value) noexcept
{
    auto const actual = value.Type();
    if (actual == SqlValueType::Null)
        return column.nullable;

    switch (column.type)
    {
        case SqlColumnType::Text:
            return actual == SqlValueType::Text;
        case SqlColumnType::Integer:
        case SqlColumnType::ForeignKey:
            return actual == SqlValueType::Integer;
        case SqlColumnType::Float:
            return actual == SqlValueType::Float || actual == SqlValueType::Integer;
        case SqlColumnType::Boolean:
            return actual == SqlValueType::Boolean;
        case SqlColumnType::Structured:
            return actual == SqlValueType::Structured;
    }
    return false;
}

void SqlValueValidator::ValidateRows(SqlTableSchema const& table, std::vector<SqlValueRow> const& rows)
{
    for (auto const& [rowIndex, row]: rows | std::views::enumerate)
    {
        ValidateRow(table,
                    row,
                    rows.size() > 1 ? std::optional { static_cast<std::size_t>(rowIndex) } : std::nullopt);
    }
}

void SqlValueValidator::ValidateAssignments(SqlTableSchema const& table, SqlValueRow const& assignments)
{
    ValidateRow(table, assignments, std::nullopt);
}

void SqlValueValidator::ValidateRow(SqlTableSchema const& table,
                                    SqlValueRow const& row,
                                    std::optional<std::size_t> rowIndex)
{
    for (auto const& key: row.Keys())
        if (!table.HasColumn(key))
            throw SqlInvalidColumnError(table.Name(), key);

    for (auto const& column: table.Columns())
    {
        auto const* value = row.Find(column.name);
        if (!value || Accepts(column, *value))
            continue;

        throw SqlTypeMismatchError(column.name, AcceptedTypes(column), value->Type(), rowIndex);
    }
}
