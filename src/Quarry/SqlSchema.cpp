// SPDX-License-Identifier: Apache-2.0

#include "SqlError.hpp"
#include "SqlSchema.hpp"

#include <algorithm>
#include <format>
#include <ranges>

SqlTableSchema::SqlTableSchema(std::string name, std::vector<SqlColumnSchema> columns):
    m_name { std::move(name) },
    m_columns { std::move(columns) }
{
    for (auto const& [index, column]: m_columns | std::views::enumerate)
    {
        auto const duplicate =
            std::ranges::find(m_columns.begin(), m_columns.begin() + index, column.name, &SqlColumnSchema::name);
        if (duplicate != m_columns.begin() + index)
            throw SqlConstructionError(std::format(R"(Duplicate column "{}" in table "{}")", column.name, m_name));
    }
}

SqlColumnSchema const* SqlTableSchema::FindColumn(std::string_view columnName) const noexcept
{
    auto const column =
        std::ranges::find_if(m_columns, [columnName](SqlColumnSchema const& c) { return c.name == columnName; });
    return column != m_columns.end() ? &*column : nullptr;
}

SqlColumnRef SqlTableSchema::Column(std::string_view columnName) const
{
    if (!HasColumn(columnName))
        throw SqlInvalidColumnError(m_name, columnName);

    return SqlColumnRef { .tableName = m_name, .columnName = std::string(columnName), .alias = std::nullopt };
}

std::vector<std::string> SqlTableSchema::ColumnNames() const
{
    std::vector<std::string> names;
    names.reserve(m_columns.size());
    for (auto const& column: m_columns)
        names.emplace_back(column.name);
    return names;
}
