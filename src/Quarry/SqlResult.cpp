// SPDX-License-Identifier: Apache-2.0

#include "SqlResult.hpp"

#include <format>
#include <ranges>
#include <string_view>
#include <unordered_set>

std::vector<SqlRowMap> SqlResultMaterializer::ToRowMaps(SqlResultSet const& resultSet,
                                                        std::vector<std::string> const& keys) const
{
    std::vector<std::string> columnKeys = keys;
    if (columnKeys.empty())
    {
        for (auto const& column: resultSet.columns)
            columnKeys.emplace_back(column.columnName);
    }
    else if (!resultSet.columns.empty() && columnKeys.size() != resultSet.columns.size())
    {
        throw SqlConstructionError(std::format(
            "Result set has {} columns, but {} result keys were expected", resultSet.columns.size(), keys.size()));
    }

    if (m_policy == SqlColumnCollisionPolicy::Strict)
    {
        auto seen = std::unordered_set<std::string_view> {};
        for (auto const& key: columnKeys)
            if (!seen.insert(key).second)
                throw SqlAmbiguousColumnError(key);
    }

    std::vector<SqlRowMap> rows;
    rows.reserve(resultSet.rows.size());
    for (auto const& [rowIndex, values]: resultSet.rows | std::views::enumerate)
    {
        if (values.size() != columnKeys.size())
            throw SqlConstructionError(std::format(
                "Result row {} has {} values, but {} result keys were expected", rowIndex, values.size(), columnKeys.size()));

        auto& row = rows.emplace_back();
        for (auto const& [key, value]: std::views::zip(columnKeys, values))
            row.Set(key, value);
    }
    return rows;
}
