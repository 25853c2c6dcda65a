// SPDX-License-Identifier: Apache-2.0

#include "../SqlError.hpp"
#include "../Utils.hpp"
#include "Statements.hpp"

#include <format>
#include <ranges>

namespace
{

std::vector<std::string_view> SplitWords(std::string_view text)
{
    std::vector<std::string_view> words;
    while (true)
    {
        text = detail::Trim(text);
        if (text.empty())
            break;
        auto const end = std::ranges::find_if(text, [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
        auto const length = static_cast<std::size_t>(end - text.begin());
        words.emplace_back(text.substr(0, length));
        text.remove_prefix(length);
    }
    return words;
}

} // end namespace

SqlProjectionItem::SqlProjectionItem(std::string_view text)
{
    auto const words = SplitWords(text);

    std::string_view columnText;
    if (words.size() == 1)
        columnText = words[0];
    else if (words.size() == 3 && detail::ToUpperCaseString(words[1]) == "AS")
    {
        columnText = words[0];
        alias = std::string(words[2]);
    }
    else
        throw SqlConstructionError(std::format("Invalid projection item: \"{}\"", text));

    if (auto const dot = columnText.rfind('.'); dot != std::string_view::npos)
    {
        tableName = std::string(columnText.substr(0, dot));
        columnText.remove_prefix(dot + 1);
        qualified = true;
    }

    if (columnText.empty() || (tableName && tableName->empty()))
        throw SqlConstructionError(std::format("Invalid projection item: \"{}\"", text));

    columnName = std::string(columnText);
}

SqlProjectionItem::SqlProjectionItem(SqlColumnRef const& column):
    tableName { column.tableName },
    columnName { column.columnName },
    alias { column.alias }
{
    if (tableName->empty())
        tableName.reset();
}

SqlProjectionItem::SqlProjectionItem(SqlQualifiedTableColumnName const& column):
    tableName { std::string(column.tableName) },
    columnName { std::string(column.columnName) },
    qualified { true }
{
}

std::string SqlProjectionItem::ResultKey() const
{
    if (alias)
        return *alias;
    if (qualified && tableName)
        return std::format("{}.{}", *tableName, columnName);
    return columnName;
}
