// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlQuery/Core.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <vector>

/// Semantic type of a column as declared by the schema descriptor.
enum class SqlColumnType : uint8_t
{
    Text,
    Integer,
    Float,
    Boolean,
    Structured,
    ForeignKey,
};

/// Describes one column of a table.
struct SqlColumnSchema
{
    std::string name;
    SqlColumnType type = SqlColumnType::Text;
    bool nullable = false;
    bool primaryKey = false;

    bool operator==(SqlColumnSchema const&) const = default;
};

/// @brief Describes a table by its name and its ordered column list.
///
/// Table descriptors are supplied by the caller; the query builder never derives them from a database.
class QUARRY_API SqlTableSchema
{
  public:
    SqlTableSchema() = default;
    SqlTableSchema(std::string name, std::vector<SqlColumnSchema> columns);

    [[nodiscard]] std::string const& Name() const noexcept
    {
        return m_name;
    }

    [[nodiscard]] std::vector<SqlColumnSchema> const& Columns() const noexcept
    {
        return m_columns;
    }

    /// Retrieves the column descriptor of the given name, or nullptr if the table has no such column.
    [[nodiscard]] SqlColumnSchema const* FindColumn(std::string_view columnName) const noexcept;

    [[nodiscard]] bool HasColumn(std::string_view columnName) const noexcept
    {
        return FindColumn(columnName) != nullptr;
    }

    /// Retrieves a reference to the given column.
    ///
    /// @throws SqlInvalidColumnError if the table has no such column.
    [[nodiscard]] SqlColumnRef Column(std::string_view columnName) const;

    [[nodiscard]] SqlColumnRef operator[](std::string_view columnName) const
    {
        return Column(columnName);
    }

    /// Retrieves the column names in declaration order.
    [[nodiscard]] std::vector<std::string> ColumnNames() const;

    bool operator==(SqlTableSchema const&) const = default;

  private:
    std::string m_name;
    std::vector<SqlColumnSchema> m_columns;
};

template <>
struct std::formatter<SqlColumnType>: std::formatter<std::string_view>
{
    auto format(SqlColumnType type, format_context& ctx) const -> format_context::iterator
    {
        string_view name;
        switch (type)
        {
            case SqlColumnType::Text:
                name = "text";
                break;
            case SqlColumnType::Integer:
                name = "integer";
                break;
            case SqlColumnType::Float:
                name = "float";
                break;
            case SqlColumnType::Boolean:
                name = "boolean";
                break;
            case SqlColumnType::Structured:
                name = "structured";
                break;
            case SqlColumnType::ForeignKey:
                name = "foreign-key";
                break;
        }
        return std::formatter<string_view>::format(name, ctx);
    }
};
