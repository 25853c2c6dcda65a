// SPDX-License-Identifier: Apache-2.0

#include "../SqlError.hpp"
#include "../SqlLogger.hpp"
#include "../Utils.hpp"
#include "Compiler.hpp"
#include "Validator.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <ranges>

namespace
{

using namespace SqlConditionNodes;

// Tables a statement refers to: the base table first, then joined tables in join order.
class TableScope
{
  public:
    explicit TableScope(SqlTableSchema const& table):
        m_tables { &table }
    {
    }

    void Add(SqlTableSchema const& table)
    {
        m_tables.push_back(&table);
    }

    [[nodiscard]] bool HasJoins() const noexcept
    {
        return m_tables.size() > 1;
    }

    // Resolves the table a column belongs to. A bare column resolves to the last table declaring it.
    [[nodiscard]] SqlTableSchema const& Resolve(std::string_view tableName, std::string_view columnName) const
    {
        if (!tableName.empty())
        {
            auto const i = std::ranges::find_if(m_tables, [&](auto const* t) { return t->Name() == tableName; });
            if (i == m_tables.end())
                throw SqlConstructionError(std::format("Table \"{}\" is not part of the statement", tableName));
            if (!(*i)->HasColumn(columnName))
                throw SqlInvalidColumnError(tableName, columnName);
            return **i;
        }

        for (auto const* table: m_tables | std::views::reverse)
            if (table->HasColumn(columnName))
                return *table;

        throw SqlInvalidColumnError(m_tables.front()->Name(), columnName);
    }

    [[nodiscard]] SqlTableSchema const& Resolve(SqlColumnRef const& column) const
    {
        return Resolve(column.tableName, column.columnName);
    }

  private:
    std::vector<SqlTableSchema const*> m_tables;
};

void ForEachColumn(SqlCondition const& condition, std::function<void(SqlColumnRef const&)> const& callback)
{
    // clang-format off
    std::visit(detail::overloaded {
        [&](Comparison const& node) {
            callback(node.left);
            if (auto const* column = node.right.Column())
                callback(*column);
        },
        [&](Pattern const& node) { callback(node.column); },
        [&](NullCheck const& node) { callback(node.column); },
        [&](Membership const& node) { callback(node.column); },
        [&](Range const& node) { callback(node.column); },
        [&](Conjunction const& node) {
            for (auto const& child: node.children)
                ForEachColumn(child, callback);
        },
        [&](Disjunction const& node) {
            for (auto const& child: node.children)
                ForEachColumn(child, callback);
        },
    }, condition.Node().value);
    // clang-format on
}

bool UsesCaseInsensitivePattern(SqlCondition const& condition)
{
    // clang-format off
    return std::visit(detail::overloaded {
        [](Pattern const& node) { return !node.caseSensitive; },
        [](Conjunction const& node) { return std::ranges::any_of(node.children, UsesCaseInsensitivePattern); },
        [](Disjunction const& node) { return std::ranges::any_of(node.children, UsesCaseInsensitivePattern); },
        [](auto const&) { return false; },
    }, condition.Node().value);
    // clang-format on
}

void RequireFeature(bool supported, std::string_view feature, SqlQueryFormatter const& formatter)
{
    if (!supported)
        throw SqlUnsupportedFeatureError(std::string(feature), std::string(formatter.Dialect().name));
}

void RequireCaseInsensitivePattern(std::optional<SqlCondition> const& condition, SqlQueryFormatter const& formatter)
{
    if (condition && UsesCaseInsensitivePattern(*condition))
        RequireFeature(formatter.Dialect().supportsILike, "ILIKE", formatter);
}

void RequireKnownColumns(SqlTableSchema const& table, auto const& columnNames)
{
    for (auto const& name: columnNames)
        if (!table.HasColumn(name))
            throw SqlInvalidColumnError(table.Name(), name);
}

void RequireKnownColumns(TableScope const& scope, std::optional<SqlCondition> const& condition)
{
    if (condition)
        ForEachColumn(*condition, [&](SqlColumnRef const& column) { (void) scope.Resolve(column); });
}

// Accumulates SQL text and parameters. Parameters are numbered in order of appearance.
class SqlRenderer
{
  public:
    SqlRenderer(SqlQueryFormatter const& formatter, TableScope const& scope):
        m_formatter { formatter },
        m_scope { scope }
    {
    }

    SqlRenderer& operator<<(std::string_view text)
    {
        m_query.sql += text;
        return *this;
    }

    void Identifier(std::string_view name)
    {
        m_query.sql += m_formatter.QuoteIdentifier(name);
    }

    void Column(std::string_view tableName, std::string_view columnName)
    {
        auto const& table = m_scope.Resolve(tableName, columnName);
        if (m_scope.HasJoins())
        {
            Identifier(table.Name());
            m_query.sql += '.';
        }
        Identifier(columnName);
    }

    void Column(SqlColumnRef const& column)
    {
        Column(column.tableName, column.columnName);
    }

    void Parameter(SqlVariant value)
    {
        m_query.parameters.emplace_back(std::move(value));
        m_query.sql += m_formatter.Placeholder(m_query.parameters.size());
    }

    void Condition(SqlCondition const& condition)
    {
        // clang-format off
        std::visit(detail::overloaded {
            [&](Comparison const& node) {
                Column(node.left);
                *this << " " << OperatorText(node.op) << " ";
                if (auto const* column = node.right.Column())
                    Column(*column);
                else
                    Parameter(*node.right.Literal());
            },
            [&](Pattern const& node) {
                Column(node.column);
                *this << (node.caseSensitive ? " LIKE " : " ILIKE ");
                Parameter(node.pattern);
            },
            [&](NullCheck const& node) {
                Column(node.column);
                *this << (node.isNull ? " IS NULL" : " IS NOT NULL");
            },
            [&](Membership const& node) {
                if (node.values.empty())
                {
                    *this << (node.negated ? "1 = 1" : "1 = 0");
                    return;
                }
                Column(node.column);
                *this << (node.negated ? " NOT IN (" : " IN (");
                for (auto const& [i, value]: node.values | std::views::enumerate)
                {
                    if (i != 0)
                        *this << ", ";
                    Parameter(value);
                }
                *this << ")";
            },
            [&](Range const& node) {
                Column(node.column);
                *this << " BETWEEN ";
                Parameter(node.low);
                *this << " AND ";
                Parameter(node.high);
            },
            [&](Conjunction const& node) { Junction(node.children, " AND "); },
            [&](Disjunction const& node) { Junction(node.children, " OR "); },
        }, condition.Node().value);
        // clang-format on
    }

    void Where(std::optional<SqlCondition> const& condition)
    {
        if (!condition)
            return;
        *this << " WHERE ";
        Condition(*condition);
    }

    void Returning(std::optional<SqlReturningClause> const& returning)
    {
        if (!returning)
            return;
        *this << " RETURNING ";
        if (returning->columns.empty())
        {
            *this << "*";
            return;
        }
        for (auto const& [i, column]: returning->columns | std::views::enumerate)
        {
            if (i != 0)
                *this << ", ";
            Identifier(column);
        }
    }

    [[nodiscard]] SqlCompiledQuery Finish() &&
    {
        SqlLogger::GetLogger().OnCompile(m_query.sql, m_query.parameters.size());
        return std::move(m_query);
    }

  private:
    void Junction(std::vector<SqlCondition> const& children, std::string_view separator)
    {
        for (auto const& [i, child]: children | std::views::enumerate)
        {
            if (i != 0)
                *this << separator;
            *this << "(";
            Condition(child);
            *this << ")";
        }
    }

    SqlQueryFormatter const& m_formatter;
    TableScope const& m_scope;
    SqlCompiledQuery m_query;
};

} // end namespace

SqlCompiledQuery SqlQueryCompiler::Compile(SqlSelectStatement const& statement) const
{
    if (!statement.table)
        throw SqlConstructionError("Select requires From()");

    auto scope = TableScope { *statement.table };
    for (auto const& join: statement.joins)
        scope.Add(join.table);

    for (auto const& item: statement.projection)
        (void) scope.Resolve(item.tableName.value_or(""), item.columnName);
    for (auto const& join: statement.joins)
        RequireKnownColumns(scope, join.on);
    RequireKnownColumns(scope, statement.where);
    for (auto const& item: statement.orderBy)
        (void) scope.Resolve(item.column);

    for (auto const& join: statement.joins)
    {
        if (join.type == SqlJoinType::FULL)
            RequireFeature(m_formatter->Dialect().supportsFullJoin, "FULL JOIN", *m_formatter);
        RequireCaseInsensitivePattern(join.on, *m_formatter);
    }
    RequireCaseInsensitivePattern(statement.where, *m_formatter);

    auto renderer = SqlRenderer { *m_formatter, scope };

    renderer << (statement.distinct ? "SELECT DISTINCT " : "SELECT ");
    if (statement.projection.empty())
    {
        // All columns of the base table only, even when joined.
        if (scope.HasJoins())
        {
            renderer.Identifier(statement.table->Name());
            renderer << ".";
        }
        renderer << "*";
    }
    for (auto const& [i, item]: statement.projection | std::views::enumerate)
    {
        if (i != 0)
            renderer << ", ";
        renderer.Column(item.tableName.value_or(""), item.columnName);
        if (item.alias)
        {
            renderer << " AS ";
            renderer.Identifier(*item.alias);
        }
    }

    renderer << " FROM ";
    renderer.Identifier(statement.table->Name());

    for (auto const& join: statement.joins)
    {
        renderer << " " << JoinTypeKeyword(join.type) << " JOIN ";
        renderer.Identifier(join.table.Name());
        renderer << " ON ";
        renderer.Condition(join.on);
    }

    renderer.Where(statement.where);

    if (!statement.orderBy.empty())
    {
        renderer << " ORDER BY ";
        for (auto const& [i, item]: statement.orderBy | std::views::enumerate)
        {
            if (i != 0)
                renderer << ", ";
            renderer.Column(item.column);
            renderer << (item.ordering == SqlResultOrdering::ASCENDING ? " ASC" : " DESC");
        }
    }

    if (statement.limit || statement.offset)
        renderer << m_formatter->SelectLimitOffset(statement.limit, statement.offset, !statement.orderBy.empty());

    return std::move(renderer).Finish();
}

SqlCompiledQuery SqlQueryCompiler::Compile(SqlInsertStatement const& statement) const
{
    if (statement.table.Name().empty())
        throw SqlConstructionError("Insert requires a target table");
    if (statement.rows.empty())
        throw SqlConstructionError("Insert requires Values()");
    if (statement.rows.front().empty())
        throw SqlConstructionError("Insert requires at least one column value");

    auto const columns = statement.rows.front().Keys();
    for (auto const& [rowIndex, row]: statement.rows | std::views::enumerate | std::views::drop(1))
    {
        if (row.size() != columns.size()
            || !std::ranges::all_of(columns, [&](auto const& name) { return row.Contains(name); }))
            throw SqlInconsistentColumnsError(static_cast<std::size_t>(rowIndex));
    }

    RequireKnownColumns(statement.table, columns);
    if (statement.returning)
        RequireKnownColumns(statement.table, statement.returning->columns);

    SqlValueValidator::ValidateRows(statement.table, statement.rows);

    if (statement.returning)
        RequireFeature(m_formatter->Dialect().supportsReturning, "RETURNING", *m_formatter);

    auto const scope = TableScope { statement.table };
    auto renderer = SqlRenderer { *m_formatter, scope };

    renderer << "INSERT INTO ";
    renderer.Identifier(statement.table.Name());
    renderer << " (";
    for (auto const& [i, name]: columns | std::views::enumerate)
    {
        if (i != 0)
            renderer << ", ";
        renderer.Identifier(name);
    }
    renderer << ") VALUES ";
    for (auto const& [rowIndex, row]: statement.rows | std::views::enumerate)
    {
        renderer << (rowIndex != 0 ? ", (" : "(");
        for (auto const& [i, name]: columns | std::views::enumerate)
        {
            if (i != 0)
                renderer << ", ";
            renderer.Parameter(row.At(name));
        }
        renderer << ")";
    }

    renderer.Returning(statement.returning);

    return std::move(renderer).Finish();
}

SqlCompiledQuery SqlQueryCompiler::Compile(SqlUpdateStatement const& statement) const
{
    if (statement.table.Name().empty())
        throw SqlConstructionError("Update requires a target table");
    if (statement.assignments.empty())
        throw SqlConstructionError("Update requires Set()");

    auto const scope = TableScope { statement.table };

    RequireKnownColumns(statement.table, statement.assignments.Keys());
    RequireKnownColumns(scope, statement.where);
    if (statement.returning)
        RequireKnownColumns(statement.table, statement.returning->columns);

    SqlValueValidator::ValidateAssignments(statement.table, statement.assignments);

    if (statement.returning)
        RequireFeature(m_formatter->Dialect().supportsReturning, "RETURNING", *m_formatter);
    if (statement.limit)
        RequireFeature(m_formatter->Dialect().supportsUpdateLimit, "LIMIT", *m_formatter);
    RequireCaseInsensitivePattern(statement.where, *m_formatter);

    auto renderer = SqlRenderer { *m_formatter, scope };

    renderer << "UPDATE ";
    renderer.Identifier(statement.table.Name());
    renderer << " SET ";
    for (auto const& [i, assignment]: statement.assignments | std::views::enumerate)
    {
        auto const& [name, value] = assignment;
        if (i != 0)
            renderer << ", ";
        renderer.Identifier(name);
        renderer << " = ";
        renderer.Parameter(value);
    }

    renderer.Where(statement.where);

    if (statement.limit)
        renderer << m_formatter->StatementLimit(*statement.limit);

    renderer.Returning(statement.returning);

    return std::move(renderer).Finish();
}

SqlCompiledQuery SqlQueryCompiler::Compile(SqlDeleteStatement const& statement) const
{
    if (statement.table.Name().empty())
        throw SqlConstructionError("Delete requires a target table");

    auto const scope = TableScope { statement.table };

    RequireKnownColumns(scope, statement.where);
    if (statement.returning)
        RequireKnownColumns(statement.table, statement.returning->columns);

    if (statement.returning)
        RequireFeature(m_formatter->Dialect().supportsReturning, "RETURNING", *m_formatter);
    if (statement.limit)
        RequireFeature(m_formatter->Dialect().supportsDeleteLimit, "LIMIT", *m_formatter);
    RequireCaseInsensitivePattern(statement.where, *m_formatter);

    auto renderer = SqlRenderer { *m_formatter, scope };

    renderer << "DELETE FROM ";
    renderer.Identifier(statement.table.Name());

    renderer.Where(statement.where);

    if (statement.limit)
        renderer << m_formatter->StatementLimit(*statement.limit);

    renderer.Returning(statement.returning);

    return std::move(renderer).Finish();
}

std::vector<std::string> SqlQueryCompiler::ResultKeys(SqlSelectStatement const& statement)
{
    std::vector<std::string> keys;
    keys.reserve(statement.projection.size());
    for (auto const& item: statement.projection)
        keys.emplace_back(item.ResultKey());
    return keys;
}
