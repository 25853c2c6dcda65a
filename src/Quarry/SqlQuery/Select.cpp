// SPDX-License-Identifier: Apache-2.0

#include "../SqlError.hpp"
#include "Select.hpp"

SqlSelectQueryBuilder& SqlSelectQueryBuilder::Distinct() noexcept
{
    m_distinct = true;
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::Field(SqlProjectionItem item)
{
    m_projection.emplace_back(std::move(item));
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::From(SqlTableSchema table)
{
    m_table = std::move(table);
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::Join(SqlJoinType type, SqlTableSchema table, SqlCondition on)
{
    m_joins.emplace_back(SqlJoinClause { .type = type, .table = std::move(table), .on = std::move(on) });
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::InnerJoin(SqlTableSchema table, SqlCondition on)
{
    return Join(SqlJoinType::INNER, std::move(table), std::move(on));
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::LeftJoin(SqlTableSchema table, SqlCondition on)
{
    return Join(SqlJoinType::LEFT, std::move(table), std::move(on));
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::RightJoin(SqlTableSchema table, SqlCondition on)
{
    return Join(SqlJoinType::RIGHT, std::move(table), std::move(on));
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::FullJoin(SqlTableSchema table, SqlCondition on)
{
    return Join(SqlJoinType::FULL, std::move(table), std::move(on));
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::OrderBy(SqlOrderByItem item)
{
    m_orderBy.emplace_back(std::move(item));
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::OrderBy(SqlColumnRef column, SqlResultOrdering ordering)
{
    return OrderBy(SqlOrderByItem { .column = std::move(column), .ordering = ordering });
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::OrderBy(std::string_view columnName, SqlResultOrdering ordering)
{
    auto item = SqlProjectionItem { columnName };
    if (item.alias)
        throw SqlConstructionError(std::format("OrderBy() does not accept an alias: \"{}\"", columnName));

    return OrderBy(SqlColumnRef { .tableName = item.tableName.value_or(""), .columnName = std::move(item.columnName) },
                   ordering);
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::Limit(long long count)
{
    m_limit = detail::RequireRowCount(count, "Limit");
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::Offset(long long count)
{
    m_offset = detail::RequireRowCount(count, "Offset");
    return *this;
}

SqlSelectQueryBuilder& SqlSelectQueryBuilder::CollisionPolicy(SqlColumnCollisionPolicy policy) noexcept
{
    SetCollisionPolicy(policy);
    return *this;
}

SqlSelectStatement SqlSelectQueryBuilder::Statement() const
{
    return SqlSelectStatement {
        .table = m_table,
        .distinct = m_distinct,
        .projection = m_projection,
        .joins = m_joins,
        .where = m_where,
        .orderBy = m_orderBy,
        .limit = m_limit,
        .offset = m_offset,
    };
}

SqlCompiledQuery SqlSelectQueryBuilder::Compile() const
{
    return Compiler().Compile(Statement());
}

std::string SqlSelectQueryBuilder::ToSql() const
{
    return Compile().sql;
}

std::vector<SqlRowMap> SqlSelectQueryBuilder::Execute()
{
    RequireExecutable(SqlExecutionConvention::Blocking);
    auto const& query = MarkExecuted(Compile());
    return Materializer().ToRowMaps(Executor().Execute(query), SqlQueryCompiler::ResultKeys(Statement()));
}

boost::asio::awaitable<std::vector<SqlRowMap>> SqlSelectQueryBuilder::ExecuteAsync()
{
    RequireExecutable(SqlExecutionConvention::NonBlocking);
    auto const& query = MarkExecuted(Compile());
    return RunAsync(Executor(), query, SqlQueryCompiler::ResultKeys(Statement()), Materializer());
}
