// SPDX-License-Identifier: Apache-2.0

#include "Update.hpp"

SqlUpdateQueryBuilder& SqlUpdateQueryBuilder::Set(SqlValueRow assignments)
{
    for (auto& [name, value]: assignments)
        m_assignments.Set(name, value);
    return *this;
}

SqlUpdateQueryBuilder& SqlUpdateQueryBuilder::Set(std::string columnName, SqlVariant value)
{
    m_assignments.Set(std::move(columnName), std::move(value));
    return *this;
}

SqlUpdateQueryBuilder& SqlUpdateQueryBuilder::Limit(long long count)
{
    m_limit = detail::RequireRowCount(count, "Limit");
    return *this;
}

SqlUpdateStatement SqlUpdateQueryBuilder::Statement() const
{
    return SqlUpdateStatement {
        .table = m_table,
        .assignments = m_assignments,
        .where = m_where,
        .limit = m_limit,
        .returning = m_returning,
    };
}

SqlCompiledQuery SqlUpdateQueryBuilder::Compile() const
{
    return Compiler().Compile(Statement());
}

std::string SqlUpdateQueryBuilder::ToSql() const
{
    return Compile().sql;
}

std::optional<std::vector<SqlRowMap>> SqlUpdateQueryBuilder::Execute()
{
    RequireExecutable(SqlExecutionConvention::Blocking);
    return RunModification(MarkExecuted(Compile()), m_returning);
}

boost::asio::awaitable<std::optional<std::vector<SqlRowMap>>> SqlUpdateQueryBuilder::ExecuteAsync()
{
    RequireExecutable(SqlExecutionConvention::NonBlocking);
    auto const& query = MarkExecuted(Compile());
    return RunModificationAsync(Executor(), query, m_returning, Materializer());
}
