// SPDX-License-Identifier: Apache-2.0

#include "Delete.hpp"

SqlDeleteQueryBuilder& SqlDeleteQueryBuilder::Limit(long long count)
{
    m_limit = detail::RequireRowCount(count, "Limit");
    return *this;
}

SqlDeleteStatement SqlDeleteQueryBuilder::Statement() const
{
    return SqlDeleteStatement {
        .table = m_table,
        .where = m_where,
        .limit = m_limit,
        .returning = m_returning,
    };
}

SqlCompiledQuery SqlDeleteQueryBuilder::Compile() const
{
    return Compiler().Compile(Statement());
}

std::string SqlDeleteQueryBuilder::ToSql() const
{
    return Compile().sql;
}

std::optional<std::vector<SqlRowMap>> SqlDeleteQueryBuilder::Execute()
{
    RequireExecutable(SqlExecutionConvention::Blocking);
    return RunModification(MarkExecuted(Compile()), m_returning);
}

boost::asio::awaitable<std::optional<std::vector<SqlRowMap>>> SqlDeleteQueryBuilder::ExecuteAsync()
{
    RequireExecutable(SqlExecutionConvention::NonBlocking);
    auto const& query = MarkExecuted(Compile());
    return RunModificationAsync(Executor(), query, m_returning, Materializer());
}
