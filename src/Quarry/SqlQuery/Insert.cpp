// SPDX-License-Identifier: Apache-2.0

#include "Insert.hpp"

SqlInsertQueryBuilder& SqlInsertQueryBuilder::Values(SqlValueRow row)
{
    m_rows.emplace_back(std::move(row));
    return *this;
}

SqlInsertQueryBuilder& SqlInsertQueryBuilder::Values(std::vector<SqlValueRow> rows)
{
    m_rows.insert(m_rows.end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
    return *this;
}

SqlInsertStatement SqlInsertQueryBuilder::Statement() const
{
    return SqlInsertStatement { .table = m_table, .rows = m_rows, .returning = m_returning };
}

SqlCompiledQuery SqlInsertQueryBuilder::Compile() const
{
    return Compiler().Compile(Statement());
}

std::string SqlInsertQueryBuilder::ToSql() const
{
    return Compile().sql;
}

std::optional<std::vector<SqlRowMap>> SqlInsertQueryBuilder::Execute()
{
    RequireExecutable(SqlExecutionConvention::Blocking);
    return RunModification(MarkExecuted(Compile()), m_returning);
}

boost::asio::awaitable<std::optional<std::vector<SqlRowMap>>> SqlInsertQueryBuilder::ExecuteAsync()
{
    RequireExecutable(SqlExecutionConvention::NonBlocking);
    auto const& query = MarkExecuted(Compile());
    return RunModificationAsync(Executor(), query, m_returning, Materializer());
}
