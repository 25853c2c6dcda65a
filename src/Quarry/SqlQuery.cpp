// SPDX-License-Identifier: Apache-2.0

#include "SqlQuery.hpp"

SqlInsertQueryBuilder SqlQueryBuilder::Insert(SqlTableSchema table) const
{
    return SqlInsertQueryBuilder { *m_formatter, m_executor, m_collisionPolicy, std::move(table) };
}

SqlUpdateQueryBuilder SqlQueryBuilder::Update(SqlTableSchema table) const
{
    return SqlUpdateQueryBuilder { *m_formatter, m_executor, m_collisionPolicy, std::move(table) };
}

SqlDeleteQueryBuilder SqlQueryBuilder::Delete(SqlTableSchema table) const
{
    return SqlDeleteQueryBuilder { *m_formatter, m_executor, m_collisionPolicy, std::move(table) };
}
