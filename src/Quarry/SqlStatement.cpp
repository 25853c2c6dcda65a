// SPDX-License-Identifier: Apache-2.0

#include "SqlStatement.hpp"

#include <algorithm>
#include <ranges>

namespace
{

std::string ResizedText(std::string text, SQLSMALLINT length)
{
    text.resize(std::clamp<size_t>(static_cast<size_t>(std::max<SQLSMALLINT>(length, 0)), 0, text.size()));
    return text;
}

} // namespace

SqlStatement::SqlStatement(SqlConnection& connection):
    m_connection { &connection }
{
    RequireSuccess(SQLAllocHandle(SQL_HANDLE_STMT, m_connection->NativeHandle(), &m_hStmt));
}

SqlStatement::~SqlStatement() noexcept
{
    if (!m_hStmt)
        return;

    SqlLogger::GetLogger().OnFetchEnd();
    SQLFreeHandle(SQL_HANDLE_STMT, m_hStmt);
}

void SqlStatement::PlanPostExecuteCallback(std::function<void()>&& cb)
{
    m_postExecuteCallbacks.emplace_back(std::move(cb));
}

SqlServerType SqlStatement::ServerType() const noexcept
{
    return m_connection->ServerType();
}

void SqlStatement::Prepare(std::string_view query)
{
    SqlLogger::GetLogger().OnPrepare(query);

    m_preparedQuery = std::string(query);
    m_postExecuteCallbacks.clear();

    RequireSuccess(SQLFreeStmt(m_hStmt, SQL_UNBIND));
    RequireSuccess(SQLPrepareA(m_hStmt, (SQLCHAR*) query.data(), (SQLINTEGER) query.size()));
    RequireSuccess(SQLNumParams(m_hStmt, &m_expectedParameterCount));
}

void SqlStatement::ExecuteDirect(std::string_view query, std::source_location location)
{
    if (query.empty())
        return;

    m_preparedQuery.clear();
    SqlLogger::GetLogger().OnExecuteDirect(query);

    RequireSuccess(SQLExecDirectA(m_hStmt, (SQLCHAR*) query.data(), (SQLINTEGER) query.size()), location);
}

void SqlStatement::ExecuteWithVariants(std::vector<SqlVariant> const& args)
{
    SqlLogger::GetLogger().OnExecute(m_preparedQuery);

    if (static_cast<size_t>(m_expectedParameterCount) != args.size())
        throw std::invalid_argument { std::format(
            "Statement expects {} parameters but {} were given", m_expectedParameterCount, args.size()) };

    for (auto const& [i, arg]: args | std::views::enumerate)
    {
        SqlLogger::GetLogger().OnBindInputParameter(std::format("${}", i + 1), arg);
        RequireSuccess(
            SqlDataBinder<SqlVariant>::InputParameter(m_hStmt, static_cast<SQLUSMALLINT>(1 + i), arg, *this));
    }

    auto const _ = detail::Finally([this] { m_postExecuteCallbacks.clear(); });
    RequireSuccess(SQLExecute(m_hStmt));
    for (auto& callback: m_postExecuteCallbacks)
        callback();
}

size_t SqlStatement::NumRowsAffected() const
{
    SQLLEN count {};
    RequireSuccess(SQLRowCount(m_hStmt, &count));
    return count < 0 ? 0 : static_cast<size_t>(count);
}

size_t SqlStatement::NumColumnsAffected() const
{
    SQLSMALLINT count {};
    RequireSuccess(SQLNumResultCols(m_hStmt, &count));
    return static_cast<size_t>(count);
}

std::string SqlStatement::ColumnLabel(SQLUSMALLINT column) const
{
    auto text = std::string(256, '\0');
    SQLSMALLINT length {};
    RequireSuccess(SQLColAttributeA(
        m_hStmt, column, SQL_DESC_LABEL, (SQLPOINTER) text.data(), (SQLSMALLINT) text.size(), &length, nullptr));
    return ResizedText(std::move(text), length);
}

std::string SqlStatement::ColumnTableName(SQLUSMALLINT column) const
{
    auto text = std::string(256, '\0');
    SQLSMALLINT length {};
    auto const sqlResult = SQLColAttributeA(m_hStmt,
                                            column,
                                            SQL_DESC_BASE_TABLE_NAME,
                                            (SQLPOINTER) text.data(),
                                            (SQLSMALLINT) text.size(),
                                            &length,
                                            nullptr);
    if (!SQL_SUCCEEDED(sqlResult))
        return {};
    return ResizedText(std::move(text), length);
}

bool SqlStatement::FetchRow()
{
    auto const sqlResult = SQLFetch(m_hStmt);
    if (sqlResult == SQL_NO_DATA)
    {
        SQLCloseCursor(m_hStmt);
        SqlLogger::GetLogger().OnFetchEnd();
        return false;
    }

    RequireSuccess(sqlResult);
    SqlLogger::GetLogger().OnFetchRow();
    return true;
}

void SqlStatement::RequireSuccess(SQLRETURN error, std::source_location sourceLocation) const
{
    if (SQL_SUCCEEDED(error))
        return;

    auto errorInfo = LastError();
    SqlLogger::GetLogger().OnError(errorInfo, sourceLocation);
    throw SqlException(std::move(errorInfo), sourceLocation);
}
