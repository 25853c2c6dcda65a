// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"
#include "SqlQueryFormatter.hpp"

#include <array>
#include <atomic>
#include <mutex>
#include <utility>

#include <sql.h>

using namespace std::string_view_literals;

namespace
{

std::mutex gDefaultsMutex;
SqlConnectionString gDefaultConnectionString {};
std::function<void(SqlConnection&)> gPostConnectedHook {};
std::atomic<uint64_t> gNextConnectionId { 1 };

std::function<void(SqlConnection&)> PostConnectedHook()
{
    auto const _ = std::lock_guard { gDefaultsMutex };
    return gPostConnectedHook;
}

} // end namespace

SqlConnection::SqlConnection():
    SqlConnection(std::optional { DefaultConnectionString() })
{
}

SqlConnection::SqlConnection(std::optional<SqlConnectionString> connectInfo):
    m_connectionId { gNextConnectionId++ }
{
    SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &m_hEnv);
    SQLSetEnvAttr(m_hEnv, SQL_ATTR_ODBC_VERSION, (SQLPOINTER) SQL_OV_ODBC3, 0);
    SQLAllocHandle(SQL_HANDLE_DBC, m_hEnv, &m_hDbc);

    if (connectInfo.has_value())
        Connect(std::move(*connectInfo));
}

SqlConnection::SqlConnection(SqlConnection&& other) noexcept:
    m_hEnv { other.m_hEnv },
    m_hDbc { other.m_hDbc },
    m_connectionId { other.m_connectionId },
    m_serverType { other.m_serverType },
    m_queryFormatter { other.m_queryFormatter },
    m_connectionString { std::move(other.m_connectionString) }
{
    other.m_hEnv = {};
    other.m_hDbc = {};
}

SqlConnection& SqlConnection::operator=(SqlConnection&& other) noexcept
{
    if (this == &other)
        return *this;

    Close();

    m_hEnv = other.m_hEnv;
    m_hDbc = other.m_hDbc;
    m_connectionId = other.m_connectionId;
    m_serverType = other.m_serverType;
    m_queryFormatter = other.m_queryFormatter;
    m_connectionString = std::move(other.m_connectionString);

    other.m_hEnv = {};
    other.m_hDbc = {};

    return *this;
}

SqlConnection::~SqlConnection() noexcept
{
    Close();
}

SqlConnectionString const& SqlConnection::DefaultConnectionString() noexcept
{
    auto const _ = std::lock_guard { gDefaultsMutex };
    return gDefaultConnectionString;
}

void SqlConnection::SetDefaultConnectionString(SqlConnectionString const& connectionString) noexcept
{
    auto const _ = std::lock_guard { gDefaultsMutex };
    gDefaultConnectionString = connectionString;
}

void SqlConnection::SetPostConnectedHook(std::function<void(SqlConnection&)> hook)
{
    auto const _ = std::lock_guard { gDefaultsMutex };
    gPostConnectedHook = std::move(hook);
}

bool SqlConnection::Connect(SqlConnectionString sqlConnectionString) noexcept
{
    if (m_hDbc)
        SQLDisconnect(m_hDbc);

    m_connectionString = std::move(sqlConnectionString);

    auto const& connectionString = m_connectionString.value;

    // Every statement of the query layer commits on its own.
    auto const connected = SQL_SUCCEEDED(SQLDriverConnectA(m_hDbc,
                                                           (SQLHWND) nullptr,
                                                           (SQLCHAR*) connectionString.data(),
                                                           (SQLSMALLINT) connectionString.size(),
                                                           nullptr,
                                                           0,
                                                           nullptr,
                                                           SQL_DRIVER_NOPROMPT))
                           && SQL_SUCCEEDED(SQLSetConnectAttrA(
                               m_hDbc, SQL_ATTR_AUTOCOMMIT, (SQLPOINTER) SQL_AUTOCOMMIT_ON, SQL_IS_UINTEGER));
    if (!connected)
    {
        SqlLogger::GetLogger().OnError(LastError());
        return false;
    }

    PostConnect();
    return true;
}

void SqlConnection::PostConnect()
{
    auto const mappings = std::array {
        std::pair { "Microsoft SQL Server"sv, SqlServerType::MICROSOFT_SQL },
        std::pair { "PostgreSQL"sv, SqlServerType::POSTGRESQL },
        std::pair { "Oracle"sv, SqlServerType::ORACLE },
        std::pair { "SQLite"sv, SqlServerType::SQLITE },
        std::pair { "MySQL"sv, SqlServerType::MYSQL },
    };

    m_serverType = SqlServerType::UNKNOWN;
    auto const serverName = ServerName();
    for (auto const& [name, type]: mappings)
    {
        if (serverName.contains(name))
        {
            m_serverType = type;
            break;
        }
    }

    m_queryFormatter = &SqlQueryFormatter::ForOdbc(m_serverType);

    SqlLogger::GetLogger().OnConnectionOpened(*this);

    if (auto const hook = PostConnectedHook(); hook)
        hook(*this);
}

SqlQueryFormatter const& SqlConnection::QueryFormatter() const noexcept
{
    if (m_queryFormatter)
        return *m_queryFormatter;
    return SqlQueryFormatter::ForOdbc(m_serverType);
}

SqlErrorInfo SqlConnection::LastError() const
{
    return SqlErrorInfo::fromConnectionHandle(m_hDbc);
}

void SqlConnection::Close() noexcept
{
    if (!m_hDbc)
        return;

    SqlLogger::GetLogger().OnConnectionClosed(*this);

    SQLDisconnect(m_hDbc);
    SQLFreeHandle(SQL_HANDLE_DBC, m_hDbc);
    SQLFreeHandle(SQL_HANDLE_ENV, m_hEnv);

    m_hDbc = {};
    m_hEnv = {};
}

std::string SqlConnection::ServerName() const
{
    std::string name(128, '\0');
    SQLSMALLINT nameLen {};
    RequireSuccess(SQLGetInfoA(m_hDbc, SQL_DBMS_NAME, (SQLPOINTER) name.data(), (SQLSMALLINT) name.size(), &nameLen));
    name.resize(nameLen);
    return name;
}

std::string SqlConnection::ServerVersion() const
{
    std::string text(128, '\0');
    SQLSMALLINT textLen {};
    RequireSuccess(SQLGetInfoA(m_hDbc, SQL_DBMS_VER, (SQLPOINTER) text.data(), (SQLSMALLINT) text.size(), &textLen));
    text.resize(textLen);
    return text;
}

bool SqlConnection::IsAlive() const noexcept
{
    SQLUINTEGER state {};
    SQLRETURN const sqlResult = SQLGetConnectAttrA(m_hDbc, SQL_ATTR_CONNECTION_DEAD, &state, 0, nullptr);
    return SQL_SUCCEEDED(sqlResult) && state == SQL_CD_FALSE;
}

void SqlConnection::RequireSuccess(SQLRETURN error, std::source_location sourceLocation) const
{
    if (SQL_SUCCEEDED(error))
        return;

    auto errorInfo = LastError();
    SqlLogger::GetLogger().OnError(errorInfo, sourceLocation);
    throw SqlException(std::move(errorInfo), sourceLocation);
}
