// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlConnectInfo.hpp"
#include "SqlError.hpp"
#include "SqlLogger.hpp"
#include "SqlServerType.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <source_location>
#include <string>

#include <sql.h>
#include <sqlext.h>
#include <sqlspi.h>
#include <sqltypes.h>

class SqlQueryFormatter;

/// @brief Represents a connection to a SQL database.
///
/// A connection is owned by exactly one thread at a time. The non-blocking collaborator opens
/// a connection per execution on its worker thread and closes it before resuming the caller.
class QUARRY_API SqlConnection final
{
  public:
    /// @brief Constructs a new SQL connection to the default connection.
    ///
    /// The default connection is set via SetDefaultConnectionString.
    /// In case the connection fails, the last error will be set.
    SqlConnection();

    /// @brief Constructs a new SQL connection to the given connect informaton.
    ///
    /// @param connectInfo The connection information to use. If not provided,
    ///                    no connection will be established.
    explicit SqlConnection(std::optional<SqlConnectionString> connectInfo);

    SqlConnection(SqlConnection&& /*other*/) noexcept;
    SqlConnection& operator=(SqlConnection&& /*other*/) noexcept;
    SqlConnection(SqlConnection const& /*other*/) = delete;
    SqlConnection& operator=(SqlConnection const& /*other*/) = delete;

    ~SqlConnection() noexcept;

    /// Retrieves the default connection information.
    static SqlConnectionString const& DefaultConnectionString() noexcept;

    /// Sets the default connection information.
    static void SetDefaultConnectionString(SqlConnectionString const& connectionString) noexcept;

    /// Sets a callback to be called after each connection being established, on the connecting thread.
    static void SetPostConnectedHook(std::function<void(SqlConnection&)> hook);

    /// @brief Retrieves the connection ID.
    ///
    /// This is a unique identifier for the connection, which is useful for debugging purposes.
    /// Note, this ID will not change if the connection is moved.
    [[nodiscard]] uint64_t ConnectionId() const noexcept
    {
        return m_connectionId;
    }

    /// Closes the connection.
    void Close() noexcept;

    /// Connects via the given ODBC connection string.
    ///
    /// @retval true if the connection was successful.
    /// @retval false if the connection failed. Use LastError() to retrieve the error information.
    bool Connect(SqlConnectionString sqlConnectionString) noexcept;

    /// Retrieves the last error information with respect to this SQL connection handle.
    [[nodiscard]] SqlErrorInfo LastError() const;

    /// Retrieves the name of the server.
    [[nodiscard]] std::string ServerName() const;

    /// Retrieves the reported server version.
    [[nodiscard]] std::string ServerVersion() const;

    /// Retrieves the type of the server.
    [[nodiscard]] SqlServerType ServerType() const noexcept
    {
        return m_serverType;
    }

    /// @brief Retrieves a query formatter suitable for the SQL server being connected.
    ///
    /// The formatter renders ODBC parameter markers (`?`) regardless of the dialect's native style.
    [[nodiscard]] SqlQueryFormatter const& QueryFormatter() const noexcept;

    /// Tests if the connection is still active.
    [[nodiscard]] bool IsAlive() const noexcept;

    /// Retrieves the connection information.
    [[nodiscard]] SqlConnectionString const& ConnectionString() const noexcept
    {
        return m_connectionString;
    }

    /// Retrieves the native handle.
    [[nodiscard]] SQLHDBC NativeHandle() const noexcept
    {
        return m_hDbc;
    }

    /// Checks the result of an SQL operation, and throws an exception if it is not successful.
    void RequireSuccess(SQLRETURN sqlResult,
                        std::source_location sourceLocation = std::source_location::current()) const;

  private:
    void PostConnect();

    SQLHENV m_hEnv {};
    SQLHDBC m_hDbc {};
    uint64_t m_connectionId;
    SqlServerType m_serverType = SqlServerType::UNKNOWN;
    SqlQueryFormatter const* m_queryFormatter {};
    SqlConnectionString m_connectionString;
};
