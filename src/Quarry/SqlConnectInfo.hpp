// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

/// Represents an ODBC connection string.
struct SqlConnectionString
{
    std::string value;

    QUARRY_API auto operator<=>(SqlConnectionString const&) const noexcept = default;

    /// Returns the connection string with any password masked out, suitable for logging.
    [[nodiscard]] QUARRY_API std::string Sanitized() const;

    QUARRY_API static std::string SanitizePwd(std::string_view input);
};

using SqlConnectionStringMap = std::map<std::string, std::string>;

/// Parses an ODBC connection string into a map.
///
/// Keys are upper-cased, values are trimmed and stripped from enclosing curly braces.
QUARRY_API SqlConnectionStringMap ParseConnectionString(SqlConnectionString const& connectionString);

/// Builds an ODBC connection string from a map.
QUARRY_API SqlConnectionString BuildConnectionString(SqlConnectionStringMap const& map);

/// Connection string used when neither QUARRY_CONNECTION_STRING nor ODBC_CONNECTION_STRING is set.
constexpr std::string_view SqlDefaultConnectionString = "DRIVER=SQLite3;Database=file::memory:";

enum class SqlColumnCollisionPolicy : uint8_t;

/// @brief Process-wide settings of the query layer, read from the environment.
///
/// - `QUARRY_CONNECTION_STRING` (falling back to `ODBC_CONNECTION_STRING`, then an in-memory SQLite database)
/// - `QUARRY_WORKER_THREADS` number of workers of the non-blocking collaborator (default 2)
/// - `QUARRY_TRACE_SQL` selects the trace logger when set to a non-empty value other than `0`
/// - `QUARRY_STRICT_COLUMNS` raises on ambiguous result columns instead of letting the last one win
struct SqlConfiguration
{
    SqlConnectionString connectionString { std::string(SqlDefaultConnectionString) };
    std::size_t workerThreads = 2;
    bool traceSql = false;
    bool strictColumns = false;

    /// Reads the configuration from the process environment.
    QUARRY_API static SqlConfiguration FromEnvironment();

    /// Makes this configuration effective: default connection string and active logger.
    QUARRY_API void Apply() const;

    /// Retrieves the collision policy implied by this configuration.
    [[nodiscard]] QUARRY_API SqlColumnCollisionPolicy CollisionPolicy() const noexcept;
};
