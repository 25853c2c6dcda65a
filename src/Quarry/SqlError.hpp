// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <sql.h>
#include <sqlext.h>
#include <sqlspi.h>
#include <sqltypes.h>

enum class SqlValueType : std::uint8_t;

/// Diagnostic record of a failed ODBC call.
struct SqlErrorInfo
{
    SQLINTEGER nativeErrorCode {};
    std::string sqlState = "     "; // 5 characters + null terminator
    std::string message;

    static SqlErrorInfo fromConnectionHandle(SQLHDBC hDbc)
    {
        return fromHandle(SQL_HANDLE_DBC, hDbc);
    }

    static SqlErrorInfo fromStatementHandle(SQLHSTMT hStmt)
    {
        return fromHandle(SQL_HANDLE_STMT, hStmt);
    }

    static SqlErrorInfo fromHandle(SQLSMALLINT handleType, SQLHANDLE handle)
    {
        SqlErrorInfo info {};
        info.message = std::string(1024, '\0');

        SQLSMALLINT msgLen {};
        SQLGetDiagRecA(handleType,
                       handle,
                       1,
                       (SQLCHAR*) info.sqlState.data(),
                       &info.nativeErrorCode,
                       (SQLCHAR*) info.message.data(),
                       (SQLSMALLINT) info.message.capacity(),
                       &msgLen);
        info.message.resize(msgLen);
        return info;
    }
};

/// Raised when the database driver reports a failure. Carries the driver's diagnostics unmodified.
class QUARRY_API SqlException: public std::runtime_error
{
  public:
    explicit SqlException(SqlErrorInfo info, std::source_location sourceLocation = std::source_location::current());

    [[nodiscard]] SqlErrorInfo const& info() const noexcept
    {
        return _info;
    }

  private:
    SqlErrorInfo _info;
};

enum class SqlError : std::int16_t
{
    SUCCESS = SQL_SUCCESS,
    SUCCESS_WITH_INFO = SQL_SUCCESS_WITH_INFO,
    NODATA = SQL_NO_DATA,
    FAILURE = SQL_ERROR,
    INVALID_HANDLE = SQL_INVALID_HANDLE,
    STILL_EXECUTING = SQL_STILL_EXECUTING,
    NEED_DATA = SQL_NEED_DATA,
    PARAM_DATA_AVAILABLE = SQL_PARAM_DATA_AVAILABLE,
    UNSUPPORTED_TYPE = 1'000,
    INVALID_ARGUMENT = 1'001,
};

struct SqlErrorCategory: std::error_category
{
    static SqlErrorCategory const& get() noexcept
    {
        static SqlErrorCategory const category;
        return category;
    }

    [[nodiscard]] const char* name() const noexcept override
    {
        return "Quarry.ODBC";
    }

    [[nodiscard]] std::string message(int code) const override
    {
        using namespace std::string_literals;
        switch (static_cast<SqlError>(code))
        {
            case SqlError::SUCCESS:
                return "SQL_SUCCESS"s;
            case SqlError::SUCCESS_WITH_INFO:
                return "SQL_SUCCESS_WITH_INFO"s;
            case SqlError::NODATA:
                return "SQL_NO_DATA"s;
            case SqlError::FAILURE:
                return "SQL_ERROR"s;
            case SqlError::INVALID_HANDLE:
                return "SQL_INVALID_HANDLE"s;
            case SqlError::STILL_EXECUTING:
                return "SQL_STILL_EXECUTING"s;
            case SqlError::NEED_DATA:
                return "SQL_NEED_DATA"s;
            case SqlError::PARAM_DATA_AVAILABLE:
                return "SQL_PARAM_DATA_AVAILABLE"s;
            case SqlError::UNSUPPORTED_TYPE:
                return "SQL_UNSUPPORTED_TYPE"s;
            case SqlError::INVALID_ARGUMENT:
                return "SQL_INVALID_ARGUMENT"s;
        }
        return std::format("SQL error code {}", code);
    }
};

template <>
struct std::is_error_code_enum<SqlError>: public std::true_type
{
};

inline std::error_code make_error_code(SqlError e)
{
    return { static_cast<int>(e), SqlErrorCategory::get() };
}

// {{{ query building and compilation errors

/// Classifies the errors raised while building, compiling, validating or dispatching a query.
enum class SqlQueryErrorCode : std::uint8_t
{
    CONSTRUCTION_ERROR = 1,
    INVALID_COLUMN,
    INCONSISTENT_COLUMNS,
    TYPE_MISMATCH,
    UNSUPPORTED_FEATURE,
    CALLING_CONVENTION_MISMATCH,
    AMBIGUOUS_COLUMN,
};

struct SqlQueryErrorCategory: std::error_category
{
    static SqlQueryErrorCategory const& get() noexcept
    {
        static SqlQueryErrorCategory const category;
        return category;
    }

    [[nodiscard]] const char* name() const noexcept override
    {
        return "Quarry.Query";
    }

    [[nodiscard]] std::string message(int code) const override
    {
        using namespace std::string_literals;
        switch (static_cast<SqlQueryErrorCode>(code))
        {
            case SqlQueryErrorCode::CONSTRUCTION_ERROR:
                return "ConstructionError"s;
            case SqlQueryErrorCode::INVALID_COLUMN:
                return "InvalidColumn"s;
            case SqlQueryErrorCode::INCONSISTENT_COLUMNS:
                return "InconsistentColumns"s;
            case SqlQueryErrorCode::TYPE_MISMATCH:
                return "TypeMismatch"s;
            case SqlQueryErrorCode::UNSUPPORTED_FEATURE:
                return "UnsupportedFeature"s;
            case SqlQueryErrorCode::CALLING_CONVENTION_MISMATCH:
                return "CallingConventionMismatch"s;
            case SqlQueryErrorCode::AMBIGUOUS_COLUMN:
                return "AmbiguousColumn"s;
        }
        return std::format("Query error code {}", code);
    }
};

template <>
struct std::is_error_code_enum<SqlQueryErrorCode>: public std::true_type
{
};

inline std::error_code make_error_code(SqlQueryErrorCode e)
{
    return { static_cast<int>(e), SqlQueryErrorCategory::get() };
}

/// Base class of all errors raised by the query builder, the compiler, the validator and the execution bridge.
///
/// Every instance is reported to the active SqlLogger upon construction.
class QUARRY_API SqlQueryError: public std::runtime_error
{
  public:
    SqlQueryError(SqlQueryErrorCode code,
                  std::string const& message,
                  std::source_location sourceLocation = std::source_location::current());

    [[nodiscard]] std::error_code code() const noexcept
    {
        return m_code;
    }

  private:
    std::error_code m_code;
};

/// Raised for an invalid builder call or an incomplete statement.
class QUARRY_API SqlConstructionError: public SqlQueryError
{
  public:
    explicit SqlConstructionError(std::string const& message,
                                  std::source_location sourceLocation = std::source_location::current()):
        SqlQueryError { SqlQueryErrorCode::CONSTRUCTION_ERROR, message, sourceLocation }
    {
    }

  protected:
    SqlConstructionError(SqlQueryErrorCode code, std::string const& message, std::source_location sourceLocation):
        SqlQueryError { code, message, sourceLocation }
    {
    }
};

/// Raised when a column is referenced that the table schema does not declare.
class QUARRY_API SqlInvalidColumnError: public SqlConstructionError
{
  public:
    SqlInvalidColumnError(std::string_view tableName,
                          std::string_view columnName,
                          std::source_location sourceLocation = std::source_location::current());

    [[nodiscard]] std::string const& TableName() const noexcept
    {
        return m_tableName;
    }

    [[nodiscard]] std::string const& ColumnName() const noexcept
    {
        return m_columnName;
    }

  private:
    std::string m_tableName;
    std::string m_columnName;
};

/// Raised when a row of a bulk insert does not reference the same column set as the first row.
class QUARRY_API SqlInconsistentColumnsError: public SqlQueryError
{
  public:
    explicit SqlInconsistentColumnsError(std::size_t rowIndex,
                                         std::source_location sourceLocation = std::source_location::current());

    [[nodiscard]] std::size_t RowIndex() const noexcept
    {
        return m_rowIndex;
    }

  private:
    std::size_t m_rowIndex;
};

/// Raised when a payload value does not match the semantic type (or nullability) of its column.
class QUARRY_API SqlTypeMismatchError: public SqlQueryError
{
  public:
    SqlTypeMismatchError(std::string column,
                         std::vector<SqlValueType> expected,
                         SqlValueType actual,
                         std::optional<std::size_t> rowIndex = std::nullopt,
                         std::source_location sourceLocation = std::source_location::current());

    [[nodiscard]] std::string const& Column() const noexcept
    {
        return m_column;
    }

    [[nodiscard]] std::vector<SqlValueType> const& Expected() const noexcept
    {
        return m_expected;
    }

    [[nodiscard]] SqlValueType Actual() const noexcept
    {
        return m_actual;
    }

    /// Index of the offending row, only set for inserts of more than one row.
    [[nodiscard]] std::optional<std::size_t> RowIndex() const noexcept
    {
        return m_rowIndex;
    }

  private:
    std::string m_column;
    std::vector<SqlValueType> m_expected;
    SqlValueType m_actual;
    std::optional<std::size_t> m_rowIndex;
};

/// Raised when the target dialect lacks a clause the statement requests.
class QUARRY_API SqlUnsupportedFeatureError: public SqlQueryError
{
  public:
    SqlUnsupportedFeatureError(std::string feature,
                               std::string dialect,
                               std::source_location sourceLocation = std::source_location::current());

    [[nodiscard]] std::string const& Feature() const noexcept
    {
        return m_feature;
    }

    [[nodiscard]] std::string const& Dialect() const noexcept
    {
        return m_dialect;
    }

  private:
    std::string m_feature;
    std::string m_dialect;
};

/// Raised when a blocking execution is requested from a non-blocking collaborator or vice versa.
class QUARRY_API SqlCallingConventionMismatchError: public SqlQueryError
{
  public:
    explicit SqlCallingConventionMismatchError(std::string const& message,
                                               std::source_location sourceLocation = std::source_location::current()):
        SqlQueryError { SqlQueryErrorCode::CALLING_CONVENTION_MISMATCH, message, sourceLocation }
    {
    }
};

/// Raised by the strict collision policy when two result columns map to the same key.
class QUARRY_API SqlAmbiguousColumnError: public SqlQueryError
{
  public:
    explicit SqlAmbiguousColumnError(std::string_view key,
                                     std::source_location sourceLocation = std::source_location::current());
};

// }}}

template <>
struct std::formatter<SqlError>: formatter<std::string>
{
    auto format(SqlError value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(SqlErrorCategory::get().message(static_cast<int>(value)), ctx);
    }
};

template <>
struct std::formatter<SqlQueryErrorCode>: formatter<std::string>
{
    auto format(SqlQueryErrorCode value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(SqlQueryErrorCategory::get().message(static_cast<int>(value)), ctx);
    }
};

template <>
struct std::formatter<SqlErrorInfo>: formatter<std::string>
{
    auto format(SqlErrorInfo const& info, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(
            std::format("{} ({}) - {}", info.sqlState, info.nativeErrorCode, info.message), ctx);
    }
};
