// SPDX-License-Identifier: Apache-2.0

#include "../SqlLogger.hpp"
#include "SqlVariant.hpp"

#include <memory>

SQLRETURN SqlDataBinder<SqlVariant>::InputParameter(SQLHSTMT stmt,
                                                    SQLUSMALLINT column,
                                                    SqlVariant const& variantValue,
                                                    SqlDataBinderCallback& cb) noexcept
{
    // clang-format off
    return std::visit(detail::overloaded {
        [&](nlohmann::json const& document) {
            // Structured values travel as their serialized text, which must outlive the execution.
            auto text = std::make_shared<std::string>(document.dump());
            cb.PlanPostExecuteCallback([text]() {});
            return SqlDataBinder<std::string>::InputParameter(stmt, column, *text, cb);
        },
        [&]<typename T>(T const& value) {
            return SqlDataBinder<T>::InputParameter(stmt, column, value, cb);
        }
    }, variantValue.value);
    // clang-format on
}

SQLRETURN SqlDataBinder<SqlVariant>::GetColumn(
    SQLHSTMT stmt, SQLUSMALLINT column, SqlVariant* result, SQLLEN* indicator, SqlDataBinderCallback const& cb) noexcept
{
    SQLLEN columnType {};
    SQLRETURN returnCode =
        SQLColAttributeA(stmt, static_cast<SQLSMALLINT>(column), SQL_DESC_TYPE, nullptr, 0, nullptr, &columnType);
    if (!SQL_SUCCEEDED(returnCode))
        return returnCode;

    auto& variant = result->value;

    switch (columnType)
    {
        case SQL_BIT:
            returnCode = SqlDataBinder<bool>::GetColumn(stmt, column, &variant.emplace<bool>(), indicator, cb);
            break;
        case SQL_TINYINT:
        case SQL_SMALLINT:
        case SQL_INTEGER:
        case SQL_BIGINT:
            returnCode = SqlDataBinder<long long>::GetColumn(stmt, column, &variant.emplace<long long>(), indicator, cb);
            break;
        case SQL_REAL:
        case SQL_FLOAT:
        case SQL_DOUBLE:
        case SQL_DECIMAL:
        case SQL_NUMERIC:
            returnCode = SqlDataBinder<double>::GetColumn(stmt, column, &variant.emplace<double>(), indicator, cb);
            break;
        case SQL_CHAR:          // fixed-length string
        case SQL_VARCHAR:       // variable-length string
        case SQL_LONGVARCHAR:   // long string
        case SQL_WCHAR:         // fixed-length Unicode string, fetched as UTF-8
        case SQL_WVARCHAR:      // variable-length Unicode string, fetched as UTF-8
        case SQL_WLONGVARCHAR:  // long Unicode string, fetched as UTF-8
        case SQL_TYPE_DATE:
        case SQL_TYPE_TIME:
        case SQL_TYPE_TIMESTAMP:
        case SQL_GUID:
            returnCode =
                SqlDataBinder<std::string>::GetColumn(stmt, column, &variant.emplace<std::string>(), indicator, cb);
            break;
        case SQL_TYPE_NULL:
            variant = SqlNullValue;
            returnCode = SQL_SUCCESS;
            break;
        default:
            SqlLogger::GetLogger().OnError(SqlError::UNSUPPORTED_TYPE);
            returnCode = SQL_ERROR;
    }
    if (indicator && *indicator == SQL_NULL_DATA)
        variant = SqlNullValue;
    return returnCode;
}

SqlValueType SqlVariant::Type() const noexcept
{
    // clang-format off
    return std::visit(detail::overloaded {
        [](SqlNullType) { return SqlValueType::Null; },
        [](bool) { return SqlValueType::Boolean; },
        [](long long) { return SqlValueType::Integer; },
        [](double) { return SqlValueType::Float; },
        [](std::string const&) { return SqlValueType::Text; },
        [](nlohmann::json const&) { return SqlValueType::Structured; },
    }, value);
    // clang-format on
}

std::string SqlVariant::ToString() const
{
    using namespace std::string_literals;

    // clang-format off
    return std::visit(detail::overloaded {
        [&](SqlNullType) { return "NULL"s; },
        [&](bool v) { return v ? "true"s : "false"s; },
        [&](long long v) { return std::to_string(v); },
        [&](double v) { return std::format("{}", v); },
        [&](std::string const& v) { return v; },
        [&](nlohmann::json const& v) { return v.dump(); },
    }, value);
    // clang-format on
}
