// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Core.hpp"

#include <cstdint>
#include <string>

template <typename T, SQLSMALLINT TheCType, SQLINTEGER TheSqlType, SqlValueType TheValueType>
struct SqlSimpleDataBinder
{
    static constexpr SqlValueType ValueType = TheValueType;

    static QUARRY_FORCE_INLINE SQLRETURN InputParameter(SQLHSTMT stmt,
                                                        SQLUSMALLINT column,
                                                        T const& value,
                                                        SqlDataBinderCallback& /*cb*/) noexcept
    {
        return SQLBindParameter(
            stmt, column, SQL_PARAM_INPUT, TheCType, TheSqlType, 0, 0, (SQLPOINTER) &value, 0, nullptr);
    }

    static QUARRY_FORCE_INLINE SQLRETURN GetColumn(
        SQLHSTMT stmt, SQLUSMALLINT column, T* result, SQLLEN* indicator, SqlDataBinderCallback const& /*cb*/) noexcept
    {
        return SQLGetData(stmt, column, TheCType, result, 0, indicator);
    }

    static QUARRY_FORCE_INLINE std::string Inspect(T value)
    {
        return std::to_string(value);
    }
};

// clang-format off
template <> struct SqlDataBinder<bool>: SqlSimpleDataBinder<bool, SQL_BIT, SQL_BIT, SqlValueType::Boolean> {};
template <> struct SqlDataBinder<int16_t>: SqlSimpleDataBinder<int16_t, SQL_C_SSHORT, SQL_SMALLINT, SqlValueType::Integer> {};
template <> struct SqlDataBinder<int32_t>: SqlSimpleDataBinder<int32_t, SQL_C_SLONG, SQL_INTEGER, SqlValueType::Integer> {};
template <> struct SqlDataBinder<int64_t>: SqlSimpleDataBinder<int64_t, SQL_C_SBIGINT, SQL_BIGINT, SqlValueType::Integer> {};
template <> struct SqlDataBinder<float>: SqlSimpleDataBinder<float, SQL_C_FLOAT, SQL_REAL, SqlValueType::Float> {};
template <> struct SqlDataBinder<double>: SqlSimpleDataBinder<double, SQL_C_DOUBLE, SQL_DOUBLE, SqlValueType::Float> {};
#if !defined(_WIN32) && !defined(__APPLE__)
template <> struct SqlDataBinder<long long>: SqlSimpleDataBinder<long long, SQL_C_SBIGINT, SQL_BIGINT, SqlValueType::Integer> {};
#endif
// clang-format on
