// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "../Api.hpp"
#include "../SqlServerType.hpp"

#include <concepts>
#include <cstdint>
#include <format>
#include <functional>
#include <string>
#include <string_view>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

/// The closed set of semantic value types a literal can carry.
enum class SqlValueType : std::uint8_t
{
    Null,
    Boolean,
    Integer,
    Float,
    Text,
    Structured,
};

template <>
struct std::formatter<SqlValueType>: std::formatter<std::string_view>
{
    auto format(SqlValueType type, format_context& ctx) const -> format_context::iterator
    {
        string_view name;
        switch (type)
        {
            case SqlValueType::Null:
                name = "null";
                break;
            case SqlValueType::Boolean:
                name = "boolean";
                break;
            case SqlValueType::Integer:
                name = "integer";
                break;
            case SqlValueType::Float:
                name = "float";
                break;
            case SqlValueType::Text:
                name = "text";
                break;
            case SqlValueType::Structured:
                name = "structured";
                break;
        }
        return std::formatter<string_view>::format(name, ctx);
    }
};

// Callback interface for SqlDataBinder to allow planning work after the statement has been executed.
//
// Input parameters are bound by pointer, so any temporary buffer created while binding must be kept alive
// until the statement has been executed.
class QUARRY_API SqlDataBinderCallback
{
  public:
    SqlDataBinderCallback() = default;
    SqlDataBinderCallback(SqlDataBinderCallback&&) = default;
    SqlDataBinderCallback(SqlDataBinderCallback const&) = default;
    SqlDataBinderCallback& operator=(SqlDataBinderCallback&&) = default;
    SqlDataBinderCallback& operator=(SqlDataBinderCallback const&) = default;

    virtual ~SqlDataBinderCallback() = default;

    virtual void PlanPostExecuteCallback(std::function<void()>&&) = 0;
    [[nodiscard]] virtual SqlServerType ServerType() const noexcept = 0;
};

template <typename>
struct SqlDataBinder;

// Traits for string types that can be read from a result column.
// An std::string specialization is provided in StdString.hpp.
template <typename>
struct SqlBasicStringOperations;

template <typename T>
concept SqlInputParameterBinder =
    requires(SQLHSTMT hStmt, SQLUSMALLINT column, T const& value, SqlDataBinderCallback& cb) {
        { SqlDataBinder<T>::InputParameter(hStmt, column, value, cb) } -> std::same_as<SQLRETURN>;
    };

template <typename T>
concept SqlGetColumnNativeType =
    requires(SQLHSTMT hStmt, SQLUSMALLINT column, T* result, SQLLEN* indicator, SqlDataBinderCallback const& cb) {
        { SqlDataBinder<T>::GetColumn(hStmt, column, result, indicator, cb) } -> std::same_as<SQLRETURN>;
    };

template <typename T>
concept SqlDataBinderSupportsInspect = requires(T const& value) {
    { SqlDataBinder<std::remove_cvref_t<T>>::Inspect(value) } -> std::convertible_to<std::string>;
};

// clang-format off
template <typename StringType, typename CharType>
concept SqlBasicStringBinderConcept = requires(StringType* str) {
    { SqlBasicStringOperations<StringType>::Data(str) } -> std::same_as<CharType*>;
    { SqlBasicStringOperations<StringType>::Size(str) } -> std::same_as<SQLULEN>;
    { SqlBasicStringOperations<StringType>::Reserve(str, size_t {}) } -> std::same_as<void>;
    { SqlBasicStringOperations<StringType>::Resize(str, SQLLEN {}) } -> std::same_as<void>;
    { SqlBasicStringOperations<StringType>::Clear(str) } -> std::same_as<void>;
};
// clang-format on
