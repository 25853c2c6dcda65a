// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../Utils.hpp"
#include "Core.hpp"
#include "Primitives.hpp"
#include "SqlNullValue.hpp"
#include "StdString.hpp"

#include <concepts>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <nlohmann/json.hpp>

/// A typed literal destined for parameter binding.
///
/// The set of alternatives is closed: every C++ value entering a query is converted into one of them
/// at the boundary, so validation and binding operate on a fixed set of types.
struct SqlVariant
{
    using InnerType = std::variant<SqlNullType, bool, long long, double, std::string, nlohmann::json>;

    InnerType value;

    SqlVariant() = default;
    SqlVariant(SqlVariant const&) = default;
    SqlVariant(SqlVariant&&) noexcept = default;
    SqlVariant& operator=(SqlVariant const&) = default;
    SqlVariant& operator=(SqlVariant&&) noexcept = default;
    ~SqlVariant() = default;

    QUARRY_FORCE_INLINE SqlVariant(InnerType const& other):
        value(other)
    {
    }

    QUARRY_FORCE_INLINE SqlVariant(InnerType&& other) noexcept:
        value(std::move(other))
    {
    }

    QUARRY_FORCE_INLINE SqlVariant(SqlNullType /*null*/) noexcept:
        value { std::in_place_type<SqlNullType> }
    {
    }

    QUARRY_FORCE_INLINE SqlVariant(std::nullopt_t /*null*/) noexcept:
        value { std::in_place_type<SqlNullType> }
    {
    }

    QUARRY_FORCE_INLINE SqlVariant(bool newValue) noexcept:
        value { std::in_place_type<bool>, newValue }
    {
    }

    template <std::integral T>
        requires(!std::same_as<T, bool> && !std::same_as<T, char>)
    QUARRY_FORCE_INLINE SqlVariant(T newValue) noexcept:
        value { std::in_place_type<long long>, static_cast<long long>(newValue) }
    {
    }

    template <std::floating_point T>
    QUARRY_FORCE_INLINE SqlVariant(T newValue) noexcept:
        value { std::in_place_type<double>, static_cast<double>(newValue) }
    {
    }

    QUARRY_FORCE_INLINE SqlVariant(std::string newValue) noexcept:
        value { std::in_place_type<std::string>, std::move(newValue) }
    {
    }

    QUARRY_FORCE_INLINE SqlVariant(std::string_view newValue):
        value { std::in_place_type<std::string>, newValue }
    {
    }

    QUARRY_FORCE_INLINE SqlVariant(char const* newValue):
        value { std::in_place_type<std::string>, newValue }
    {
    }

    QUARRY_FORCE_INLINE SqlVariant(nlohmann::json newValue) noexcept:
        value { std::in_place_type<nlohmann::json>, std::move(newValue) }
    {
    }

    template <typename T>
    QUARRY_FORCE_INLINE SqlVariant(std::optional<T> const& other):
        SqlVariant { other ? SqlVariant { *other } : SqlVariant { SqlNullValue } }
    {
    }

    // Check if the value is NULL.
    [[nodiscard]] QUARRY_FORCE_INLINE bool IsNull() const noexcept
    {
        return std::holds_alternative<SqlNullType>(value);
    }

    // Check if the value is of the specified type.
    template <typename T>
    [[nodiscard]] QUARRY_FORCE_INLINE bool Is() const noexcept
    {
        return std::holds_alternative<T>(value);
    }

    // Retrieve the value as the specified type.
    template <typename T>
    [[nodiscard]] QUARRY_FORCE_INLINE T const& Get() const
    {
        return std::get<T>(value);
    }

    /// Retrieves the semantic type of the held value.
    [[nodiscard]] QUARRY_API SqlValueType Type() const noexcept;

    // clang-format off
    [[nodiscard]] QUARRY_FORCE_INLINE std::optional<long long> TryGetLongLong() const { return TryGetIntegral<long long>(); }
    [[nodiscard]] QUARRY_FORCE_INLINE std::optional<int> TryGetInt() const { return TryGetIntegral<int>(); }
    // clang-format on

    [[nodiscard]] std::optional<bool> TryGetBool() const
    {
        if (IsNull())
            return std::nullopt;

        if (auto const* b = std::get_if<bool>(&value))
            return *b;

        throw std::bad_variant_access();
    }

    template <typename ResultType>
    [[nodiscard]] std::optional<ResultType> TryGetIntegral() const
    {
        if (IsNull())
            return std::nullopt;

        if (auto const* i = std::get_if<long long>(&value))
            return static_cast<ResultType>(*i);

        throw std::bad_variant_access();
    }

    // Integer values are widened to double.
    [[nodiscard]] std::optional<double> TryGetDouble() const
    {
        if (IsNull())
            return std::nullopt;

        // clang-format off
        return std::visit(detail::overloaded {
            [](double v) { return v; },
            [](long long v) { return static_cast<double>(v); },
            [](auto const&) -> double { throw std::bad_variant_access(); }
        }, value);
        // clang-format on
    }

    [[nodiscard]] std::optional<std::string_view> TryGetStringView() const
    {
        if (IsNull())
            return std::nullopt;

        if (auto const* s = std::get_if<std::string>(&value))
            return std::string_view { *s };

        throw std::bad_variant_access();
    }

    [[nodiscard]] std::optional<nlohmann::json> TryGetStructured() const
    {
        if (IsNull())
            return std::nullopt;

        if (auto const* j = std::get_if<nlohmann::json>(&value))
            return *j;

        throw std::bad_variant_access();
    }

    [[nodiscard]] QUARRY_API std::string ToString() const;

    bool operator==(SqlVariant const& other) const = default;
};

template <>
struct std::formatter<SqlVariant>: formatter<string>
{
    auto format(SqlVariant const& value, format_context& ctx) const -> format_context::iterator
    {
        return std::formatter<string>::format(value.ToString(), ctx);
    }
};

template <>
struct QUARRY_API SqlDataBinder<SqlVariant>
{
    static SQLRETURN InputParameter(SQLHSTMT stmt,
                                    SQLUSMALLINT column,
                                    SqlVariant const& variantValue,
                                    SqlDataBinderCallback& cb) noexcept;

    static SQLRETURN GetColumn(SQLHSTMT stmt,
                               SQLUSMALLINT column,
                               SqlVariant* result,
                               SQLLEN* indicator,
                               SqlDataBinderCallback const& cb) noexcept;

    static QUARRY_FORCE_INLINE std::string Inspect(SqlVariant const& value) noexcept
    {
        return value.ToString();
    }
};
