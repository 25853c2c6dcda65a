// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <reflection-cpp/reflection.hpp>

namespace detail
{

template <typename T>
constexpr auto AlwaysFalse = std::false_type::value;

template <class... Ts>
struct overloaded: Ts... // NOLINT(readability-identifier-naming)
{
    using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

constexpr auto Finally(auto&& cleanupRoutine) noexcept
{
    // NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
    struct Finally
    {
        std::remove_cvref_t<decltype(cleanupRoutine)> cleanup;
        ~Finally()
        {
            cleanup();
        }
    };
    return Finally { std::forward<decltype(cleanupRoutine)>(cleanupRoutine) };
}

template <template <typename...> class T, typename U>
struct is_specialization_of: std::false_type
{
};

template <template <typename...> class T, typename... Us>
struct is_specialization_of<T, T<Us...>>: std::true_type
{
};

/// Resolves the table name of a record type, either from its static TableName member or from its type name.
template <typename Record>
struct RecordTableName
{
    static constexpr std::string_view Value = []() {
        if constexpr (requires { Record::TableName; })
            return std::string_view { Record::TableName };
        else
            return Reflection::TypeName<Record>;
    }();
};

inline std::string_view Trim(std::string_view value) noexcept
{
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
        value.remove_prefix(1);

    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
        value.remove_suffix(1);

    return value;
}

inline std::string ToUpperCaseString(std::string_view input)
{
    std::string result { input };
    std::ranges::transform(result, result.begin(), [](char c) { return (char) std::toupper(c); });
    return result;
}

} // namespace detail

template <template <typename...> class S, class T>
concept IsSpecializationOf = detail::is_specialization_of<S, T>::value;
