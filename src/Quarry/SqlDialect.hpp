// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "SqlServerType.hpp"

#include <cstdint>
#include <string_view>

/// Describes how parameter markers are written into the SQL text.
enum class SqlPlaceholderStyle : uint8_t
{
    /// Every marker is a plain `?`, bound in order of appearance.
    Sequential,

    /// Markers are numbered `$1`, `$2`, ... in order of appearance.
    Numbered,
};

/// Feature profile of one SQL backend.
///
/// The query compiler consults this table before rendering a clause, and rejects a clause the backend
/// does not support instead of dropping or rewriting it.
struct SqlDialect
{
    SqlServerType serverType = SqlServerType::UNKNOWN;
    std::string_view name;
    char quoteOpen = '"';
    char quoteClose = '"';
    SqlPlaceholderStyle placeholderStyle = SqlPlaceholderStyle::Sequential;
    bool supportsReturning = false;
    bool supportsILike = false;
    bool supportsFullJoin = false;
    bool supportsUpdateLimit = false;
    bool supportsDeleteLimit = false;

    /// Derives a copy of this dialect that writes parameter markers in the given style.
    [[nodiscard]] constexpr SqlDialect WithPlaceholderStyle(SqlPlaceholderStyle style) const noexcept
    {
        auto copy = *this;
        copy.placeholderStyle = style;
        return copy;
    }

    constexpr bool operator==(SqlDialect const&) const noexcept = default;
};

namespace SqlDialects
{

// clang-format off
constexpr SqlDialect PostgreSQL {
    .serverType = SqlServerType::POSTGRESQL,
    .name = "PostgreSQL",
    .quoteOpen = '"', .quoteClose = '"',
    .placeholderStyle = SqlPlaceholderStyle::Numbered,
    .supportsReturning = true,
    .supportsILike = true,
    .supportsFullJoin = true,
    .supportsUpdateLimit = false,
    .supportsDeleteLimit = false,
};

constexpr SqlDialect Sqlite {
    .serverType = SqlServerType::SQLITE,
    .name = "SQLite",
    .quoteOpen = '"', .quoteClose = '"',
    .placeholderStyle = SqlPlaceholderStyle::Sequential,
    .supportsReturning = true,
    .supportsILike = false,
    .supportsFullJoin = true,
    .supportsUpdateLimit = false,
    .supportsDeleteLimit = false,
};

constexpr SqlDialect MySQL {
    .serverType = SqlServerType::MYSQL,
    .name = "MySQL",
    .quoteOpen = '`', .quoteClose = '`',
    .placeholderStyle = SqlPlaceholderStyle::Sequential,
    .supportsReturning = false,
    .supportsILike = false,
    .supportsFullJoin = false,
    .supportsUpdateLimit = true,
    .supportsDeleteLimit = true,
};

constexpr SqlDialect SqlServer {
    .serverType = SqlServerType::MICROSOFT_SQL,
    .name = "Microsoft SQL Server",
    .quoteOpen = '[', .quoteClose = ']',
    .placeholderStyle = SqlPlaceholderStyle::Sequential,
    .supportsReturning = false,
    .supportsILike = false,
    .supportsFullJoin = true,
    .supportsUpdateLimit = false,
    .supportsDeleteLimit = false,
};

constexpr SqlDialect Oracle {
    .serverType = SqlServerType::ORACLE,
    .name = "Oracle",
    .quoteOpen = '"', .quoteClose = '"',
    .placeholderStyle = SqlPlaceholderStyle::Sequential,
    .supportsReturning = false,
    .supportsILike = false,
    .supportsFullJoin = true,
    .supportsUpdateLimit = false,
    .supportsDeleteLimit = false,
};
// clang-format on

} // namespace SqlDialects
