// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "DataBinder/SqlVariant.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/// An ordered mapping of names to values.
///
/// Used both for insert and update payloads (column name to literal) and for materialized result rows.
/// Keys keep their insertion order; assigning an existing key replaces its value in place.
class QUARRY_API SqlRowMap
{
  public:
    using value_type = std::pair<std::string, SqlVariant>;
    using const_iterator = std::vector<value_type>::const_iterator;

    SqlRowMap() = default;
    SqlRowMap(SqlRowMap const&) = default;
    SqlRowMap(SqlRowMap&&) noexcept = default;
    SqlRowMap& operator=(SqlRowMap const&) = default;
    SqlRowMap& operator=(SqlRowMap&&) noexcept = default;
    ~SqlRowMap() = default;

    SqlRowMap(std::initializer_list<value_type> values);

    /// Assigns a value to the given key, replacing a previous value of the same key.
    ///
    /// @returns true if the key was already present.
    bool Set(std::string key, SqlVariant value);

    [[nodiscard]] bool Contains(std::string_view key) const noexcept;

    /// Retrieves the value of the given key, or nullptr if the key is absent.
    [[nodiscard]] SqlVariant const* Find(std::string_view key) const noexcept;

    /// Retrieves the value of the given key.
    ///
    /// @throws std::out_of_range if the key is absent.
    [[nodiscard]] SqlVariant const& At(std::string_view key) const;

    [[nodiscard]] SqlVariant const& operator[](std::string_view key) const
    {
        return At(key);
    }

    /// Retrieves the keys in insertion order.
    [[nodiscard]] std::vector<std::string_view> Keys() const;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_entries.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_entries.empty();
    }

    [[nodiscard]] const_iterator begin() const noexcept
    {
        return m_entries.begin();
    }

    [[nodiscard]] const_iterator end() const noexcept
    {
        return m_entries.end();
    }

    bool operator==(SqlRowMap const& other) const = default;

  private:
    std::vector<value_type> m_entries;
};

template <>
struct std::formatter<SqlRowMap>: std::formatter<std::string>
{
    auto format(SqlRowMap const& row, format_context& ctx) const -> format_context::iterator
    {
        std::string text = "{";
        for (auto const& [key, value]: row)
        {
            if (text.size() > 1)
                text += ", ";
            text += std::format("{}: {}", key, value);
        }
        text += '}';
        return std::formatter<std::string>::format(text, ctx);
    }
};
