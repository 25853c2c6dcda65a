// SPDX-License-Identifier: Apache-2.0

#include "SqlRowMap.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

SqlRowMap::SqlRowMap(std::initializer_list<value_type> values)
{
    m_entries.reserve(values.size());
    for (auto const& [key, value]: values)
        Set(key, value);
}

bool SqlRowMap::Set(std::string key, SqlVariant value)
{
    auto entry = std::ranges::find(m_entries, key, &value_type::first);
    if (entry != m_entries.end())
    {
        entry->second = std::move(value);
        return true;
    }

    m_entries.emplace_back(std::move(key), std::move(value));
    return false;
}

bool SqlRowMap::Contains(std::string_view key) const noexcept
{
    return Find(key) != nullptr;
}

SqlVariant const* SqlRowMap::Find(std::string_view key) const noexcept
{
    auto const entry = std::ranges::find_if(m_entries, [key](auto const& e) { return e.first == key; });
    return entry != m_entries.end() ? &entry->second : nullptr;
}

SqlVariant const& SqlRowMap::At(std::string_view key) const
{
    if (auto const* value = Find(key))
        return *value;

    throw std::out_of_range(std::format("No value for key \"{}\"", key));
}

std::vector<std::string_view> SqlRowMap::Keys() const
{
    std::vector<std::string_view> keys;
    keys.reserve(m_entries.size());
    for (auto const& [key, _]: m_entries)
        keys.emplace_back(key);
    return keys;
}
