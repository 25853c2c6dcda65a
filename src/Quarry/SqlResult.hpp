// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlError.hpp"
#include "SqlExecutor.hpp"
#include "SqlRowMap.hpp"
#include "Utils.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <nlohmann/json.hpp>
#include <reflection-cpp/reflection.hpp>

/// Decides what happens when two result columns map to the same key.
enum class SqlColumnCollisionPolicy : uint8_t
{
    /// The later column overwrites the earlier one, i.e. the last joined table wins.
    LastWins,

    /// A collision raises SqlAmbiguousColumnError.
    Strict,
};

namespace detail
{

template <typename T>
T FromSqlVariant(std::string_view memberName, SqlVariant const& value)
{
    auto const mismatch = [&](SqlValueType expected) {
        return SqlTypeMismatchError(std::string(memberName), { expected }, value.Type());
    };

    if constexpr (std::same_as<T, SqlVariant>)
        return value;
    else if constexpr (IsSpecializationOf<std::optional, T>)
    {
        if (value.IsNull())
            return std::nullopt;
        return T { FromSqlVariant<typename T::value_type>(memberName, value) };
    }
    else if constexpr (std::same_as<T, bool>)
    {
        // Some drivers report boolean columns as integers.
        if (value.Is<bool>())
            return value.Get<bool>();
        if (value.Is<long long>())
            return value.Get<long long>() != 0;
        throw mismatch(SqlValueType::Boolean);
    }
    else if constexpr (std::integral<T>)
    {
        if (value.Is<long long>())
            return static_cast<T>(value.Get<long long>());
        if (value.Is<bool>())
            return static_cast<T>(value.Get<bool>());
        throw mismatch(SqlValueType::Integer);
    }
    else if constexpr (std::floating_point<T>)
    {
        if (value.Is<double>())
            return static_cast<T>(value.Get<double>());
        if (value.Is<long long>())
            return static_cast<T>(value.Get<long long>());
        throw mismatch(SqlValueType::Float);
    }
    else if constexpr (std::same_as<T, std::string>)
    {
        if (value.Is<std::string>())
            return value.Get<std::string>();
        throw mismatch(SqlValueType::Text);
    }
    else if constexpr (std::same_as<T, nlohmann::json>)
    {
        // Structured values come back from the database as their serialized text.
        if (value.Is<nlohmann::json>())
            return value.Get<nlohmann::json>();
        if (value.Is<std::string>())
            return nlohmann::json::parse(value.Get<std::string>());
        throw mismatch(SqlValueType::Structured);
    }
    else
        static_assert(AlwaysFalse<T>, "Unsupported record member type");
}

} // namespace detail

/// @brief Turns raw result sets into keyed rows and rows into records.
///
/// @ingroup QueryBuilder
class QUARRY_API SqlResultMaterializer
{
  public:
    explicit SqlResultMaterializer(SqlColumnCollisionPolicy policy = SqlColumnCollisionPolicy::LastWins) noexcept:
        m_policy { policy }
    {
    }

    [[nodiscard]] SqlColumnCollisionPolicy Policy() const noexcept
    {
        return m_policy;
    }

    /// Converts every row of the result set into a SqlRowMap.
    ///
    /// @param resultSet the rows as returned by the collaborator.
    /// @param keys      one key per result column. If empty, the column labels of the result set are used.
    ///
    /// @throws SqlAmbiguousColumnError if two columns share a key and the policy is Strict.
    [[nodiscard]] std::vector<SqlRowMap> ToRowMaps(SqlResultSet const& resultSet,
                                                   std::vector<std::string> const& keys = {}) const;

    /// Populates a record from a row by reflected member names.
    ///
    /// Members without a matching key keep their default value, a null value leaves a std::optional member empty.
    template <typename Record>
    [[nodiscard]] static Record ToRecord(SqlRowMap const& row);

    template <typename Record>
    [[nodiscard]] static std::vector<Record> ToRecords(std::vector<SqlRowMap> const& rows);

    /// Populates records with a caller supplied hydrator instead of reflection.
    template <typename Record>
    [[nodiscard]] static std::vector<Record> ToRecords(std::vector<SqlRowMap> const& rows,
                                                       std::function<Record(SqlRowMap const&)> const& hydrator);

  private:
    SqlColumnCollisionPolicy m_policy;
};

template <typename Record>
Record SqlResultMaterializer::ToRecord(SqlRowMap const& row)
{
    auto record = Record {};
    Reflection::EnumerateMembers(record, [&]<size_t I, typename FieldType>(FieldType& field) {
        constexpr auto memberName = Reflection::MemberNameOf<I, Record>;
        if (auto const* value = row.Find(memberName); value)
        {
            if constexpr (!IsSpecializationOf<std::optional, FieldType> && !std::same_as<FieldType, SqlVariant>)
                if (value->IsNull())
                    return;
            field = detail::FromSqlVariant<FieldType>(memberName, *value);
        }
    });
    return record;
}

template <typename Record>
std::vector<Record> SqlResultMaterializer::ToRecords(std::vector<SqlRowMap> const& rows)
{
    std::vector<Record> records;
    records.reserve(rows.size());
    for (auto const& row: rows)
        records.emplace_back(ToRecord<Record>(row));
    return records;
}

template <typename Record>
std::vector<Record> SqlResultMaterializer::ToRecords(std::vector<SqlRowMap> const& rows,
                                                     std::function<Record(SqlRowMap const&)> const& hydrator)
{
    std::vector<Record> records;
    records.reserve(rows.size());
    for (auto const& row: rows)
        records.emplace_back(hydrator(row));
    return records;
}
