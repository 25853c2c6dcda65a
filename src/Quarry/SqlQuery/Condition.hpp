// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../DataBinder/SqlVariant.hpp"
#include "Core.hpp"

#include <concepts>
#include <cstdint>
#include <memory>
#include <ranges>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/// @ingroup QueryBuilder
/// @{

struct SqlConditionNode;

/// @brief Immutable handle to a predicate tree.
///
/// Conditions are cheap to copy; copies share the same immutable node.
class QUARRY_API SqlCondition
{
  public:
    explicit SqlCondition(std::shared_ptr<SqlConditionNode const> node) noexcept:
        m_node { std::move(node) }
    {
    }

    [[nodiscard]] SqlConditionNode const& Node() const noexcept
    {
        return *m_node;
    }

    /// Retrieves the node as the given predicate kind, or nullptr if it is of another kind.
    template <typename T>
    [[nodiscard]] T const* As() const noexcept;

  private:
    std::shared_ptr<SqlConditionNode const> m_node;
};

/// Right hand side of a comparison: either another column (join conditions) or a literal.
struct SqlOperand
{
    std::variant<SqlColumnRef, SqlVariant> value;

    SqlOperand(SqlColumnRef column):
        value { std::in_place_type<SqlColumnRef>, std::move(column) }
    {
    }

    template <typename T>
        requires(!std::same_as<std::remove_cvref_t<T>, SqlColumnRef> && !std::same_as<std::remove_cvref_t<T>, SqlOperand>
                 && std::constructible_from<SqlVariant, T>)
    SqlOperand(T&& literal):
        value { std::in_place_type<SqlVariant>, SqlVariant(std::forward<T>(literal)) }
    {
    }

    [[nodiscard]] SqlColumnRef const* Column() const noexcept
    {
        return std::get_if<SqlColumnRef>(&value);
    }

    [[nodiscard]] SqlVariant const* Literal() const noexcept
    {
        return std::get_if<SqlVariant>(&value);
    }
};

namespace SqlConditionNodes
{

enum class ComparisonOperator : uint8_t
{
    Equal,
    NotEqual,
    Less,
    LessOrEqual,
    Greater,
    GreaterOrEqual,
};

constexpr std::string_view OperatorText(ComparisonOperator op) noexcept
{
    switch (op)
    {
        case ComparisonOperator::Equal:
            return "=";
        case ComparisonOperator::NotEqual:
            return "<>";
        case ComparisonOperator::Less:
            return "<";
        case ComparisonOperator::LessOrEqual:
            return "<=";
        case ComparisonOperator::Greater:
            return ">";
        case ComparisonOperator::GreaterOrEqual:
            return ">=";
    }
    return "=";
}

struct Comparison
{
    ComparisonOperator op;
    SqlColumnRef left;
    SqlOperand right;
};

struct Pattern
{
    SqlColumnRef column;
    SqlVariant pattern;
    bool caseSensitive = true;
};

struct NullCheck
{
    SqlColumnRef column;
    bool isNull = true;
};

// An empty value list is valid and matches no row (or every row, if negated).
struct Membership
{
    SqlColumnRef column;
    std::vector<SqlVariant> values;
    bool negated = false;
};

// The bounds are rendered as given, low <= high is not enforced.
struct Range
{
    SqlColumnRef column;
    SqlVariant low;
    SqlVariant high;
};

// Invariant: children is never empty.
struct Conjunction
{
    std::vector<SqlCondition> children;
};

// Invariant: children is never empty.
struct Disjunction
{
    std::vector<SqlCondition> children;
};

} // namespace SqlConditionNodes

struct SqlConditionNode
{
    std::variant<SqlConditionNodes::Comparison,
                 SqlConditionNodes::Pattern,
                 SqlConditionNodes::NullCheck,
                 SqlConditionNodes::Membership,
                 SqlConditionNodes::Range,
                 SqlConditionNodes::Conjunction,
                 SqlConditionNodes::Disjunction>
        value;
};

template <typename T>
T const* SqlCondition::As() const noexcept
{
    return std::get_if<T>(&m_node->value);
}

/// Construction functions for predicate trees.
///
/// None of these functions touches a database; they only build immutable nodes.
namespace SqlConditions
{

// Comparing against NULL builds an IS [NOT] NULL check, as "= NULL" never matches.
QUARRY_API SqlCondition Equal(SqlColumnRef column, SqlOperand value);
QUARRY_API SqlCondition NotEqual(SqlColumnRef column, SqlOperand value);
QUARRY_API SqlCondition Less(SqlColumnRef column, SqlOperand value);
QUARRY_API SqlCondition LessOrEqual(SqlColumnRef column, SqlOperand value);
QUARRY_API SqlCondition Greater(SqlColumnRef column, SqlOperand value);
QUARRY_API SqlCondition GreaterOrEqual(SqlColumnRef column, SqlOperand value);

QUARRY_API SqlCondition Like(SqlColumnRef column, std::string pattern);

/// Case-insensitive pattern match, only available on dialects supporting ILIKE.
QUARRY_API SqlCondition ILike(SqlColumnRef column, std::string pattern);

QUARRY_API SqlCondition IsNull(SqlColumnRef column);
QUARRY_API SqlCondition IsNotNull(SqlColumnRef column);

QUARRY_API SqlCondition In(SqlColumnRef column, std::vector<SqlVariant> values);
QUARRY_API SqlCondition NotIn(SqlColumnRef column, std::vector<SqlVariant> values);

template <std::ranges::input_range ValueRange>
    requires(!std::same_as<std::remove_cvref_t<ValueRange>, std::vector<SqlVariant>>)
SqlCondition In(SqlColumnRef column, ValueRange const& values)
{
    std::vector<SqlVariant> literals;
    for (auto const& value: values)
        literals.emplace_back(value);
    return In(std::move(column), std::move(literals));
}

template <std::ranges::input_range ValueRange>
    requires(!std::same_as<std::remove_cvref_t<ValueRange>, std::vector<SqlVariant>>)
SqlCondition NotIn(SqlColumnRef column, ValueRange const& values)
{
    std::vector<SqlVariant> literals;
    for (auto const& value: values)
        literals.emplace_back(value);
    return NotIn(std::move(column), std::move(literals));
}

QUARRY_API SqlCondition Between(SqlColumnRef column, SqlVariant low, SqlVariant high);

/// Combines the given conditions with AND.
///
/// A single condition is returned as is.
/// @throws SqlConstructionError if no condition is given.
QUARRY_API SqlCondition And(std::vector<SqlCondition> children);

/// Combines the given conditions with OR.
///
/// A single condition is returned as is.
/// @throws SqlConstructionError if no condition is given.
QUARRY_API SqlCondition Or(std::vector<SqlCondition> children);

template <std::same_as<SqlCondition>... More>
SqlCondition And(SqlCondition first, More... more)
{
    return And(std::vector<SqlCondition> { std::move(first), std::move(more)... });
}

template <std::same_as<SqlCondition>... More>
SqlCondition Or(SqlCondition first, More... more)
{
    return Or(std::vector<SqlCondition> { std::move(first), std::move(more)... });
}

inline SqlOrderByItem Ascending(SqlColumnRef column)
{
    return SqlOrderByItem { .column = std::move(column), .ordering = SqlResultOrdering::ASCENDING };
}

inline SqlOrderByItem Descending(SqlColumnRef column)
{
    return SqlOrderByItem { .column = std::move(column), .ordering = SqlResultOrdering::DESCENDING };
}

} // namespace SqlConditions

/// @}
