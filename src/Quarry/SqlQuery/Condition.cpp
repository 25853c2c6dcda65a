// SPDX-License-Identifier: Apache-2.0

#include "../SqlError.hpp"
#include "Condition.hpp"

using namespace SqlConditionNodes;

namespace
{

template <typename Node>
SqlCondition MakeCondition(Node node)
{
    return SqlCondition { std::make_shared<SqlConditionNode const>(SqlConditionNode { std::move(node) }) };
}

SqlCondition MakeComparison(ComparisonOperator op, SqlColumnRef column, SqlOperand value)
{
    return MakeCondition(Comparison { .op = op, .left = std::move(column), .right = std::move(value) });
}

bool IsNullLiteral(SqlOperand const& operand) noexcept
{
    auto const* literal = operand.Literal();
    return literal && literal->IsNull();
}

template <typename Junction>
SqlCondition MakeJunction(std::string_view name, std::vector<SqlCondition> children)
{
    if (children.empty())
        throw SqlConstructionError(std::format("{}() requires at least one condition", name));

    if (children.size() == 1)
        return std::move(children.front());

    return MakeCondition(Junction { .children = std::move(children) });
}

} // namespace

namespace SqlConditions
{

SqlCondition Equal(SqlColumnRef column, SqlOperand value)
{
    if (IsNullLiteral(value))
        return IsNull(std::move(column));
    return MakeComparison(ComparisonOperator::Equal, std::move(column), std::move(value));
}

SqlCondition NotEqual(SqlColumnRef column, SqlOperand value)
{
    if (IsNullLiteral(value))
        return IsNotNull(std::move(column));
    return MakeComparison(ComparisonOperator::NotEqual, std::move(column), std::move(value));
}

SqlCondition Less(SqlColumnRef column, SqlOperand value)
{
    return MakeComparison(ComparisonOperator::Less, std::move(column), std::move(value));
}

SqlCondition LessOrEqual(SqlColumnRef column, SqlOperand value)
{
    return MakeComparison(ComparisonOperator::LessOrEqual, std::move(column), std::move(value));
}

SqlCondition Greater(SqlColumnRef column, SqlOperand value)
{
    return MakeComparison(ComparisonOperator::Greater, std::move(column), std::move(value));
}

SqlCondition GreaterOrEqual(SqlColumnRef column, SqlOperand value)
{
    return MakeComparison(ComparisonOperator::GreaterOrEqual, std::move(column), std::move(value));
}

SqlCondition Like(SqlColumnRef column, std::string pattern)
{
    return MakeCondition(Pattern { .column = std::move(column), .pattern = std::move(pattern), .caseSensitive = true });
}

SqlCondition ILike(SqlColumnRef column, std::string pattern)
{
    return MakeCondition(
        Pattern { .column = std::move(column), .pattern = std::move(pattern), .caseSensitive = false });
}

SqlCondition IsNull(SqlColumnRef column)
{
    return MakeCondition(NullCheck { .column = std::move(column), .isNull = true });
}

SqlCondition IsNotNull(SqlColumnRef column)
{
    return MakeCondition(NullCheck { .column = std::move(column), .isNull = false });
}

SqlCondition In(SqlColumnRef column, std::vector<SqlVariant> values)
{
    return MakeCondition(Membership { .column = std::move(column), .values = std::move(values), .negated = false });
}

SqlCondition NotIn(SqlColumnRef column, std::vector<SqlVariant> values)
{
    return MakeCondition(Membership { .column = std::move(column), .values = std::move(values), .negated = true });
}

SqlCondition Between(SqlColumnRef column, SqlVariant low, SqlVariant high)
{
    return MakeCondition(Range { .column = std::move(column), .low = std::move(low), .high = std::move(high) });
}

SqlCondition And(std::vector<SqlCondition> children)
{
    return MakeJunction<Conjunction>("And", std::move(children));
}

SqlCondition Or(std::vector<SqlCondition> children)
{
    return MakeJunction<Disjunction>("Or", std::move(children));
}

} // namespace SqlConditions
