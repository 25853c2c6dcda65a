// SPDX-License-Identifier: Apache-2.0

#include "../SqlError.hpp"
#include "Builder.hpp"

#include <format>

namespace detail
{

void SqlStatementBuilder::RequireExecutable(SqlExecutionConvention convention) const
{
    if (!m_executor)
        throw SqlConstructionError("Cannot execute a statement built without an execution collaborator");

    if (m_executor->Convention() != convention)
    {
        throw SqlCallingConventionMismatchError(
            convention == SqlExecutionConvention::Blocking
                ? "Execute() called on a non-blocking collaborator, use ExecuteAsync() instead"
                : "ExecuteAsync() called on a blocking collaborator, use Execute() instead");
    }

    if (m_compiled)
        throw SqlConstructionError("Statement builder has already been executed");
}

SqlCompiledQuery const& SqlStatementBuilder::MarkExecuted(SqlCompiledQuery query)
{
    m_compiled = std::move(query);
    return *m_compiled;
}

boost::asio::awaitable<std::vector<SqlRowMap>> SqlStatementBuilder::RunAsync(SqlExecutor& executor,
                                                                             SqlCompiledQuery query,
                                                                             std::vector<std::string> keys,
                                                                             SqlResultMaterializer materializer)
{
    auto const resultSet = co_await executor.ExecuteAsync(std::move(query));
    co_return materializer.ToRowMaps(resultSet, keys);
}

boost::asio::awaitable<std::optional<std::vector<SqlRowMap>>> SqlStatementBuilder::RunModificationAsync(
    SqlExecutor& executor,
    SqlCompiledQuery query,
    std::optional<SqlReturningClause> returning,
    SqlResultMaterializer materializer)
{
    auto const resultSet = co_await executor.ExecuteAsync(std::move(query));
    if (!returning)
        co_return std::nullopt;
    co_return materializer.ToRowMaps(resultSet, returning->columns);
}

std::optional<std::vector<SqlRowMap>> SqlStatementBuilder::RunModification(
    SqlCompiledQuery const& query, std::optional<SqlReturningClause> const& returning) const
{
    auto const resultSet = Executor().Execute(query);
    if (!returning)
        return std::nullopt;
    return Materializer().ToRowMaps(resultSet, returning->columns);
}

std::size_t RequireRowCount(long long value, std::string_view clause)
{
    if (value < 0)
        throw SqlConstructionError(std::format("{}() requires a non-negative value, got {}", clause, value));
    return static_cast<std::size_t>(value);
}

void AppendConjunction(std::optional<SqlCondition>& root, std::vector<SqlCondition> conditions)
{
    if (!root)
    {
        root = SqlConditions::And(std::move(conditions));
        return;
    }

    auto children = std::vector<SqlCondition> {};
    if (auto const* conjunction = root->As<SqlConditionNodes::Conjunction>(); conjunction)
        children = conjunction->children;
    else
        children.emplace_back(*root);

    children.insert(children.end(), std::make_move_iterator(conditions.begin()), std::make_move_iterator(conditions.end()));
    root = SqlConditions::And(std::move(children));
}

void AppendDisjunction(std::optional<SqlCondition>& root, SqlCondition condition)
{
    if (!root)
    {
        root = std::move(condition);
        return;
    }

    auto children = std::vector<SqlCondition> {};
    if (auto const* disjunction = root->As<SqlConditionNodes::Disjunction>(); disjunction)
        children = disjunction->children;
    else
        children.emplace_back(*root);

    children.emplace_back(std::move(condition));
    root = SqlConditions::Or(std::move(children));
}

} // namespace detail
