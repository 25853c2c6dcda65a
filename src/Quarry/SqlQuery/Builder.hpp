// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "../SqlExecutor.hpp"
#include "../SqlQueryFormatter.hpp"
#include "../SqlResult.hpp"
#include "Compiler.hpp"
#include "Condition.hpp"
#include "Core.hpp"
#include "Statements.hpp"

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace detail
{

/// @brief State shared by all statement builders.
///
/// Holds the compile target and the optional execution collaborator, and enforces that a builder
/// is executed at most once.
class QUARRY_API SqlStatementBuilder
{
  public:
    [[nodiscard]] SqlQueryFormatter const& Formatter() const noexcept
    {
        return *m_formatter;
    }

    /// Retrieves the query compiled by the first execution, or nothing if the builder was not executed yet.
    [[nodiscard]] std::optional<SqlCompiledQuery> const& Compiled() const noexcept
    {
        return m_compiled;
    }

    [[nodiscard]] bool Consumed() const noexcept
    {
        return m_compiled.has_value();
    }

  protected:
    SqlStatementBuilder(SqlQueryFormatter const& formatter,
                        SqlExecutor* executor,
                        SqlColumnCollisionPolicy collisionPolicy) noexcept:
        m_formatter { &formatter },
        m_executor { executor },
        m_collisionPolicy { collisionPolicy }
    {
    }

    [[nodiscard]] SqlQueryCompiler Compiler() const noexcept
    {
        return SqlQueryCompiler { *m_formatter };
    }

    [[nodiscard]] SqlResultMaterializer Materializer() const noexcept
    {
        return SqlResultMaterializer { m_collisionPolicy };
    }

    void SetCollisionPolicy(SqlColumnCollisionPolicy policy) noexcept
    {
        m_collisionPolicy = policy;
    }

    /// Checks that this builder can be executed in the given convention.
    ///
    /// @throws SqlConstructionError if no collaborator is attached or the builder was executed before.
    /// @throws SqlCallingConventionMismatchError if the collaborator expects the other convention.
    void RequireExecutable(SqlExecutionConvention convention) const;

    /// Records the query of the execution that is about to happen and marks this builder as consumed.
    SqlCompiledQuery const& MarkExecuted(SqlCompiledQuery query);

    [[nodiscard]] SqlExecutor& Executor() const noexcept
    {
        return *m_executor;
    }

    /// Executes and materializes a result set, for the non-blocking convention.
    ///
    /// All arguments are taken by value, as the coroutine may outlive the builder.
    static boost::asio::awaitable<std::vector<SqlRowMap>> RunAsync(SqlExecutor& executor,
                                                                    SqlCompiledQuery query,
                                                                    std::vector<std::string> keys,
                                                                    SqlResultMaterializer materializer);

    /// Executes a data modifying statement and materializes its RETURNING rows, if any.
    static boost::asio::awaitable<std::optional<std::vector<SqlRowMap>>> RunModificationAsync(
        SqlExecutor& executor,
        SqlCompiledQuery query,
        std::optional<SqlReturningClause> returning,
        SqlResultMaterializer materializer);

    /// Executes a data modifying statement on the caller's thread.
    std::optional<std::vector<SqlRowMap>> RunModification(SqlCompiledQuery const& query,
                                                          std::optional<SqlReturningClause> const& returning) const;

  private:
    SqlQueryFormatter const* m_formatter;
    SqlExecutor* m_executor;
    SqlColumnCollisionPolicy m_collisionPolicy;
    std::optional<SqlCompiledQuery> m_compiled;
};

/// Converts a caller supplied row count, rejecting negative values.
///
/// @throws SqlConstructionError if the value is negative.
QUARRY_API std::size_t RequireRowCount(long long value, std::string_view clause);

/// ANDs the given conditions onto the root, extending an existing conjunction in place.
QUARRY_API void AppendConjunction(std::optional<SqlCondition>& root, std::vector<SqlCondition> conditions);

/// ORs the given condition onto the root, extending an existing disjunction in place.
QUARRY_API void AppendDisjunction(std::optional<SqlCondition>& root, SqlCondition condition);

/// @brief Mixin for builders of statements with a WHERE clause.
///
/// Repeated Where() calls AND their predicates, OrWhere() ORs a predicate onto everything before it.
template <typename Derived>
class [[nodiscard]] SqlWhereClauseBuilder
{
  public:
    /// Constructs or extends the WHERE clause with the AND of all given predicates.
    template <std::same_as<SqlCondition>... More>
    Derived& Where(SqlCondition condition, More... more)
    {
        AppendConjunction(m_where, std::vector<SqlCondition> { std::move(condition), std::move(more)... });
        return static_cast<Derived&>(*this);
    }

    /// Extends the WHERE clause by OR-ing the given predicate.
    Derived& OrWhere(SqlCondition condition)
    {
        AppendDisjunction(m_where, std::move(condition));
        return static_cast<Derived&>(*this);
    }

  protected:
    std::optional<SqlCondition> m_where;
};

/// Mixin for builders of data modifying statements that may return the affected rows.
template <typename Derived>
class [[nodiscard]] SqlReturningClauseBuilder
{
  public:
    /// Requests all columns of the affected rows (`RETURNING *`).
    Derived& Returning()
    {
        m_returning = SqlReturningClause {};
        return static_cast<Derived&>(*this);
    }

    /// Requests the given columns of the affected rows.
    template <std::convertible_to<std::string_view>... More>
    Derived& Returning(std::string_view firstColumn, More&&... moreColumns)
    {
        m_returning = SqlReturningClause {
            .columns = { std::string(firstColumn), std::string(std::string_view { moreColumns })... },
        };
        return static_cast<Derived&>(*this);
    }

  protected:
    std::optional<SqlReturningClause> m_returning;
};

} // namespace detail
