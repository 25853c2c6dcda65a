// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Utils.hpp"
#include "Builder.hpp"

#include <concepts>
#include <functional>
#include <string_view>
#include <vector>

#include <reflection-cpp/reflection.hpp>

/// @ingroup QueryBuilder
/// @{

/// @brief Query builder for building SELECT ... queries.
///
/// @see SqlQueryBuilder
class [[nodiscard]] SqlSelectQueryBuilder final: public detail::SqlStatementBuilder,
                                                 public detail::SqlWhereClauseBuilder<SqlSelectQueryBuilder>
{
  public:
    SqlSelectQueryBuilder(SqlQueryFormatter const& formatter,
                          SqlExecutor* executor,
                          SqlColumnCollisionPolicy collisionPolicy) noexcept:
        detail::SqlStatementBuilder { formatter, executor, collisionPolicy }
    {
    }

    /// Adds a DISTINCT clause to the SELECT query.
    QUARRY_API SqlSelectQueryBuilder& Distinct() noexcept;

    /// Adds a single column to the SELECT clause.
    QUARRY_API SqlSelectQueryBuilder& Field(SqlProjectionItem item);

    /// Adds a sequence of columns to the SELECT clause.
    template <std::convertible_to<SqlProjectionItem>... Items>
    SqlSelectQueryBuilder& Fields(Items&&... items);

    /// Adds the reflected members of the given records to the SELECT clause.
    ///
    /// With more than one record the columns are qualified by the records' table names.
    template <typename FirstRecord, typename... MoreRecords>
    SqlSelectQueryBuilder& Fields();

    /// Sets the table to select from.
    QUARRY_API SqlSelectQueryBuilder& From(SqlTableSchema table);

    /// Constructs an INNER JOIN clause.
    QUARRY_API SqlSelectQueryBuilder& InnerJoin(SqlTableSchema table, SqlCondition on);

    /// Constructs a LEFT OUTER JOIN clause.
    QUARRY_API SqlSelectQueryBuilder& LeftJoin(SqlTableSchema table, SqlCondition on);

    /// Constructs a RIGHT OUTER JOIN clause.
    QUARRY_API SqlSelectQueryBuilder& RightJoin(SqlTableSchema table, SqlCondition on);

    /// Constructs a FULL OUTER JOIN clause, rejected by dialects without FULL JOIN support.
    QUARRY_API SqlSelectQueryBuilder& FullJoin(SqlTableSchema table, SqlCondition on);

    /// Constructs or extends the ORDER BY clause.
    QUARRY_API SqlSelectQueryBuilder& OrderBy(SqlOrderByItem item);

    /// Constructs or extends the ORDER BY clause.
    QUARRY_API SqlSelectQueryBuilder& OrderBy(SqlColumnRef column,
                                              SqlResultOrdering ordering = SqlResultOrdering::ASCENDING);

    /// Constructs or extends the ORDER BY clause by column name, optionally qualified as "table.column".
    QUARRY_API SqlSelectQueryBuilder& OrderBy(std::string_view columnName,
                                              SqlResultOrdering ordering = SqlResultOrdering::ASCENDING);

    /// Limits the number of returned rows.
    ///
    /// @throws SqlConstructionError if the count is negative.
    QUARRY_API SqlSelectQueryBuilder& Limit(long long count);

    /// Skips the given number of rows.
    ///
    /// @throws SqlConstructionError if the count is negative.
    QUARRY_API SqlSelectQueryBuilder& Offset(long long count);

    /// Sets how result columns sharing a key are materialized.
    QUARRY_API SqlSelectQueryBuilder& CollisionPolicy(SqlColumnCollisionPolicy policy) noexcept;

    /// Retrieves the statement described so far.
    [[nodiscard]] QUARRY_API SqlSelectStatement Statement() const;

    /// Compiles the statement for the builder's dialect.
    [[nodiscard]] QUARRY_API SqlCompiledQuery Compile() const;

    /// Compiles the statement and returns only its SQL text.
    [[nodiscard]] QUARRY_API std::string ToSql() const;

    /// Executes the statement on a blocking collaborator.
    QUARRY_API std::vector<SqlRowMap> Execute();

    /// Executes the statement on a non-blocking collaborator.
    ///
    /// Precondition failures are raised synchronously, before the returned awaitable is started.
    QUARRY_API boost::asio::awaitable<std::vector<SqlRowMap>> ExecuteAsync();

    /// Executes the statement on a blocking collaborator and hydrates the rows into records.
    template <typename Record>
    std::vector<Record> ExecuteAs();

    /// Executes the statement on a blocking collaborator and hydrates the rows with the given function.
    template <typename Record>
    std::vector<Record> ExecuteAs(std::function<Record(SqlRowMap const&)> const& hydrator);

  private:
    SqlSelectQueryBuilder& Join(SqlJoinType type, SqlTableSchema table, SqlCondition on);

    std::optional<SqlTableSchema> m_table;
    bool m_distinct = false;
    std::vector<SqlProjectionItem> m_projection;
    std::vector<SqlJoinClause> m_joins;
    std::vector<SqlOrderByItem> m_orderBy;
    std::optional<std::size_t> m_limit;
    std::optional<std::size_t> m_offset;
};

template <std::convertible_to<SqlProjectionItem>... Items>
SqlSelectQueryBuilder& SqlSelectQueryBuilder::Fields(Items&&... items)
{
    (Field(SqlProjectionItem { std::forward<Items>(items) }), ...);
    return *this;
}

template <typename FirstRecord, typename... MoreRecords>
inline QUARRY_FORCE_INLINE SqlSelectQueryBuilder& SqlSelectQueryBuilder::Fields()
{
    if constexpr (sizeof...(MoreRecords) == 0)
    {
        Reflection::EnumerateMembers<FirstRecord>([&]<size_t FieldIndex, typename FieldType>() {
            Field(SqlProjectionItem { std::string_view { Reflection::MemberNameOf<FieldIndex, FirstRecord> } });
        });
    }
    else
    {
        Reflection::EnumerateMembers<FirstRecord>([&]<size_t FieldIndex, typename FieldType>() {
            Field(SqlQualifiedTableColumnName {
                .tableName = detail::RecordTableName<FirstRecord>::Value,
                .columnName = Reflection::MemberNameOf<FieldIndex, FirstRecord>,
            });
        });

        (Reflection::EnumerateMembers<MoreRecords>([&]<size_t FieldIndex, typename FieldType>() {
             Field(SqlQualifiedTableColumnName {
                 .tableName = detail::RecordTableName<MoreRecords>::Value,
                 .columnName = Reflection::MemberNameOf<FieldIndex, MoreRecords>,
             });
         }),
         ...);
    }
    return *this;
}

template <typename Record>
std::vector<Record> SqlSelectQueryBuilder::ExecuteAs()
{
    return SqlResultMaterializer::ToRecords<Record>(Execute());
}

template <typename Record>
std::vector<Record> SqlSelectQueryBuilder::ExecuteAs(std::function<Record(SqlRowMap const&)> const& hydrator)
{
    return SqlResultMaterializer::ToRecords<Record>(Execute(), hydrator);
}

/// @}
