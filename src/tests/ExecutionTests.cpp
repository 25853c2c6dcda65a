// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <Quarry/SqlQuery.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace SqlConditions;

namespace
{

struct Person
{
    long long id {};
    std::string name;
    std::optional<long long> age;
};

SqlResultSet PeopleResult()
{
    return SqlResultSet {
        .columns = { { .tableName = "users", .columnName = "id" },
                     { .tableName = "users", .columnName = "name" },
                     { .tableName = "users", .columnName = "age" } },
        .rows = { { SqlVariant(1), SqlVariant("Alice"), SqlVariant(30) },
                  { SqlVariant(2), SqlVariant("Bob"), SqlVariant(SqlNullValue) } },
    };
}

} // namespace

TEST_CASE("Execution: blocking select", "[SqlExecutor]")
{
    auto executor = RecordingExecutor { SqlExecutionConvention::Blocking };
    executor.SetResult(PeopleResult());

    auto const& users = UsersTable();
    auto query = SqlQueryBuilder(executor).Select("id", "name", "age").From(users).Where(Greater(users["id"], 0));
    auto const rows = query.Execute();

    REQUIRE(executor.Executed().size() == 1);
    CHECK(executor.Executed()[0].sql == R"(SELECT "id", "name", "age" FROM "users" WHERE "id" > $1)");
    CHECK(executor.Executed()[0].parameters == std::vector<SqlVariant> { SqlVariant(0) });

    REQUIRE(rows.size() == 2);
    CHECK(rows[0]["name"] == SqlVariant("Alice"));
    CHECK(rows[1]["age"].IsNull());

    REQUIRE(query.Compiled().has_value());
    CHECK(*query.Compiled() == executor.Executed()[0]);
    CHECK(query.Consumed());
}

TEST_CASE("Execution: blocking select hydrating records", "[SqlExecutor]")
{
    auto executor = RecordingExecutor { SqlExecutionConvention::Blocking };
    executor.SetResult(PeopleResult());

    auto const people = SqlQueryBuilder(executor).Select("id", "name", "age").From(UsersTable()).ExecuteAs<Person>();
    REQUIRE(people.size() == 2);
    CHECK(people[0].id == 1);
    CHECK(people[0].name == "Alice");
    CHECK(people[0].age == 30);
    CHECK(!people[1].age.has_value());

    executor.SetResult(PeopleResult());
    auto const names = SqlQueryBuilder(executor).Select("id", "name", "age").From(UsersTable()).ExecuteAs<std::string>(
        [](SqlRowMap const& row) { return std::string(row["name"].TryGetStringView().value()); });
    CHECK(names == std::vector<std::string> { "Alice", "Bob" });
}

TEST_CASE("Execution: a builder executes at most once", "[SqlExecutor]")
{
    auto executor = RecordingExecutor { SqlExecutionConvention::Blocking };
    auto query = SqlQueryBuilder(executor).Delete(UsersTable()).Where(Equal(UsersTable()["id"], 1));

    CHECK(!query.Consumed());
    CHECK(!query.Execute().has_value());
    CHECK(query.Consumed());

    CHECK_THROWS_AS(query.Execute(), SqlConstructionError);
    CHECK(executor.Executed().size() == 1);
}

TEST_CASE("Execution: a failed compilation leaves the builder executable", "[SqlExecutor]")
{
    auto executor = RecordingExecutor { SqlExecutionConvention::Blocking, SqlQueryFormatter::MySQL() };
    auto query = SqlQueryBuilder(executor).Delete(UsersTable()).Returning();

    CHECK_THROWS_AS(query.Execute(), SqlUnsupportedFeatureError);
    CHECK(!query.Consumed());
    CHECK(executor.Executed().empty());
}

TEST_CASE("Execution: builders without a collaborator cannot execute", "[SqlExecutor]")
{
    auto query = SqlQueryBuilder(SqlQueryFormatter::Sqlite()).Select().From(UsersTable());
    CHECK_THROWS_AS(query.Execute(), SqlConstructionError);
    CHECK_THROWS_AS((void) query.ExecuteAsync(), SqlConstructionError);

    // Compilation does not need one.
    CHECK(query.ToSql() == R"(SELECT * FROM "users")");
}

TEST_CASE("Execution: calling convention mismatch", "[SqlExecutor]")
{
    SECTION("blocking execution on a non-blocking collaborator")
    {
        auto executor = RecordingExecutor { SqlExecutionConvention::NonBlocking };
        auto query = SqlQueryBuilder(executor).Insert(UsersTable()).Values(SqlValueRow { { "name", "A" } });

        auto const error = CatchError<SqlCallingConventionMismatchError>([&] { return query.Execute(); });
        REQUIRE(error.has_value());
        CHECK(error->code() == SqlQueryErrorCode::CALLING_CONVENTION_MISMATCH);
        CHECK(executor.Executed().empty());
        CHECK(!query.Consumed());
    }

    SECTION("non-blocking execution on a blocking collaborator is rejected before any awaiting")
    {
        auto executor = RecordingExecutor { SqlExecutionConvention::Blocking };
        auto query = SqlQueryBuilder(executor).Update(UsersTable()).Set("age", 1);

        CHECK_THROWS_AS((void) query.ExecuteAsync(), SqlCallingConventionMismatchError);
        CHECK(executor.Executed().empty());
        CHECK(!query.Consumed());
    }

    SECTION("the collaborator itself rejects the other form")
    {
        auto executor = RecordingExecutor { SqlExecutionConvention::Blocking };
        CHECK_THROWS_AS(RunAwaitable(executor.ExecuteAsync(SqlCompiledQuery { .sql = "SELECT 1", .parameters = {} })),
                        SqlCallingConventionMismatchError);

        auto asyncExecutor = RecordingExecutor { SqlExecutionConvention::NonBlocking };
        CHECK_THROWS_AS(asyncExecutor.Execute(SqlCompiledQuery { .sql = "SELECT 1", .parameters = {} }),
                        SqlCallingConventionMismatchError);
    }
}

TEST_CASE("Execution: non-blocking select", "[SqlExecutor]")
{
    auto executor = RecordingExecutor { SqlExecutionConvention::NonBlocking, SqlQueryFormatter::Sqlite() };
    executor.SetResult(PeopleResult());

    auto query = SqlQueryBuilder(executor).Select("id", "name", "age").From(UsersTable()).Limit(2);
    auto awaitable = query.ExecuteAsync();
    CHECK(query.Consumed());

    auto const rows = RunAwaitable(std::move(awaitable));
    REQUIRE(rows.size() == 2);
    CHECK(rows[0]["id"] == SqlVariant(1));
    CHECK(rows[1]["name"] == SqlVariant("Bob"));

    REQUIRE(executor.Executed().size() == 1);
    CHECK(executor.Executed()[0].sql == R"(SELECT "id", "name", "age" FROM "users" LIMIT 2)");
}

TEST_CASE("Execution: non-blocking insert with returning", "[SqlExecutor]")
{
    auto executor = RecordingExecutor { SqlExecutionConvention::NonBlocking };
    executor.SetResult(SqlResultSet {
        .columns = { { .tableName = "users", .columnName = "id" } },
        .rows = { { SqlVariant(10) }, { SqlVariant(11) } },
        .affectedRows = 2,
    });

    auto const rows = RunAwaitable(SqlQueryBuilder(executor)
                                       .Insert(UsersTable())
                                       .Values(SqlValueRow { { "name", "A" } })
                                       .Values(SqlValueRow { { "name", "B" } })
                                       .Returning("id")
                                       .ExecuteAsync());

    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 2);
    CHECK((*rows)[0]["id"] == SqlVariant(10));
    CHECK((*rows)[1]["id"] == SqlVariant(11));

    REQUIRE(executor.Executed().size() == 1);
    CHECK(executor.Executed()[0].sql == R"(INSERT INTO "users" ("name") VALUES ($1), ($2) RETURNING "id")");
}

TEST_CASE("Execution: data modification without returning yields no rows", "[SqlExecutor]")
{
    auto executor = RecordingExecutor { SqlExecutionConvention::NonBlocking };
    executor.SetResult(SqlResultSet { .columns = {}, .rows = {}, .affectedRows = 3 });

    auto const rows =
        RunAwaitable(SqlQueryBuilder(executor).Update(UsersTable()).Set("age", SqlNullValue).ExecuteAsync());
    CHECK(!rows.has_value());
}

TEST_CASE("Execution: update returning all columns uses the reported labels", "[SqlExecutor]")
{
    auto executor = RecordingExecutor { SqlExecutionConvention::Blocking };
    executor.SetResult(PeopleResult());

    auto const rows = SqlQueryBuilder(executor)
                          .Update(UsersTable())
                          .Set("name", "X")
                          .Where(Less(UsersTable()["id"], 3))
                          .Returning()
                          .Execute();

    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 2);
    CHECK((*rows)[0].Keys() == std::vector<std::string_view> { "id", "name", "age" });
    CHECK(executor.Executed()[0].sql == R"(UPDATE "users" SET "name" = $1 WHERE "id" < $2 RETURNING *)");
}
