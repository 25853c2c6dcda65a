// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <Quarry/SqlConnection.hpp>
#include <Quarry/SqlExecutor.hpp>
#include <Quarry/SqlQuery.hpp>
#include <Quarry/SqlStatement.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

using namespace SqlConditions;

namespace
{

SqlTableSchema const& PeopleTable()
{
    static auto const table = SqlTableSchema {
        "quarry_people",
        {
            { .name = "id", .type = SqlColumnType::Integer, .primaryKey = true },
            { .name = "name", .type = SqlColumnType::Text },
            { .name = "age", .type = SqlColumnType::Integer, .nullable = true },
        },
    };
    return table;
}

void RecreatePeopleTable(SqlConnection& connection)
{
    auto stmt = SqlStatement { connection };
    stmt.ExecuteDirect("DROP TABLE IF EXISTS quarry_people");
    stmt.ExecuteDirect(
        "CREATE TABLE quarry_people (id INTEGER NOT NULL PRIMARY KEY, name VARCHAR(50) NOT NULL, age INTEGER NULL)");
}

// In-memory SQLite databases are private to their connection, the non-blocking collaborator needs a file.
class AsyncTestDatabase
{
  public:
    AsyncTestDatabase()
    {
        auto map = ParseConnectionString(SqlTestFixture::configuration.connectionString);
        if (auto const i = map.find("DATABASE"); i != map.end() && i->second.contains(":memory:"))
        {
            m_file = std::filesystem::temp_directory_path() / "quarry-async-test.sqlite";
            i->second = m_file->string();
            m_connectionString = BuildConnectionString(map);
        }
        else
            m_connectionString = SqlTestFixture::configuration.connectionString;
    }

    AsyncTestDatabase(AsyncTestDatabase const&) = delete;
    AsyncTestDatabase(AsyncTestDatabase&&) = delete;
    AsyncTestDatabase& operator=(AsyncTestDatabase const&) = delete;
    AsyncTestDatabase& operator=(AsyncTestDatabase&&) = delete;

    ~AsyncTestDatabase()
    {
        if (m_file)
        {
            auto ec = std::error_code {};
            std::filesystem::remove(*m_file, ec);
        }
    }

    [[nodiscard]] SqlConnectionString const& ConnectionString() const noexcept
    {
        return m_connectionString;
    }

  private:
    std::optional<std::filesystem::path> m_file;
    SqlConnectionString m_connectionString;
};

} // namespace

TEST_CASE_METHOD(SqlTestFixture, "SqlBlockingExecutor: round trip through ODBC", "[SqlExecutor][ODBC]")
{
    if (!databaseAvailable)
        SKIP("No database available");

    auto connection = SqlConnection {};
    REQUIRE(connection.IsAlive());
    RecreatePeopleTable(connection);

    auto executor = SqlBlockingExecutor { connection };
    auto const& people = PeopleTable();

    CHECK(executor.QueryFormatter().Placeholder(1) == "?");

    auto const inserted = SqlQueryBuilder(executor)
                              .Insert(people)
                              .Values(std::vector<SqlValueRow> {
                                  SqlValueRow { { "id", 1 }, { "name", "Alice" }, { "age", 30 } },
                                  SqlValueRow { { "id", 2 }, { "name", "Bob" }, { "age", SqlNullValue } },
                                  SqlValueRow { { "id", 3 }, { "name", "Carol" }, { "age", 41 } },
                              })
                              .Execute();
    CHECK(!inserted.has_value());

    auto const rows = SqlQueryBuilder(executor)
                          .Select("id", "name", "age")
                          .From(people)
                          .Where(Or(IsNull(people["age"]), Greater(people["age"], 35)))
                          .OrderBy("id")
                          .Execute();

    REQUIRE(rows.size() == 2);
    CHECK(rows[0]["id"] == SqlVariant(2));
    CHECK(rows[0]["name"] == SqlVariant("Bob"));
    CHECK(rows[0]["age"].IsNull());
    CHECK(rows[1]["name"] == SqlVariant("Carol"));

    (void) SqlQueryBuilder(executor).Update(people).Set("age", 31).Where(Equal(people["name"], "Alice")).Execute();
    (void) SqlQueryBuilder(executor).Delete(people).Where(In(people["id"], std::vector { 2, 3 })).Execute();

    auto const remaining = SqlQueryBuilder(executor).Select().From(people).Execute();
    REQUIRE(remaining.size() == 1);
    CHECK(remaining[0]["name"] == SqlVariant("Alice"));
    CHECK(remaining[0]["age"] == SqlVariant(31));
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBlockingExecutor: empty membership matches nothing", "[SqlExecutor][ODBC]")
{
    if (!databaseAvailable)
        SKIP("No database available");

    auto connection = SqlConnection {};
    RecreatePeopleTable(connection);
    auto executor = SqlBlockingExecutor { connection };

    (void) SqlQueryBuilder(executor).Insert(PeopleTable()).Values(SqlValueRow { { "id", 1 }, { "name", "A" } }).Execute();

    CHECK(SqlQueryBuilder(executor)
              .Select("id")
              .From(PeopleTable())
              .Where(In(PeopleTable()["id"], std::vector<SqlVariant> {}))
              .Execute()
              .empty());
    CHECK(SqlQueryBuilder(executor)
              .Select("id")
              .From(PeopleTable())
              .Where(NotIn(PeopleTable()["id"], std::vector<SqlVariant> {}))
              .Execute()
              .size()
          == 1);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlAsyncExecutor: round trip through worker threads", "[SqlExecutor][ODBC]")
{
    if (!databaseAvailable)
        SKIP("No database available");

    auto const database = AsyncTestDatabase {};

    {
        auto connection = SqlConnection { database.ConnectionString() };
        REQUIRE(connection.IsAlive());
        RecreatePeopleTable(connection);
    }

    auto executor = SqlAsyncExecutor { database.ConnectionString(), SqlTestFixture::configuration.workerThreads };
    auto const& people = PeopleTable();

    CHECK_THROWS_AS(SqlQueryBuilder(executor).Select().From(people).Execute(), SqlCallingConventionMismatchError);

    auto const inserted = RunAwaitable(SqlQueryBuilder(executor)
                                           .Insert(people)
                                           .Values(SqlValueRow { { "id", 1 }, { "name", "Alice" }, { "age", 30 } })
                                           .Values(SqlValueRow { { "id", 2 }, { "name", "Bob" }, { "age", 25 } })
                                           .ExecuteAsync());
    CHECK(!inserted.has_value());

    auto const rows = RunAwaitable(
        SqlQueryBuilder(executor).Select("name").From(people).OrderBy("age", SqlResultOrdering::DESCENDING).ExecuteAsync());

    REQUIRE(rows.size() == 2);
    CHECK(rows[0]["name"] == SqlVariant("Alice"));
    CHECK(rows[1]["name"] == SqlVariant("Bob"));
}
