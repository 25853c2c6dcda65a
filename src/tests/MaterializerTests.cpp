// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <Quarry/SqlResult.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace
{

struct Profile
{
    long long id {};
    std::string name;
    std::optional<long long> age;
    double score = -1.0;
    bool active = false;
    std::optional<nlohmann::json> profile;
};

SqlResultSet JoinedResult()
{
    // users.id, users.name, orders.id
    return SqlResultSet {
        .columns = { { .tableName = "users", .columnName = "id" },
                     { .tableName = "users", .columnName = "name" },
                     { .tableName = "orders", .columnName = "id" } },
        .rows = { { SqlVariant(1), SqlVariant("Alice"), SqlVariant(100) } },
    };
}

} // namespace

TEST_CASE("SqlResultMaterializer: keys default to the column labels", "[SqlResultMaterializer]")
{
    auto const rows = SqlResultMaterializer {}.ToRowMaps(SqlResultSet {
        .columns = { { .tableName = "users", .columnName = "id" }, { .tableName = "users", .columnName = "name" } },
        .rows = { { SqlVariant(1), SqlVariant("A") }, { SqlVariant(2), SqlVariant("B") } },
    });

    REQUIRE(rows.size() == 2);
    CHECK(rows[0].Keys() == std::vector<std::string_view> { "id", "name" });
    CHECK(rows[1]["name"] == SqlVariant("B"));
}

TEST_CASE("SqlResultMaterializer: colliding keys", "[SqlResultMaterializer]")
{
    SECTION("the last column wins by default")
    {
        auto const rows = SqlResultMaterializer { SqlColumnCollisionPolicy::LastWins }.ToRowMaps(JoinedResult());
        REQUIRE(rows.size() == 1);
        CHECK(rows[0].size() == 2);
        CHECK(rows[0]["id"] == SqlVariant(100));
        CHECK(rows[0].Keys() == std::vector<std::string_view> { "id", "name" });
    }

    SECTION("strict materialization rejects them")
    {
        auto const error = CatchError<SqlAmbiguousColumnError>(
            [] { return SqlResultMaterializer { SqlColumnCollisionPolicy::Strict }.ToRowMaps(JoinedResult()); });
        REQUIRE(error.has_value());
        CHECK(error->code() == SqlQueryErrorCode::AMBIGUOUS_COLUMN);
        CHECK(std::string_view(error->what()) == R"(AmbiguousColumn("id"))");
    }

    SECTION("qualified keys keep both columns apart")
    {
        auto const rows = SqlResultMaterializer { SqlColumnCollisionPolicy::Strict }.ToRowMaps(
            JoinedResult(), { "users.id", "users.name", "orders.id" });
        REQUIRE(rows.size() == 1);
        CHECK(rows[0]["users.id"] == SqlVariant(1));
        CHECK(rows[0]["orders.id"] == SqlVariant(100));
    }
}

TEST_CASE("SqlResultMaterializer: key count must match the column count", "[SqlResultMaterializer]")
{
    CHECK_THROWS_AS(SqlResultMaterializer {}.ToRowMaps(JoinedResult(), { "a", "b" }), SqlConstructionError);

    // Without column labels the row width is the only thing to check against.
    auto const unlabeled = SqlResultSet {
        .columns = {},
        .rows = { { SqlVariant(1), SqlVariant("A") }, { SqlVariant(2) } },
    };
    CHECK_THROWS_AS(SqlResultMaterializer {}.ToRowMaps(unlabeled, { "id", "name" }), SqlConstructionError);
    CHECK_THROWS_AS(SqlResultMaterializer {}.ToRowMaps(unlabeled, { "id", "name", "age" }), SqlConstructionError);
}

TEST_CASE("SqlResultMaterializer: empty result sets", "[SqlResultMaterializer]")
{
    CHECK(SqlResultMaterializer {}.ToRowMaps(SqlResultSet {}, { "id" }).empty());
}

TEST_CASE("SqlResultMaterializer: records by reflection", "[SqlResultMaterializer]")
{
    auto const rows = std::vector<SqlRowMap> {
        SqlRowMap {
            { "id", 1 },
            { "name", "Alice" },
            { "age", 30 },
            { "score", 4 },
            { "active", 1 },
            { "profile", R"({"theme":"dark"})" },
        },
        SqlRowMap {
            { "id", 2 },
            { "name", "Bob" },
            { "age", SqlNullValue },
            { "score", SqlNullValue },
            { "unrelated", "ignored" },
        },
    };

    auto const records = SqlResultMaterializer::ToRecords<Profile>(rows);
    REQUIRE(records.size() == 2);

    CHECK(records[0].id == 1);
    CHECK(records[0].name == "Alice");
    CHECK(records[0].age == 30);
    CHECK_THAT(records[0].score, Catch::Matchers::WithinAbs(4.0, 0.000'001));
    CHECK(records[0].active);
    REQUIRE(records[0].profile.has_value());
    CHECK((*records[0].profile)["theme"] == "dark");

    CHECK(records[1].name == "Bob");
    CHECK(!records[1].age.has_value());
    CHECK_THAT(records[1].score, Catch::Matchers::WithinAbs(-1.0, 0.000'001));
    CHECK(!records[1].active);
    CHECK(!records[1].profile.has_value());
}

TEST_CASE("SqlResultMaterializer: member type mismatch", "[SqlResultMaterializer]")
{
    auto const error = CatchError<SqlTypeMismatchError>(
        [] { return SqlResultMaterializer::ToRecord<Profile>(SqlRowMap { { "name", 42 } }); });
    REQUIRE(error.has_value());
    CHECK(error->Column() == "name");
    CHECK(error->Actual() == SqlValueType::Integer);
}

TEST_CASE("SqlResultMaterializer: records by hydrator", "[SqlResultMaterializer]")
{
    auto const rows = std::vector<SqlRowMap> { SqlRowMap { { "a", 2 }, { "b", 3 } } };
    auto const sums = SqlResultMaterializer::ToRecords<long long>(
        rows, [](SqlRowMap const& row) { return *row["a"].TryGetLongLong() + *row["b"].TryGetLongLong(); });
    CHECK(sums == std::vector<long long> { 5 });
}
