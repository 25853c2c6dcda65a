// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <Quarry/DataBinder/SqlVariant.hpp>
#include <Quarry/SqlError.hpp>
#include <Quarry/SqlRowMap.hpp>
#include <Quarry/SqlSchema.hpp>

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

using namespace std::string_view_literals;

int main(int argc, char** argv)
{
    auto result = SqlTestFixture::Initialize(argc, argv);
    if (auto const* exitCode = std::get_if<int>(&result))
        return *exitCode;

    std::tie(argc, argv) = std::get<SqlTestFixture::MainProgramArgs>(result);

    return Catch::Session().run(argc, argv);
}

TEST_CASE("SqlVariant: construction at the boundary", "[SqlVariant]")
{
    CHECK(SqlVariant(SqlNullValue).Type() == SqlValueType::Null);
    CHECK(SqlVariant(std::nullopt).Type() == SqlValueType::Null);
    CHECK(SqlVariant(true).Type() == SqlValueType::Boolean);
    CHECK(SqlVariant(42).Type() == SqlValueType::Integer);
    CHECK(SqlVariant(int16_t { 7 }).Type() == SqlValueType::Integer);
    CHECK(SqlVariant(uint32_t { 7 }).Type() == SqlValueType::Integer);
    CHECK(SqlVariant(2.5F).Type() == SqlValueType::Float);
    CHECK(SqlVariant(2.5).Type() == SqlValueType::Float);
    CHECK(SqlVariant("text").Type() == SqlValueType::Text);
    CHECK(SqlVariant("text"sv).Type() == SqlValueType::Text);
    CHECK(SqlVariant(std::string("text")).Type() == SqlValueType::Text);
    CHECK(SqlVariant(nlohmann::json { { "key", 1 } }).Type() == SqlValueType::Structured);
    CHECK(SqlVariant(std::optional<int> {}).IsNull());
    CHECK(SqlVariant(std::optional<int> { 3 }) == SqlVariant(3));
}

TEST_CASE("SqlVariant: accessors", "[SqlVariant]")
{
    CHECK(SqlVariant(42).TryGetLongLong().value() == 42);
    CHECK(SqlVariant(42).TryGetInt().value() == 42);
    CHECK(SqlVariant(true).TryGetBool().value());
    CHECK_THAT(SqlVariant(3).TryGetDouble().value(), Catch::Matchers::WithinAbs(3.0, 0.000'001));
    CHECK_THAT(SqlVariant(1.5).TryGetDouble().value(), Catch::Matchers::WithinAbs(1.5, 0.000'001));
    CHECK(SqlVariant("abc").TryGetStringView().value() == "abc");
    CHECK(SqlVariant(nlohmann::json::array({ 1, 2 })).TryGetStructured().value().size() == 2);

    CHECK(!SqlVariant(SqlNullValue).TryGetLongLong().has_value());
    CHECK(!SqlVariant(SqlNullValue).TryGetStringView().has_value());
    CHECK_THROWS_AS(SqlVariant("abc").TryGetLongLong(), std::bad_variant_access);
    CHECK_THROWS_AS(SqlVariant(1).TryGetStringView(), std::bad_variant_access);
}

TEST_CASE("SqlVariant: equality is per alternative", "[SqlVariant]")
{
    CHECK(SqlVariant(1) == SqlVariant(1LL));
    CHECK(SqlVariant(1) != SqlVariant(1.0));
    CHECK(SqlVariant(1) != SqlVariant(true));
    CHECK(SqlVariant("1") != SqlVariant(1));
    CHECK(SqlVariant(SqlNullValue) == SqlVariant(std::nullopt));
}

TEST_CASE("SqlVariant: formatting", "[SqlVariant]")
{
    CHECK(std::format("{}", SqlValueType::Integer) == "integer");
    CHECK(std::format("{}", SqlValueType::Null) == "null");
    CHECK(SqlVariant(42).ToString() == "42");
    CHECK(SqlVariant(SqlNullValue).ToString() == "NULL");
}

TEST_CASE("SqlRowMap: keeps insertion order", "[SqlRowMap]")
{
    auto row = SqlRowMap { { "b", 2 }, { "a", 1 } };
    CHECK(row.size() == 2);
    CHECK(row.Keys() == std::vector<std::string_view> { "b", "a" });

    CHECK(row.Set("c", 3) == false);
    CHECK(row.Set("b", 20) == true);
    CHECK(row.Keys() == std::vector<std::string_view> { "b", "a", "c" });
    CHECK(row["b"] == SqlVariant(20));

    CHECK(row.Contains("a"));
    CHECK(row.Find("z") == nullptr);
    CHECK_THROWS_AS(row.At("z"), std::out_of_range);
}

TEST_CASE("SqlRowMap: duplicate keys in an initializer list keep the later value", "[SqlRowMap]")
{
    auto const row = SqlRowMap { { "a", 1 }, { "a", 2 } };
    CHECK(row.size() == 1);
    CHECK(row["a"] == SqlVariant(2));
}

TEST_CASE("SqlTableSchema: column lookup", "[SqlTableSchema]")
{
    auto const& users = UsersTable();

    CHECK(users.Name() == "users");
    CHECK(users.HasColumn("email"));
    CHECK(!users.HasColumn("nope"));
    CHECK(users.FindColumn("age")->nullable);
    CHECK(users.FindColumn("id")->primaryKey);
    CHECK(users.ColumnNames().front() == "id");

    auto const ref = users["name"];
    CHECK(ref == SqlColumnRef { .tableName = "users", .columnName = "name", .alias = std::nullopt });

    auto const error = CatchError<SqlInvalidColumnError>([&] { return users.Column("nope"); });
    REQUIRE(error.has_value());
    CHECK(error->TableName() == "users");
    CHECK(error->ColumnName() == "nope");
    CHECK(error->code() == SqlQueryErrorCode::INVALID_COLUMN);
}

TEST_CASE("SqlTableSchema: duplicate column names are rejected", "[SqlTableSchema]")
{
    CHECK_THROWS_AS((SqlTableSchema { "t",
                                      {
                                          { .name = "a", .type = SqlColumnType::Text },
                                          { .name = "a", .type = SqlColumnType::Integer },
                                      } }),
                    SqlConstructionError);
}

TEST_CASE("SqlColumnRef: equality covers table, column and alias", "[SqlColumnRef]")
{
    auto const& users = UsersTable();
    auto const& orders = OrdersTable();

    CHECK(users["id"] == users["id"]);
    CHECK(users["id"] != orders["id"]);
    CHECK(users["id"] != users["id"].As("uid"));
    CHECK(users["id"].As("uid") == users["id"].As("uid"));
    CHECK(users["id"].As("uid").alias.value() == "uid");
}

TEST_CASE("SqlQueryError: error codes and categories", "[SqlError]")
{
    auto const error = SqlUnsupportedFeatureError("RETURNING", "MySQL");
    CHECK(error.code() == SqlQueryErrorCode::UNSUPPORTED_FEATURE);
    CHECK(error.code().category().name() == "Quarry.Query"sv);
    CHECK(error.Feature() == "RETURNING");
    CHECK(error.Dialect() == "MySQL");
    CHECK(std::string_view(error.what()) == R"(UnsupportedFeature("RETURNING", dialect="MySQL"))");

    CHECK(std::format("{}", SqlQueryErrorCode::TYPE_MISMATCH) == "TypeMismatch");
    CHECK(std::format("{}", SqlError::NODATA) == "SQL_NO_DATA");
    CHECK(make_error_code(SqlError::FAILURE).category().name() == "Quarry.ODBC"sv);
}
