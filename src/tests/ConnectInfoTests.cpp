// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <Quarry/SqlConnectInfo.hpp>
#include <Quarry/SqlResult.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace
{

// Sets (or clears) an environment variable for the lifetime of the guard, restoring the previous value afterwards.
class ScopedEnvironmentVariable
{
  public:
    ScopedEnvironmentVariable(char const* name, std::optional<std::string> const& value):
        m_name { name }
    {
        // NOLINTNEXTLINE(concurrency-mt-unsafe)
        if (auto const* previous = std::getenv(name))
            m_previous = previous;
        Assign(value);
    }

    ScopedEnvironmentVariable(ScopedEnvironmentVariable const&) = delete;
    ScopedEnvironmentVariable(ScopedEnvironmentVariable&&) = delete;
    ScopedEnvironmentVariable& operator=(ScopedEnvironmentVariable const&) = delete;
    ScopedEnvironmentVariable& operator=(ScopedEnvironmentVariable&&) = delete;

    ~ScopedEnvironmentVariable()
    {
        Assign(m_previous);
    }

  private:
    void Assign(std::optional<std::string> const& value) const
    {
        // NOLINTBEGIN(concurrency-mt-unsafe)
        if (value)
            ::setenv(m_name, value->c_str(), 1);
        else
            ::unsetenv(m_name);
        // NOLINTEND(concurrency-mt-unsafe)
    }

    char const* m_name;
    std::optional<std::string> m_previous;
};

} // namespace

TEST_CASE("SqlConnectionString: parsing", "[SqlConnectInfo]")
{
    auto const map = ParseConnectionString(
        SqlConnectionString { .value = "Driver={PostgreSQL Unicode}; Server = localhost;uid=quarry;PWD={se;cret}x" });

    CHECK(map.at("DRIVER") == "PostgreSQL Unicode");
    CHECK(map.at("SERVER") == "localhost");
    CHECK(map.at("UID") == "quarry");
    CHECK(!map.contains("Driver"));
}

TEST_CASE("SqlConnectionString: building", "[SqlConnectInfo]")
{
    auto const connectionString = BuildConnectionString({ { "DRIVER", "SQLite3" }, { "DATABASE", "test.db" } });
    CHECK(connectionString.value == "DATABASE={test.db};DRIVER={SQLite3}");

    auto const reparsed = ParseConnectionString(connectionString);
    CHECK(reparsed.at("DATABASE") == "test.db");
    CHECK(reparsed.at("DRIVER") == "SQLite3");
}

TEST_CASE("SqlConnectionString: passwords are masked", "[SqlConnectInfo]")
{
    CHECK(SqlConnectionString { .value = "DRIVER=x;PWD=secret;UID=u" }.Sanitized() == "DRIVER=x;Pwd=***;UID=u");
    CHECK(SqlConnectionString { .value = "DRIVER=x;pwd=secret" }.Sanitized() == "DRIVER=x;Pwd=***");
    CHECK(SqlConnectionString { .value = "DRIVER=x" }.Sanitized() == "DRIVER=x");
    CHECK(SqlConnectionString::SanitizePwd("DSN=db;UID=u;PWD=p;TIMEOUT=5") == "DSN=db;UID=u;Pwd=***;TIMEOUT=5");
}

TEST_CASE("SqlConfiguration: defaults", "[SqlConfiguration]")
{
    auto const connection = ScopedEnvironmentVariable { "QUARRY_CONNECTION_STRING", std::nullopt };
    auto const odbc = ScopedEnvironmentVariable { "ODBC_CONNECTION_STRING", std::nullopt };
    auto const threads = ScopedEnvironmentVariable { "QUARRY_WORKER_THREADS", std::nullopt };
    auto const trace = ScopedEnvironmentVariable { "QUARRY_TRACE_SQL", std::nullopt };
    auto const strict = ScopedEnvironmentVariable { "QUARRY_STRICT_COLUMNS", std::nullopt };

    auto const config = SqlConfiguration::FromEnvironment();
    CHECK(config.connectionString.value == SqlDefaultConnectionString);
    CHECK(config.workerThreads == 2);
    CHECK(!config.traceSql);
    CHECK(!config.strictColumns);
    CHECK(config.CollisionPolicy() == SqlColumnCollisionPolicy::LastWins);
}

TEST_CASE("SqlConfiguration: environment overrides", "[SqlConfiguration]")
{
    SECTION("connection string precedence")
    {
        auto const odbc = ScopedEnvironmentVariable { "ODBC_CONNECTION_STRING", "DSN=fallback" };

        {
            auto const connection = ScopedEnvironmentVariable { "QUARRY_CONNECTION_STRING", "DSN=primary" };
            CHECK(SqlConfiguration::FromEnvironment().connectionString.value == "DSN=primary");
        }

        auto const connection = ScopedEnvironmentVariable { "QUARRY_CONNECTION_STRING", std::nullopt };
        CHECK(SqlConfiguration::FromEnvironment().connectionString.value == "DSN=fallback");
    }

    SECTION("worker threads")
    {
        {
            auto const threads = ScopedEnvironmentVariable { "QUARRY_WORKER_THREADS", "8" };
            CHECK(SqlConfiguration::FromEnvironment().workerThreads == 8);
        }

        for (auto const* invalid: { "0", "-3", "many", "4x" })
        {
            INFO(invalid);
            auto const threads = ScopedEnvironmentVariable { "QUARRY_WORKER_THREADS", invalid };
            CHECK(SqlConfiguration::FromEnvironment().workerThreads == 2);
        }
    }

    SECTION("flags")
    {
        {
            auto const trace = ScopedEnvironmentVariable { "QUARRY_TRACE_SQL", "0" };
            auto const strict = ScopedEnvironmentVariable { "QUARRY_STRICT_COLUMNS", "" };
            auto const config = SqlConfiguration::FromEnvironment();
            CHECK(!config.traceSql);
            CHECK(!config.strictColumns);
        }

        auto const trace = ScopedEnvironmentVariable { "QUARRY_TRACE_SQL", "1" };
        auto const strict = ScopedEnvironmentVariable { "QUARRY_STRICT_COLUMNS", "yes" };
        auto const config = SqlConfiguration::FromEnvironment();
        CHECK(config.traceSql);
        CHECK(config.strictColumns);
        CHECK(config.CollisionPolicy() == SqlColumnCollisionPolicy::Strict);
    }
}
