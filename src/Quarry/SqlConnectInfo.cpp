// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"
#include "SqlConnection.hpp"
#include "SqlLogger.hpp"
#include "SqlResult.hpp"
#include "Utils.hpp"

#include <charconv>
#include <cstdlib>
#include <iterator>
#include <ranges>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

namespace
{

constexpr std::string_view DropQuotation(std::string_view value) noexcept
{
    if (!value.empty() && value.front() == '{' && value.back() == '}')
    {
        value.remove_prefix(1);
        value.remove_suffix(1);
    }
    return value;
}

std::string_view GetEnvironment(char const* name)
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    if (auto const* s = std::getenv(name); s && *s)
        return s;
    return {};
}

bool IsEnabled(std::string_view value) noexcept
{
    return !value.empty() && value != "0";
}

} // end namespace

std::string SqlConnectionString::Sanitized() const
{
    return SanitizePwd(value);
}

std::string SqlConnectionString::SanitizePwd(std::string_view input)
{
    std::regex const pwdRegex {
        R"(PWD=.*?(;|$))",
        std::regex_constants::ECMAScript | std::regex_constants::icase,
    };
    std::stringstream outputString;
    std::regex_replace(
        std::ostreambuf_iterator<char> { outputString }, input.begin(), input.end(), pwdRegex, "Pwd=***$1");
    return outputString.str();
}

SqlConnectionStringMap ParseConnectionString(SqlConnectionString const& connectionString)
{
    auto pairs = connectionString.value | std::views::split(';') | std::views::transform([](auto pair_view) {
                     return std::string_view(pair_view.begin(), pair_view.end());
                 });

    SqlConnectionStringMap result;

    for (auto const& pair: pairs)
    {
        auto separatorPosition = pair.find('=');
        if (separatorPosition != std::string_view::npos)
        {
            auto const key = detail::Trim(pair.substr(0, separatorPosition));
            auto const value = DropQuotation(detail::Trim(pair.substr(separatorPosition + 1)));
            result.insert_or_assign(detail::ToUpperCaseString(key), std::string(value));
        }
    }

    return result;
}

SqlConnectionString BuildConnectionString(SqlConnectionStringMap const& map)
{
    SqlConnectionString result;

    for (auto const& [key, value]: map)
    {
        std::string_view const delimiter = result.value.empty() ? "" : ";";
        result.value += std::format("{}{}={{{}}}", delimiter, key, value);
    }

    return result;
}

SqlConfiguration SqlConfiguration::FromEnvironment()
{
    auto config = SqlConfiguration {};

    if (auto const s = GetEnvironment("QUARRY_CONNECTION_STRING"); !s.empty())
        config.connectionString = SqlConnectionString { std::string(s) };
    else if (auto const s = GetEnvironment("ODBC_CONNECTION_STRING"); !s.empty())
        config.connectionString = SqlConnectionString { std::string(s) };

    if (auto const s = GetEnvironment("QUARRY_WORKER_THREADS"); !s.empty())
    {
        std::size_t threads {};
        auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), threads);
        if (ec == std::errc {} && ptr == s.data() + s.size() && threads > 0)
            config.workerThreads = threads;
        else
            SqlLogger::GetLogger().OnWarning(std::format("Ignoring invalid QUARRY_WORKER_THREADS value: {}", s));
    }

    config.traceSql = IsEnabled(GetEnvironment("QUARRY_TRACE_SQL"));
    config.strictColumns = IsEnabled(GetEnvironment("QUARRY_STRICT_COLUMNS"));

    return config;
}

void SqlConfiguration::Apply() const
{
    SqlConnection::SetDefaultConnectionString(connectionString);
    if (traceSql)
        SqlLogger::SetLogger(SqlLogger::TraceLogger());
}

SqlColumnCollisionPolicy SqlConfiguration::CollisionPolicy() const noexcept
{
    return strictColumns ? SqlColumnCollisionPolicy::Strict : SqlColumnCollisionPolicy::LastWins;
}
