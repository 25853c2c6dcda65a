// SPDX-License-Identifier: Apache-2.0

#include "SqlQueryFormatter.hpp"

#include <format>
#include <sstream>

namespace
{

class BasicSqlQueryFormatter: public SqlQueryFormatter
{
  public:
    explicit BasicSqlQueryFormatter(SqlDialect dialect):
        m_dialect { dialect }
    {
    }

    [[nodiscard]] SqlDialect const& Dialect() const noexcept override
    {
        return m_dialect;
    }

    [[nodiscard]] std::string SelectLimitOffset(std::optional<std::size_t> limit,
                                                std::optional<std::size_t> offset,
                                                bool /*hasOrderBy*/) const override
    {
        std::stringstream sqlQueryString;
        if (limit)
            sqlQueryString << " LIMIT " << *limit;
        else if (offset)
            sqlQueryString << UnboundedLimit();

        if (offset)
            sqlQueryString << " OFFSET " << *offset;
        return sqlQueryString.str();
    }

  protected:
    // SQLite requires a LIMIT clause in front of any OFFSET clause.
    [[nodiscard]] virtual std::string_view UnboundedLimit() const noexcept
    {
        return " LIMIT -1";
    }

  private:
    SqlDialect m_dialect;
};

class PostgreSqlFormatter final: public BasicSqlQueryFormatter
{
  public:
    explicit PostgreSqlFormatter(SqlDialect dialect = SqlDialects::PostgreSQL):
        BasicSqlQueryFormatter { dialect }
    {
    }

  protected:
    [[nodiscard]] std::string_view UnboundedLimit() const noexcept override
    {
        return "";
    }
};

class MySqlFormatter final: public BasicSqlQueryFormatter
{
  public:
    MySqlFormatter():
        BasicSqlQueryFormatter { SqlDialects::MySQL }
    {
    }

    [[nodiscard]] std::string StatementLimit(std::size_t limit) const override
    {
        return std::format(" LIMIT {}", limit);
    }

  protected:
    [[nodiscard]] std::string_view UnboundedLimit() const noexcept override
    {
        return " LIMIT 18446744073709551615";
    }
};

// OFFSET ... ROWS FETCH NEXT ... ROWS ONLY, as understood by SQL Server and Oracle.
class FetchNextSqlQueryFormatter: public BasicSqlQueryFormatter
{
  public:
    using BasicSqlQueryFormatter::BasicSqlQueryFormatter;

    [[nodiscard]] std::string SelectLimitOffset(std::optional<std::size_t> limit,
                                                std::optional<std::size_t> offset,
                                                bool hasOrderBy) const override
    {
        if (!limit && !offset)
            return {};

        std::stringstream sqlQueryString;
        if (!hasOrderBy && RequiresOrderBy())
            sqlQueryString << " ORDER BY (SELECT NULL)";
        sqlQueryString << " OFFSET " << offset.value_or(0) << " ROWS";
        if (limit)
            sqlQueryString << " FETCH NEXT " << *limit << " ROWS ONLY";
        return sqlQueryString.str();
    }

  protected:
    [[nodiscard]] virtual bool RequiresOrderBy() const noexcept = 0;
};

class SqlServerQueryFormatter final: public FetchNextSqlQueryFormatter
{
  public:
    SqlServerQueryFormatter():
        FetchNextSqlQueryFormatter { SqlDialects::SqlServer }
    {
    }

  protected:
    [[nodiscard]] bool RequiresOrderBy() const noexcept override
    {
        return true;
    }
};

class OracleSqlQueryFormatter final: public FetchNextSqlQueryFormatter
{
  public:
    OracleSqlQueryFormatter():
        FetchNextSqlQueryFormatter { SqlDialects::Oracle }
    {
    }

  protected:
    [[nodiscard]] bool RequiresOrderBy() const noexcept override
    {
        return false;
    }
};

} // namespace

std::string SqlQueryFormatter::QuoteIdentifier(std::string_view identifier) const
{
    auto const& dialect = Dialect();

    std::string quoted;
    quoted.reserve(identifier.size() + 2);
    quoted += dialect.quoteOpen;
    for (char const ch: identifier)
    {
        if (ch == dialect.quoteClose)
            quoted += ch;
        quoted += ch;
    }
    quoted += dialect.quoteClose;
    return quoted;
}

std::string SqlQueryFormatter::Placeholder(std::size_t position) const
{
    switch (Dialect().placeholderStyle)
    {
        case SqlPlaceholderStyle::Numbered:
            return std::format("${}", position);
        case SqlPlaceholderStyle::Sequential:
            break;
    }
    return "?";
}

std::string SqlQueryFormatter::StatementLimit(std::size_t /*limit*/) const
{
    return {};
}

SqlQueryFormatter const& SqlQueryFormatter::Sqlite()
{
    static const BasicSqlQueryFormatter formatter { SqlDialects::Sqlite };
    return formatter;
}

SqlQueryFormatter const& SqlQueryFormatter::SqlServer()
{
    static const SqlServerQueryFormatter formatter {};
    return formatter;
}

SqlQueryFormatter const& SqlQueryFormatter::PostgreSQL()
{
    static const PostgreSqlFormatter formatter {};
    return formatter;
}

SqlQueryFormatter const& SqlQueryFormatter::MySQL()
{
    static const MySqlFormatter formatter {};
    return formatter;
}

SqlQueryFormatter const& SqlQueryFormatter::OracleSQL()
{
    static const OracleSqlQueryFormatter formatter {};
    return formatter;
}

SqlQueryFormatter const* SqlQueryFormatter::Get(SqlServerType serverType) noexcept
{
    switch (serverType)
    {
        case SqlServerType::SQLITE:
            return &Sqlite();
        case SqlServerType::MICROSOFT_SQL:
            return &SqlServer();
        case SqlServerType::POSTGRESQL:
            return &PostgreSQL();
        case SqlServerType::ORACLE:
            return &OracleSQL();
        case SqlServerType::MYSQL:
            return &MySQL();
        case SqlServerType::UNKNOWN:
            break;
    }
    return nullptr;
}

SqlQueryFormatter const& SqlQueryFormatter::ForOdbc(SqlServerType serverType) noexcept
{
    if (serverType == SqlServerType::POSTGRESQL)
    {
        static const PostgreSqlFormatter formatter {
            SqlDialects::PostgreSQL.WithPlaceholderStyle(SqlPlaceholderStyle::Sequential)
        };
        return formatter;
    }
    if (auto const* formatter = Get(serverType); formatter)
        return *formatter;
    return Sqlite();
}
