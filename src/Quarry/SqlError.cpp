// SPDX-License-Identifier: Apache-2.0

#include "DataBinder/SqlVariant.hpp"
#include "SqlError.hpp"
#include "SqlLogger.hpp"

#include <ranges>

SqlException::SqlException(SqlErrorInfo info, std::source_location sourceLocation):
    std::runtime_error(std::format("{}", info)),
    _info { std::move(info) }
{
    SqlLogger::GetLogger().OnError(_info, sourceLocation);
}

SqlQueryError::SqlQueryError(SqlQueryErrorCode code, std::string const& message, std::source_location sourceLocation):
    std::runtime_error(message),
    m_code { make_error_code(code) }
{
    SqlLogger::GetLogger().OnError(*this, sourceLocation);
}

SqlInvalidColumnError::SqlInvalidColumnError(std::string_view tableName,
                                             std::string_view columnName,
                                             std::source_location sourceLocation):
    SqlConstructionError { SqlQueryErrorCode::INVALID_COLUMN,
                           std::format(R"(InvalidColumn(table="{}", column="{}"))", tableName, columnName),
                           sourceLocation },
    m_tableName { tableName },
    m_columnName { columnName }
{
}

SqlInconsistentColumnsError::SqlInconsistentColumnsError(std::size_t rowIndex, std::source_location sourceLocation):
    SqlQueryError { SqlQueryErrorCode::INCONSISTENT_COLUMNS,
                    std::format("InconsistentColumns(row={})", rowIndex),
                    sourceLocation },
    m_rowIndex { rowIndex }
{
}

namespace
{

std::string FormatTypeMismatch(std::string_view column,
                               std::vector<SqlValueType> const& expected,
                               SqlValueType actual,
                               std::optional<std::size_t> rowIndex)
{
    std::string expectedText;
    for (auto const& [i, type]: expected | std::views::enumerate)
    {
        if (i != 0)
            expectedText += ',';
        expectedText += std::format("{}", type);
    }

    if (rowIndex.has_value())
        return std::format(R"(TypeMismatch(column="{}", expected={{{}}}, actual={}, row={}))",
                           column,
                           expectedText,
                           actual,
                           *rowIndex);

    return std::format(R"(TypeMismatch(column="{}", expected={{{}}}, actual={}))", column, expectedText, actual);
}

} // namespace

SqlTypeMismatchError::SqlTypeMismatchError(std::string column,
                                           std::vector<SqlValueType> expected,
                                           SqlValueType actual,
                                           std::optional<std::size_t> rowIndex,
                                           std::source_location sourceLocation):
    SqlQueryError { SqlQueryErrorCode::TYPE_MISMATCH,
                    FormatTypeMismatch(column, expected, actual, rowIndex),
                    sourceLocation },
    m_column { std::move(column) },
    m_expected { std::move(expected) },
    m_actual { actual },
    m_rowIndex { rowIndex }
{
}

SqlUnsupportedFeatureError::SqlUnsupportedFeatureError(std::string feature,
                                                       std::string dialect,
                                                       std::source_location sourceLocation):
    SqlQueryError { SqlQueryErrorCode::UNSUPPORTED_FEATURE,
                    std::format(R"(UnsupportedFeature("{}", dialect="{}"))", feature, dialect),
                    sourceLocation },
    m_feature { std::move(feature) },
    m_dialect { std::move(dialect) }
{
}

SqlAmbiguousColumnError::SqlAmbiguousColumnError(std::string_view key, std::source_location sourceLocation):
    SqlQueryError { SqlQueryErrorCode::AMBIGUOUS_COLUMN,
                    std::format(R"(AmbiguousColumn("{}"))", key),
                    sourceLocation }
{
}
