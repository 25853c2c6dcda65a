// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Core.hpp"

#include <algorithm>
#include <string_view>
#include <utility>

// SqlDataBinder<> specialization for ANSI character strings
template <typename AnsiStringType>
    requires SqlBasicStringBinderConcept<AnsiStringType, char>
struct SqlDataBinder<AnsiStringType>
{
    using ValueType = AnsiStringType;
    using CharType = typename AnsiStringType::value_type;
    using StringTraits = SqlBasicStringOperations<AnsiStringType>;

    static SQLRETURN InputParameter(SQLHSTMT stmt,
                                    SQLUSMALLINT column,
                                    AnsiStringType const& value,
                                    SqlDataBinderCallback& /*cb*/) noexcept
    {
        return SQLBindParameter(stmt,
                                column,
                                SQL_PARAM_INPUT,
                                SQL_C_CHAR,
                                SQL_VARCHAR,
                                (std::max)(StringTraits::Size(&value), SQLULEN { 1 }),
                                0,
                                (SQLPOINTER) StringTraits::Data(&value),
                                (SQLLEN) StringTraits::Size(&value),
                                nullptr);
    }

    static SQLRETURN GetColumn(SQLHSTMT stmt,
                               SQLUSMALLINT column,
                               AnsiStringType* result,
                               SQLLEN* indicator,
                               SqlDataBinderCallback const& /*cb*/) noexcept
    {
        StringTraits::Reserve(result, 15);
        size_t writeIndex = 0;
        *indicator = 0;
        while (true)
        {
            auto* const bufferStart = StringTraits::Data(result) + writeIndex;
            size_t const bufferSize = StringTraits::Size(result) - writeIndex;
            SQLRETURN const rv = SQLGetData(stmt, column, SQL_C_CHAR, bufferStart, (SQLLEN) bufferSize, indicator);
            switch (rv)
            {
                case SQL_SUCCESS:
                case SQL_NO_DATA:
                    // last successive call
                    if (*indicator == SQL_NULL_DATA)
                        StringTraits::Clear(result);
                    else
                    {
                        StringTraits::Resize(result, (SQLLEN) writeIndex + *indicator);
                        *indicator = (SQLLEN) StringTraits::Size(result);
                    }
                    return SQL_SUCCESS;
                case SQL_SUCCESS_WITH_INFO: {
                    // more data pending
                    if (*indicator == SQL_NO_TOTAL)
                    {
                        // The server does not know how much data is left.
                        writeIndex += bufferSize - 1;
                        StringTraits::Resize(result, (SQLLEN) ((2 * writeIndex) + 1));
                    }
                    else if (std::cmp_greater_equal(*indicator, bufferSize))
                    {
                        // The server knows how much data is left.
                        writeIndex += bufferSize - 1;
                        StringTraits::Resize(result, (SQLLEN) writeIndex + *indicator + 1);
                    }
                    else
                    {
                        StringTraits::Resize(result, (SQLLEN) writeIndex + *indicator);
                        return SQL_SUCCESS;
                    }
                    break;
                }
                default:
                    return rv;
            }
        }
    }

    static QUARRY_FORCE_INLINE std::string_view Inspect(AnsiStringType const& value) noexcept
    {
        return { StringTraits::Data(&value), StringTraits::Size(&value) };
    }
};
