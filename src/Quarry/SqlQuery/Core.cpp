// SPDX-License-Identifier: Apache-2.0

#include "Core.hpp"

#include <cctype>

std::size_t SqlCompiledQuery::PlaceholderCount() const noexcept
{
    std::size_t count = 0;
    char quote = '\0';

    for (std::size_t i = 0; i < sql.size(); ++i)
    {
        char const ch = sql[i];
        if (quote != '\0')
        {
            if (ch == quote)
                quote = '\0';
            continue;
        }

        switch (ch)
        {
            case '"':
            case '`':
            case '\'':
                quote = ch;
                break;
            case '[':
                quote = ']';
                break;
            case '?':
                ++count;
                break;
            case '$':
                if (i + 1 < sql.size() && std::isdigit(static_cast<unsigned char>(sql[i + 1])))
                    ++count;
                break;
            default:
                break;
        }
    }
    return count;
}
