// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "BasicStringBinder.hpp"
#include "Core.hpp"

#include <string>

// Specialized traits for std::string as output string parameter
template <>
struct SqlBasicStringOperations<std::string>
{
    using CharType = char;
    using StringType = std::string;

    static QUARRY_FORCE_INLINE CharType const* Data(StringType const* str) noexcept
    {
        return str->data();
    }

    static QUARRY_FORCE_INLINE CharType* Data(StringType* str) noexcept
    {
        return str->data();
    }

    static QUARRY_FORCE_INLINE SQLULEN Size(StringType const* str) noexcept
    {
        return str->size();
    }

    static QUARRY_FORCE_INLINE void Clear(StringType* str) noexcept
    {
        str->clear();
    }

    static QUARRY_FORCE_INLINE void Reserve(StringType* str, size_t capacity) noexcept
    {
        // std::string tries to defer the allocation as long as possible.
        // So we first tell it how much to reserve and then resize it to the *actually* reserved size.
        str->reserve(capacity);
        str->resize(str->capacity());
    }

    static QUARRY_FORCE_INLINE void Resize(StringType* str, SQLLEN indicator) noexcept
    {
        if (indicator >= 0)
            str->resize(static_cast<size_t>(indicator));
    }
};
