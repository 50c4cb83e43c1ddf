// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <accrual/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void accrual_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

#define ACCRUAL_ASSERTION_FAILED_WITH_MSG(expr, msg)                           \
    /* msg must be a string literal so reporting never dereferences an */      \
    /* arbitrary pointer while the process is already failing */              \
    static_assert(__builtin_constant_p(msg));                                  \
    accrual_assertion_failed(                                                  \
        #expr, __extension__ __PRETTY_FUNCTION__, __FILE__, __LINE__, msg);

#define ACCRUAL_ASSERT(expr, ...)                                              \
    if (ACCRUAL_LIKELY(expr)) { /* likeliest */                                \
    }                                                                          \
    else {                                                                     \
        __VA_OPT__(ACCRUAL_ASSERTION_FAILED_WITH_MSG(#expr, __VA_ARGS__);)     \
        __VA_OPT__(__builtin_unreachable();)                                   \
        accrual_assertion_failed(                                              \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__,                                                          \
            nullptr);                                                          \
    }

#define ACCRUAL_ABORT(...)                                                     \
    __VA_OPT__(ACCRUAL_ASSERTION_FAILED_WITH_MSG(nullptr, __VA_ARGS__);)       \
    __VA_OPT__(__builtin_unreachable();)                                       \
    accrual_assertion_failed(                                                  \
        nullptr,                                                               \
        __extension__ __PRETTY_FUNCTION__,                                     \
        __FILE__,                                                              \
        __LINE__,                                                              \
        nullptr);

#ifdef NDEBUG
    #define ACCRUAL_DEBUG_ASSERT(x)                                            \
        do {                                                                   \
            (void)sizeof(x);                                                   \
        }                                                                      \
        while (0)
#else
    #define ACCRUAL_DEBUG_ASSERT(x) ACCRUAL_ASSERT(x)
#endif

#ifdef __cplusplus
}
#endif
