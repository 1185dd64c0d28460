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

#include <gravity/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void gravity_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

#ifdef __cplusplus
}
#endif

// clang-format off
#define GRAVITY_ASSERT(expr)                                                     \
    (GRAVITY_LIKELY(!!(expr))                                                    \
         ? ((void)0)                                                             \
         : gravity_assertion_failed(                                             \
               #expr, __PRETTY_FUNCTION__, __FILE__, __LINE__, nullptr))

/// Same as GRAVITY_ASSERT, with a message that must be a compile-time
/// constant string
#define GRAVITY_ASSERT_MSG(expr, msg)                                            \
    (GRAVITY_LIKELY(!!(expr))                                                    \
         ? ((void)0)                                                             \
         : gravity_assertion_failed(                                             \
               #expr, __PRETTY_FUNCTION__, __FILE__, __LINE__, msg))

#ifdef NDEBUG
    #define GRAVITY_DEBUG_ASSERT(x)                                              \
        do {                                                                     \
            (void)sizeof(x); /* NOLINT: suppressing bugprone-sizeof-expression*/ \
        }                                                                        \
        while (0)
#else
    #define GRAVITY_DEBUG_ASSERT(x) GRAVITY_ASSERT(x)
#endif
// clang-format on
