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

#include <ssz/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

/**
 * Print a diagnostic for a failed assertion to stderr and abort the process.
 * `msg_format` may be null; otherwise it is a printf-style format for the
 * trailing arguments.
 */
[[noreturn]] void ssz_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg_format, ...)
    __attribute__((format(printf, 5, 6)));

#ifdef __cplusplus
}
#endif

#define SSZ_ASSERT(expr)                                                       \
    if (SSZ_LIKELY(expr)) {                                                    \
    }                                                                          \
    else {                                                                     \
        ssz_assertion_failed(                                                  \
            #expr, __PRETTY_FUNCTION__, __FILE__, __LINE__, nullptr);          \
    }

#define SSZ_ASSERT_PRINTF(expr, fmt, ...)                                      \
    if (SSZ_LIKELY(expr)) {                                                    \
    }                                                                          \
    else {                                                                     \
        ssz_assertion_failed(                                                  \
            #expr,                                                             \
            __PRETTY_FUNCTION__,                                               \
            __FILE__,                                                          \
            __LINE__,                                                          \
            fmt,                                                               \
            __VA_ARGS__);                                                      \
    }

#define SSZ_ABORT_PRINTF(fmt, ...)                                             \
    ssz_assertion_failed(                                                      \
        nullptr, __PRETTY_FUNCTION__, __FILE__, __LINE__, fmt, __VA_ARGS__)

#ifdef NDEBUG
    #define SSZ_DEBUG_ASSERT(expr)                                             \
        do {                                                                   \
            (void)sizeof(expr);                                                \
        }                                                                      \
        while (0)
#else
    #define SSZ_DEBUG_ASSERT(expr) SSZ_ASSERT(expr)
#endif
