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

#include <ssz/core/assert.h>

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

extern char const *__progname; // NOLINT(bugprone-reserved-identifier)

namespace
{
    void write_stderr(char const *buffer, int written) noexcept
    {
        if (written <= 0) {
            return;
        }
        if (write(STDERR_FILENO, buffer, static_cast<size_t>(written)) == -1) {
            // Suppress warning
        }
    }
}

extern "C" void ssz_assertion_failed(
    char const *const expr, char const *const function, char const *const file,
    long const line, char const *const msg_format, ...)
{
    char buffer[4096];
    int written = 0;

    if (expr != nullptr) {
        written = snprintf(
            buffer,
            sizeof(buffer),
            "%s: %s:%ld: %s: Assertion '%s' failed.\n",
            __progname,
            file,
            line,
            function,
            expr);
    }
    else {
        written = snprintf(
            buffer,
            sizeof(buffer),
            "%s: %s:%ld: %s: Aborted.\n",
            __progname,
            file,
            line,
            function);
    }
    if (written >= static_cast<int>(sizeof(buffer))) {
        written = static_cast<int>(sizeof(buffer)) - 1;
    }
    write_stderr(buffer, written);

    if (msg_format != nullptr) {
        va_list args;
        va_start(args, msg_format);
        written = vsnprintf(buffer, sizeof(buffer) - 1, msg_format, args);
        va_end(args);
        if (written >= static_cast<int>(sizeof(buffer)) - 1) {
            written = static_cast<int>(sizeof(buffer)) - 2;
        }
        if (written >= 0) {
            buffer[written++] = '\n';
        }
        write_stderr(buffer, written);
    }

    abort();
}
