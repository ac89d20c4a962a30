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
#include <ssz/core/config.hpp>
#include <ssz/core/length_guard.hpp>
#include <ssz/core/likely.h>

#include <quill/Quill.h>

#include <cinttypes>
#include <cstddef>
#include <cstdint>

SSZ_NAMESPACE_BEGIN

size_t LengthGuard::to_native(uint64_t const n) const
{
    if (SSZ_LIKELY(fits(n))) {
        return static_cast<size_t>(n);
    }
    if (policy_ == LengthOverflowPolicy::Saturate) {
        LOG_WARNING(
            "capacity {} exceeds native maximum {}, clamping", n, native_max_);
        return static_cast<size_t>(native_max_);
    }
    SSZ_ABORT_PRINTF(
        "capacity overflow: requested %" PRIu64 " exceeds native maximum "
        "%" PRIu64,
        n,
        native_max_);
}

size_t safe_len(uint64_t const n)
{
    static constexpr LengthGuard guard{};
    return guard.to_native(n);
}

SSZ_NAMESPACE_END
