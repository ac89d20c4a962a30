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

#include <ssz/core/config.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>

SSZ_NAMESPACE_BEGIN

/**
 * What to do when a declared capacity does not fit in `size_t`.
 *
 * Abort: print the requested value and the native maximum, then abort.
 * Saturate: clamp to the native maximum and log a warning. A container that
 * really needs more elements than that fails at allocation instead.
 */
enum class LengthOverflowPolicy : uint8_t
{
    Abort,
    Saturate,
};

#if defined(SSZ_CAP_LENGTH_OVERFLOW) && SSZ_CAP_LENGTH_OVERFLOW
inline constexpr LengthOverflowPolicy length_overflow_policy =
    LengthOverflowPolicy::Saturate;
#else
inline constexpr LengthOverflowPolicy length_overflow_policy =
    LengthOverflowPolicy::Abort;
#endif

class LengthGuard
{
    uint64_t native_max_;
    LengthOverflowPolicy policy_;

public:
    constexpr explicit LengthGuard(
        LengthOverflowPolicy const policy = length_overflow_policy,
        uint64_t const native_max = std::numeric_limits<size_t>::max())
        : native_max_{native_max}
        , policy_{policy}
    {
    }

    constexpr uint64_t native_max() const noexcept
    {
        return native_max_;
    }

    constexpr LengthOverflowPolicy policy() const noexcept
    {
        return policy_;
    }

    constexpr bool fits(uint64_t const n) const noexcept
    {
        return n <= native_max_;
    }

    size_t to_native(uint64_t n) const;
};

// Convert a capacity to a native count under the build's policy
size_t safe_len(uint64_t n);

SSZ_NAMESPACE_END
