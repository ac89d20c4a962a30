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

#include <ssz/container/length_error.hpp>
#include <ssz/core/config.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <vector>

SSZ_NAMESPACE_BEGIN

// Ceiling on the up-front allocation when building from an iterator. The
// declared capacity and the iterator's size are both untrusted.
inline constexpr uint64_t MAX_ELEMENTS_TO_PRE_ALLOCATE = 128 * 1024;

constexpr uint64_t
preallocation_size(uint64_t const capacity, uint64_t const hint) noexcept
{
    return std::min({MAX_ELEMENTS_TO_PRE_ALLOCATE, capacity, hint});
}

/**
 * Collect `[first, last)` into a vector of at most `limit` elements. Fails
 * with `LengthError::Kind::Exceeded` as soon as element `limit + 1` is
 * seen, without consuming the rest of the input.
 */
template <class T, std::input_iterator It, std::sentinel_for<It> S>
LengthResult<std::vector<T>>
collect_bounded(It first, S const last, uint64_t const limit)
{
    uint64_t hint = 0;
    if constexpr (std::sized_sentinel_for<S, It>) {
        auto const distance = std::ranges::distance(first, last);
        hint = distance > 0 ? static_cast<uint64_t>(distance) : 0;
    }

    std::vector<T> out;
    out.reserve(static_cast<size_t>(preallocation_size(limit, hint)));
    for (; first != last; ++first) {
        if (out.size() >= limit) {
            return LengthError{
                LengthError::Kind::Exceeded, out.size() + uint64_t{1}, limit};
        }
        out.push_back(*first);
    }
    return out;
}

SSZ_NAMESPACE_END
