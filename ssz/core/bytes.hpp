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

#include <ssz/core/byte_string.hpp>
#include <ssz/core/config.hpp>

#include <evmc/evmc.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>

SSZ_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

// Size of a merkle chunk and of every hash root
inline constexpr size_t BYTES_PER_CHUNK = sizeof(bytes32_t::bytes);

static_assert(BYTES_PER_CHUNK == 32);
static_assert(sizeof(bytes32_t) == BYTES_PER_CHUNK);
static_assert(alignof(bytes32_t) == 1);

inline byte_string_view to_byte_string_view(bytes32_t const &value) noexcept
{
    return byte_string_view{value.bytes, BYTES_PER_CHUNK};
}

// Left aligned copy of at most 32 bytes, zero padded on the right
inline bytes32_t to_bytes32(byte_string_view const data) noexcept
{
    bytes32_t ret{};
    std::memcpy(
        ret.bytes,
        data.data(),
        data.size() < BYTES_PER_CHUNK ? data.size() : BYTES_PER_CHUNK);
    return ret;
}

SSZ_NAMESPACE_END
