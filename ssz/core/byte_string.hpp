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

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>

SSZ_NAMESPACE_BEGIN

using byte_string = std::basic_string<unsigned char>;

using byte_string_view = std::basic_string_view<unsigned char>;

// Append the little endian encoding of `num`
constexpr void
append_little_endian(byte_string &out, std::unsigned_integral auto num)
{
    for (size_t i = 0; i < sizeof(num); ++i) {
        out.push_back(static_cast<unsigned char>(num & 0xff));
        if constexpr (sizeof(num) > 1) {
            num >>= 8;
        }
    }
}

// `in` must hold at least sizeof(T) bytes
template <std::unsigned_integral T>
constexpr T load_little_endian(byte_string_view const in)
{
    T num = 0;
    for (size_t i = sizeof(T); i-- > 0;) {
        if constexpr (sizeof(T) > 1) {
            num = static_cast<T>(num << 8);
        }
        num = static_cast<T>(num | in[i]);
    }
    return num;
}

SSZ_NAMESPACE_END
