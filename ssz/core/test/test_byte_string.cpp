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

#include <ssz/core/byte_string.hpp>
#include <ssz/core/bytes.hpp>
#include <ssz/core/fmt/bytes_fmt.hpp>

#include <evmc/evmc.hpp>

#include <fmt/format.h>

#include <gtest/gtest.h>

#include <cstdint>

using namespace ssz;
using namespace evmc::literals;

TEST(byte_string, little_endian)
{
    byte_string out;
    append_little_endian(out, uint16_t{0x0102});
    append_little_endian(out, uint32_t{0x03040506});
    EXPECT_EQ(
        out, (byte_string{0x02, 0x01, 0x06, 0x05, 0x04, 0x03}));
    EXPECT_EQ(load_little_endian<uint16_t>(out), 0x0102);
    EXPECT_EQ(
        load_little_endian<uint32_t>(byte_string_view{out}.substr(2)),
        0x03040506);
    EXPECT_EQ(
        load_little_endian<uint64_t>(
            byte_string{1, 0, 0, 0, 0, 0, 0, 0x80}),
        0x8000000000000001);
}

// Chunks built from short byte strings are left aligned, unlike literals
TEST(bytes32, to_bytes32)
{
    auto const chunk = to_bytes32(byte_string{0xab, 0xcd});
    EXPECT_EQ(chunk.bytes[0], 0xab);
    EXPECT_EQ(chunk.bytes[1], 0xcd);
    EXPECT_EQ(chunk.bytes[31], 0);
    EXPECT_EQ(
        chunk,
        0xabcd000000000000000000000000000000000000000000000000000000000000_bytes32);

    byte_string const long_input(40, 0x11);
    EXPECT_EQ(
        to_byte_string_view(to_bytes32(long_input)),
        byte_string_view{long_input}.substr(0, BYTES_PER_CHUNK));
}

TEST(bytes32, literal_is_right_aligned)
{
    constexpr auto full =
        0x0102030405060708091011121314151617181920212223242526272829303132_bytes32;
    EXPECT_EQ(full.bytes[0], 0x01);
    EXPECT_EQ(full.bytes[31], 0x32);

    constexpr auto short_value = 0xabcd_bytes32;
    EXPECT_EQ(short_value.bytes[30], 0xab);
    EXPECT_EQ(short_value.bytes[31], 0xcd);
    EXPECT_EQ(short_value.bytes[0], 0);
}

TEST(bytes32, format)
{
    bytes32_t value{};
    value.bytes[0] = 0xde;
    value.bytes[31] = 0x01;
    EXPECT_EQ(
        fmt::format("{}", value),
        "0xde00000000000000000000000000000000000000000000000000000000000001");
}
