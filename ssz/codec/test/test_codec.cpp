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

#include <ssz/codec/codec.hpp>
#include <ssz/codec/decode_error.hpp>
#include <ssz/core/byte_string.hpp>
#include <ssz/core/bytes.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace ssz;

TEST(codec, unsigned_integers)
{
    EXPECT_EQ(encode(uint8_t{0xab}), (byte_string{0xab}));
    EXPECT_EQ(encode(uint16_t{0x0102}), (byte_string{0x02, 0x01}));
    EXPECT_EQ(
        encode(uint64_t{0x0102030405060708}),
        (byte_string{8, 7, 6, 5, 4, 3, 2, 1}));

    auto const value = decode<uint32_t>(byte_string{4, 3, 2, 1});
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 0x01020304);

    auto const short_input = decode<uint32_t>(byte_string{4, 3, 2});
    ASSERT_TRUE(short_input.has_error());
    EXPECT_EQ(short_input.error(), DecodeError::invalid_byte_length(3, 4));
}

TEST(codec, bool)
{
    EXPECT_EQ(encode(true), (byte_string{1}));
    EXPECT_EQ(encode(false), (byte_string{0}));
    EXPECT_TRUE(decode<bool>(byte_string{1}).value());
    EXPECT_FALSE(decode<bool>(byte_string{0}).value());

    auto const bad = decode<bool>(byte_string{2});
    ASSERT_TRUE(bad.has_error());
    EXPECT_EQ(bad.error().code, DecodeErrorCode::BytesInvalid);
}

TEST(codec, bytes32)
{
    bytes32_t value{};
    value.bytes[0] = 1;
    value.bytes[31] = 2;
    auto const bytes = encode(value);
    ASSERT_EQ(bytes.size(), 32);
    EXPECT_EQ(bytes[0], 1);
    EXPECT_EQ(bytes[31], 2);
    EXPECT_EQ(decode<bytes32_t>(bytes).value(), value);
    EXPECT_TRUE(decode<bytes32_t>(byte_string{1, 2}).has_error());
}
