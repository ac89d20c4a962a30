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
#include <ssz/core/result.hpp>

#include <cstdint>
#include <string>
#include <utility>

SSZ_NAMESPACE_BEGIN

enum class DecodeErrorCode : uint8_t
{
    InvalidByteLength,
    InvalidLengthPrefix,
    OutOfBoundsByte,
    OffsetIntoFixedPortion,
    OffsetSkipsVariableBytes,
    OffsetOutOfBounds,
    OffsetsAreDecreasing,
    InvalidListFixedBytesLen,
    ZeroLengthItem,
    BytesInvalid,
};

char const *to_string(DecodeErrorCode);

/**
 * `value` and `expected` depend on the code: the received and expected
 * lengths for the length errors, the offending offset for the offset errors.
 * `detail` is only set for BytesInvalid.
 */
struct DecodeError
{
    DecodeErrorCode code{DecodeErrorCode::BytesInvalid};
    uint64_t value{0};
    uint64_t expected{0};
    std::string detail{};

    friend bool operator==(DecodeError const &, DecodeError const &) = default;

    static DecodeError
    invalid_byte_length(uint64_t const len, uint64_t const expected)
    {
        return {DecodeErrorCode::InvalidByteLength, len, expected, {}};
    }

    static DecodeError
    invalid_length_prefix(uint64_t const len, uint64_t const expected)
    {
        return {DecodeErrorCode::InvalidLengthPrefix, len, expected, {}};
    }

    static DecodeError offset(DecodeErrorCode const code, uint64_t const offset)
    {
        return {code, offset, 0, {}};
    }

    static DecodeError bytes_invalid(std::string detail)
    {
        return {DecodeErrorCode::BytesInvalid, 0, 0, std::move(detail)};
    }

    std::string message() const;
};

template <class T>
using DecodeResult = Result<T, DecodeError>;

SSZ_NAMESPACE_END
