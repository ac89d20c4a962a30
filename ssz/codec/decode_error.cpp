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

#include <ssz/codec/decode_error.hpp>
#include <ssz/core/config.hpp>

#include <fmt/format.h>

#include <string>

SSZ_NAMESPACE_BEGIN

char const *to_string(DecodeErrorCode const code)
{
    switch (code) {
    case DecodeErrorCode::InvalidByteLength:
        return "invalid byte length";
    case DecodeErrorCode::InvalidLengthPrefix:
        return "invalid length prefix";
    case DecodeErrorCode::OutOfBoundsByte:
        return "out of bounds byte";
    case DecodeErrorCode::OffsetIntoFixedPortion:
        return "offset into fixed portion";
    case DecodeErrorCode::OffsetSkipsVariableBytes:
        return "offset skips variable bytes";
    case DecodeErrorCode::OffsetOutOfBounds:
        return "offset out of bounds";
    case DecodeErrorCode::OffsetsAreDecreasing:
        return "offsets are decreasing";
    case DecodeErrorCode::InvalidListFixedBytesLen:
        return "invalid list fixed bytes length";
    case DecodeErrorCode::ZeroLengthItem:
        return "zero length item";
    case DecodeErrorCode::BytesInvalid:
        return "bytes invalid";
    }
    return "unknown decode error";
}

std::string DecodeError::message() const
{
    switch (code) {
    case DecodeErrorCode::InvalidByteLength:
    case DecodeErrorCode::InvalidLengthPrefix:
        return fmt::format(
            "{}: got {} bytes, expected {}", to_string(code), value, expected);
    case DecodeErrorCode::OutOfBoundsByte:
    case DecodeErrorCode::OffsetIntoFixedPortion:
    case DecodeErrorCode::OffsetSkipsVariableBytes:
    case DecodeErrorCode::OffsetOutOfBounds:
    case DecodeErrorCode::OffsetsAreDecreasing:
    case DecodeErrorCode::InvalidListFixedBytesLen:
        return fmt::format("{}: {}", to_string(code), value);
    case DecodeErrorCode::ZeroLengthItem:
        return to_string(code);
    case DecodeErrorCode::BytesInvalid:
        return fmt::format("{}: {}", to_string(code), detail);
    }
    return to_string(code);
}

SSZ_NAMESPACE_END
