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
#include <ssz/codec/offsets.hpp>
#include <ssz/core/assert.h>
#include <ssz/core/byte_string.hpp>
#include <ssz/core/config.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

SSZ_NAMESPACE_BEGIN

void encode_offset(size_t const offset, byte_string &out)
{
    SSZ_ASSERT(offset <= std::numeric_limits<uint32_t>::max());
    append_little_endian(out, static_cast<uint32_t>(offset));
}

DecodeResult<size_t> read_offset(byte_string_view const in)
{
    if (in.size() < BYTES_PER_LENGTH_OFFSET) {
        return DecodeError::invalid_length_prefix(
            in.size(), BYTES_PER_LENGTH_OFFSET);
    }
    return static_cast<size_t>(load_little_endian<uint32_t>(in));
}

DecodeResult<size_t> sanitize_offset(
    size_t const offset, std::optional<size_t> const previous_offset,
    size_t const num_bytes, std::optional<size_t> const num_fixed_bytes)
{
    if (num_fixed_bytes.has_value() && offset < *num_fixed_bytes) {
        return DecodeError::offset(
            DecodeErrorCode::OffsetIntoFixedPortion, offset);
    }
    if (!previous_offset.has_value() && num_fixed_bytes.has_value() &&
        offset != *num_fixed_bytes) {
        return DecodeError::offset(
            DecodeErrorCode::OffsetSkipsVariableBytes, offset);
    }
    if (offset > num_bytes) {
        return DecodeError::offset(DecodeErrorCode::OffsetOutOfBounds, offset);
    }
    if (previous_offset.has_value() && *previous_offset > offset) {
        return DecodeError::offset(
            DecodeErrorCode::OffsetsAreDecreasing, offset);
    }
    return offset;
}

SSZ_NAMESPACE_END
