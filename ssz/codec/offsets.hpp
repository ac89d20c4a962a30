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

#include <ssz/codec/decode_error.hpp>
#include <ssz/core/byte_string.hpp>
#include <ssz/core/config.hpp>

#include <cstddef>
#include <optional>

SSZ_NAMESPACE_BEGIN

void encode_offset(size_t offset, byte_string &);

// Reads the offset at the front of `in`
DecodeResult<size_t> read_offset(byte_string_view in);

/**
 * Validate an offset read from a variable length section of `num_bytes`
 * bytes. The first offset of a section must point just past the fixed
 * portion; every later offset must not decrease and must not point past
 * the end.
 */
DecodeResult<size_t> sanitize_offset(
    size_t offset, std::optional<size_t> previous_offset, size_t num_bytes,
    std::optional<size_t> num_fixed_bytes);

SSZ_NAMESPACE_END
