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
#include <ssz/core/bytes.hpp>
#include <ssz/core/config.hpp>

#include <cstdint>
#include <span>
#include <vector>

SSZ_MERKLE_NAMESPACE_BEGIN

// Depth of the smallest perfect binary tree with `leaf_count` leaves
unsigned tree_depth(uint64_t leaf_count) noexcept;

// Split into 32 byte chunks, zero padding the last one
std::vector<bytes32_t> pack_chunks(byte_string_view);

/**
 * Root of a tree of `depth` levels whose first leaves are `chunks` and
 * whose remaining leaves are zero chunks. The tree is only built up to the
 * depth the chunks need; the remaining levels are added with
 * extend_to_depth.
 */
bytes32_t merkleize_at_depth(std::span<bytes32_t const> chunks, unsigned depth);

// Root of `chunks` padded to `limit` chunks. `limit` must not be smaller
// than the number of chunks.
bytes32_t merkleize(std::span<bytes32_t const> chunks, uint64_t limit);

// Root of `bytes` packed into chunks and padded to `limit` chunks
bytes32_t merkleize_packed(byte_string_view bytes, uint64_t limit);

// Root of the tree `to_depth` levels deep whose leftmost subtree of depth
// `from_depth` has root `root` and whose other leaves are all zero
bytes32_t
extend_to_depth(bytes32_t root, unsigned from_depth, unsigned to_depth);

// `length` as a little endian 32 byte chunk
bytes32_t length_chunk(uint64_t length) noexcept;

// sha256(root || length_chunk(length))
bytes32_t mix_in_length(bytes32_t const &root, uint64_t length);

SSZ_MERKLE_NAMESPACE_END
