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

#include <ssz/core/assert.h>
#include <ssz/core/byte_string.hpp>
#include <ssz/core/bytes.hpp>
#include <ssz/core/config.hpp>
#include <ssz/merkle/hasher.hpp>
#include <ssz/merkle/merkleize.hpp>
#include <ssz/merkle/zero_hash.hpp>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

SSZ_MERKLE_NAMESPACE_BEGIN

unsigned tree_depth(uint64_t const leaf_count) noexcept
{
    if (leaf_count <= 1) {
        return 0;
    }
    return static_cast<unsigned>(std::bit_width(leaf_count - 1));
}

std::vector<bytes32_t> pack_chunks(byte_string_view bytes)
{
    std::vector<bytes32_t> chunks;
    chunks.reserve((bytes.size() + BYTES_PER_CHUNK - 1) / BYTES_PER_CHUNK);
    while (!bytes.empty()) {
        chunks.push_back(to_bytes32(bytes));
        bytes.remove_prefix(
            bytes.size() < BYTES_PER_CHUNK ? bytes.size() : BYTES_PER_CHUNK);
    }
    return chunks;
}

bytes32_t merkleize_at_depth(
    std::span<bytes32_t const> const chunks, unsigned const depth)
{
    SSZ_ASSERT(depth <= MAX_TREE_DEPTH);
    if (chunks.empty()) {
        return zero_hash(depth);
    }
    unsigned const data_depth = tree_depth(chunks.size());
    SSZ_ASSERT(data_depth <= depth);

    // Reduce one level at a time; a missing right sibling is the zero
    // subtree of the current height
    std::vector<bytes32_t> layer(chunks.begin(), chunks.end());
    for (unsigned height = 0; height < data_depth; ++height) {
        size_t const n = layer.size();
        size_t const parents = (n + 1) / 2;
        for (size_t i = 0; i < parents; ++i) {
            bytes32_t const &right =
                2 * i + 1 < n ? layer[2 * i + 1] : zero_hash(height);
            layer[i] = hash_pair(layer[2 * i], right);
        }
        layer.resize(parents);
    }
    SSZ_ASSERT(layer.size() == 1);
    return extend_to_depth(layer.front(), data_depth, depth);
}

bytes32_t
merkleize(std::span<bytes32_t const> const chunks, uint64_t const limit)
{
    SSZ_ASSERT(chunks.size() <= limit);
    return merkleize_at_depth(chunks, tree_depth(limit));
}

bytes32_t merkleize_packed(byte_string_view const bytes, uint64_t const limit)
{
    auto const chunks = pack_chunks(bytes);
    return merkleize(chunks, limit);
}

bytes32_t extend_to_depth(
    bytes32_t root, unsigned const from_depth, unsigned const to_depth)
{
    SSZ_ASSERT(from_depth <= to_depth && to_depth <= MAX_TREE_DEPTH);
    for (unsigned depth = from_depth; depth < to_depth; ++depth) {
        root = hash_pair(root, zero_hash(depth));
    }
    return root;
}

bytes32_t length_chunk(uint64_t const length) noexcept
{
    bytes32_t chunk{};
    for (size_t i = 0; i < sizeof(length); ++i) {
        chunk.bytes[i] = static_cast<uint8_t>(length >> (8 * i));
    }
    return chunk;
}

bytes32_t mix_in_length(bytes32_t const &root, uint64_t const length)
{
    return hash_pair(root, length_chunk(length));
}

SSZ_MERKLE_NAMESPACE_END
