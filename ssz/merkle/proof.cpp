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
#include <ssz/core/bytes.hpp>
#include <ssz/core/config.hpp>
#include <ssz/core/result.hpp>
#include <ssz/merkle/gindex.hpp>
#include <ssz/merkle/merkleize.hpp>
#include <ssz/merkle/proof.hpp>
#include <ssz/merkle/zero_hash.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

SSZ_MERKLE_NAMESPACE_BEGIN

char const *to_string(ProofError const error)
{
    switch (error) {
    case ProofError::InvalidIndex:
        return "invalid index";
    }
    return "unknown proof error";
}

MerkleTree::MerkleTree(
    std::vector<bytes32_t> leaves, uint64_t const chunk_limit,
    std::optional<uint64_t> const mixed_in_length)
    : leaves_(std::move(leaves))
    , data_depth_{tree_depth(chunk_limit)}
    , length_{mixed_in_length}
{
    SSZ_ASSERT(leaves_.size() <= chunk_limit);
}

bool MerkleTree::contains(gindex_t const g) const noexcept
{
    if (g == 0) {
        return false;
    }
    unsigned const level = gindex_depth(g);
    if (level > depth()) {
        return false;
    }
    if (length_.has_value() && level >= 2) {
        // Nothing hangs below the length chunk at 3
        return (g >> (level - 1)) == 2;
    }
    return true;
}

bytes32_t
MerkleTree::data_node(unsigned const level, uint64_t const index) const
{
    SSZ_ASSERT(level <= data_depth_);
    unsigned const height = data_depth_ - level;
    if (height >= 64) {
        return merkleize_at_depth(leaves_, height);
    }
    uint64_t const width = uint64_t{1} << height;
    uint64_t const occupied =
        leaves_.size() / width + (leaves_.size() % width != 0 ? 1 : 0);
    if (index >= occupied) {
        return zero_hash(height);
    }
    uint64_t const first = index * width;
    uint64_t const count = std::min<uint64_t>(width, leaves_.size() - first);
    return merkleize_at_depth(
        std::span<bytes32_t const>{leaves_}.subspan(first, count), height);
}

bytes32_t MerkleTree::root() const
{
    bytes32_t const data_root = data_node(0, 0);
    if (length_.has_value()) {
        return mix_in_length(data_root, *length_);
    }
    return data_root;
}

Result<bytes32_t, ProofError> MerkleTree::node(gindex_t const g) const
{
    if (!contains(g)) {
        return ProofError::InvalidIndex;
    }
    unsigned const level = gindex_depth(g);
    if (!length_.has_value()) {
        return data_node(level, g - (uint64_t{1} << level));
    }
    if (g == 1) {
        return root();
    }
    if (g == 3) {
        return length_chunk(*length_);
    }
    // Below 2, drop the leading 10 of the path to index into the data tree
    return data_node(level - 1, g - (uint64_t{1} << level));
}

Result<std::vector<bytes32_t>, ProofError>
MerkleTree::generate_proof(gindex_t g) const
{
    if (!contains(g)) {
        return ProofError::InvalidIndex;
    }
    std::vector<bytes32_t> proof;
    proof.reserve(gindex_depth(g));
    for (; g > 1; g = parent(g)) {
        BOOST_OUTCOME_TRY(auto const sibling_root, node(sibling(g)));
        proof.push_back(sibling_root);
    }
    return proof;
}

SSZ_MERKLE_NAMESPACE_END
