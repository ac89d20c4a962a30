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

#include <ssz/core/bytes.hpp>
#include <ssz/core/config.hpp>
#include <ssz/core/result.hpp>
#include <ssz/merkle/gindex.hpp>

#include <cstdint>
#include <optional>
#include <vector>

SSZ_MERKLE_NAMESPACE_BEGIN

enum class ProofError : uint8_t
{
    // Zero, deeper than the tree, or below the length chunk of a list
    InvalidIndex,
};

char const *to_string(ProofError);

/**
 * The merkle tree of one sequence: its leaf chunks padded with zero chunks
 * to a perfect tree of `data_depth()` levels, with the length mixed in on
 * top when the sequence is a list.
 *
 * Subtree roots are computed on demand from the leaves. The siblings along
 * one path are disjoint subtrees, so a proof touches every real leaf at
 * most once.
 */
class MerkleTree
{
    std::vector<bytes32_t> leaves_;
    unsigned data_depth_;
    std::optional<uint64_t> length_;

    bool contains(gindex_t) const noexcept;

    // Node `index` of level `level` of the data tree, the root being level 0
    bytes32_t data_node(unsigned level, uint64_t index) const;

public:
    MerkleTree(
        std::vector<bytes32_t> leaves, uint64_t chunk_limit,
        std::optional<uint64_t> mixed_in_length = std::nullopt);

    unsigned data_depth() const noexcept
    {
        return data_depth_;
    }

    // Levels below the root, including the length mix-in
    unsigned depth() const noexcept
    {
        return data_depth_ + (length_.has_value() ? 1 : 0);
    }

    std::vector<bytes32_t> const &leaves() const noexcept
    {
        return leaves_;
    }

    bytes32_t root() const;

    Result<bytes32_t, ProofError> node(gindex_t) const;

    /**
     * Sibling roots from the node at `g` up to, but excluding, the root.
     * Hashing the node with each entry in turn, on the left when the
     * current gindex is odd and on the right when it is even, gives root().
     */
    Result<std::vector<bytes32_t>, ProofError> generate_proof(gindex_t g) const;
};

SSZ_MERKLE_NAMESPACE_END
