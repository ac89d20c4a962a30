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

#include <ssz/container/fixed_vector.hpp>
#include <ssz/container/optional.hpp>
#include <ssz/container/runtime_fixed_vector.hpp>
#include <ssz/container/runtime_variable_list.hpp>
#include <ssz/container/variable_list.hpp>
#include <ssz/core/bytes.hpp>
#include <ssz/core/config.hpp>
#include <ssz/merkle/merkleize.hpp>
#include <ssz/merkle/proof.hpp>
#include <ssz/merkle/tree_hash.hpp>
#include <ssz/merkle/zero_hash.hpp>

#include <cstdint>
#include <span>
#include <vector>

SSZ_MERKLE_NAMESPACE_BEGIN

// Vectors are sized by their length and never mix it in; lists are sized
// by their maximum and mix in their current length.

template <TreeHashable T, uint64_t N>
struct TreeHash<FixedVector<T, N>>
{
    static constexpr TreeHashKind kind = TreeHashKind::Composite;

    static bytes32_t root(FixedVector<T, N> const &value)
    {
        return vec_tree_hash_root(value.as_span(), N);
    }
};

template <TreeHashable T, uint64_t N>
struct TreeHash<VariableList<T, N>>
{
    static constexpr TreeHashKind kind = TreeHashKind::Composite;

    static bytes32_t root(VariableList<T, N> const &value)
    {
        return mix_in_length(
            vec_tree_hash_root(value.as_span(), N), value.size());
    }
};

template <TreeHashable T>
struct TreeHash<RuntimeFixedVector<T>>
{
    static constexpr TreeHashKind kind = TreeHashKind::Composite;

    static bytes32_t root(RuntimeFixedVector<T> const &value)
    {
        return vec_tree_hash_root(value.as_span(), value.len());
    }
};

template <TreeHashable T>
struct TreeHash<RuntimeVariableList<T>>
{
    static constexpr TreeHashKind kind = TreeHashKind::Composite;

    static bytes32_t root(RuntimeVariableList<T> const &value)
    {
        return mix_in_length(
            vec_tree_hash_root(value.as_span(), value.max_len()),
            value.size());
    }
};

// Hashed as a list with room for one value
template <TreeHashable T>
struct TreeHash<Optional<T>>
{
    static constexpr TreeHashKind kind = TreeHashKind::Composite;

    static bytes32_t root(Optional<T> const &value)
    {
        if (!value.has_value()) {
            return mix_in_length(zero_hash(0), 0);
        }
        return mix_in_length(TreeHash<T>::root(*value), 1);
    }
};

template <TreeHashable T, uint64_t N>
MerkleTree merkle_tree(FixedVector<T, N> const &value)
{
    return MerkleTree{vec_chunks(value.as_span()), chunk_count<T>(N)};
}

template <TreeHashable T, uint64_t N>
MerkleTree merkle_tree(VariableList<T, N> const &value)
{
    return MerkleTree{
        vec_chunks(value.as_span()), chunk_count<T>(N), value.size()};
}

template <TreeHashable T>
MerkleTree merkle_tree(RuntimeFixedVector<T> const &value)
{
    return MerkleTree{
        vec_chunks(value.as_span()), chunk_count<T>(value.len())};
}

template <TreeHashable T>
MerkleTree merkle_tree(RuntimeVariableList<T> const &value)
{
    return MerkleTree{
        vec_chunks(value.as_span()),
        chunk_count<T>(value.max_len()),
        value.size()};
}

SSZ_MERKLE_NAMESPACE_END
