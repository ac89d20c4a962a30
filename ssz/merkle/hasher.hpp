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

#include <concepts>
#include <cstddef>

SSZ_MERKLE_NAMESPACE_BEGIN

// Hash output size for all merkle hasher traits
inline constexpr unsigned HASH_SIZE = 32;

template <typename T>
concept MerkleHasher =
    requires(unsigned char const *in, size_t len, unsigned char *out) {
        { T::hash(in, len, out) } -> std::same_as<void>;
    };

struct Sha256Hasher
{
    static void hash(unsigned char const *in, size_t len, unsigned char *out);
};

static_assert(MerkleHasher<Sha256Hasher>);
static_assert(HASH_SIZE == BYTES_PER_CHUNK);

// sha256(left || right)
bytes32_t hash_pair(bytes32_t const &left, bytes32_t const &right);

bytes32_t hash_bytes(byte_string_view);

SSZ_MERKLE_NAMESPACE_END
