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
#include <ssz/merkle/hasher.hpp>
#include <ssz/merkle/zero_hash.hpp>

#include <array>

SSZ_MERKLE_NAMESPACE_BEGIN

namespace
{
    using zero_hash_table = std::array<bytes32_t, MAX_TREE_DEPTH + 1>;

    zero_hash_table make_zero_hashes()
    {
        zero_hash_table table{};
        for (unsigned depth = 1; depth <= MAX_TREE_DEPTH; ++depth) {
            table[depth] = hash_pair(table[depth - 1], table[depth - 1]);
        }
        return table;
    }
}

bytes32_t const &zero_hash(unsigned const depth)
{
    static zero_hash_table const table = make_zero_hashes();
    SSZ_ASSERT(depth <= MAX_TREE_DEPTH);
    return table[depth];
}

SSZ_MERKLE_NAMESPACE_END
