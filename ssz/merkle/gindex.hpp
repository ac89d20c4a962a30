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

#include <ssz/core/assert.h>
#include <ssz/core/config.hpp>
#include <ssz/merkle/tree_hash.hpp>

#include <bit>
#include <cstdint>

SSZ_MERKLE_NAMESPACE_BEGIN

/**
 * Generalized index of a node in a binary merkle tree: the root is 1 and
 * the children of g are 2g and 2g + 1. Lists put their data subtree at 2
 * and their length chunk at 3.
 */
using gindex_t = uint64_t;

constexpr uint64_t next_power_of_two(uint64_t const n)
{
    SSZ_ASSERT(n <= (uint64_t{1} << 63));
    return std::bit_ceil(n == 0 ? uint64_t{1} : n);
}

constexpr unsigned gindex_depth(gindex_t const g)
{
    SSZ_ASSERT(g != 0);
    return static_cast<unsigned>(std::bit_width(g)) - 1;
}

constexpr gindex_t sibling(gindex_t const g) noexcept
{
    return g ^ 1;
}

constexpr gindex_t parent(gindex_t const g) noexcept
{
    return g >> 1;
}

namespace detail
{
    constexpr gindex_t
    descend(gindex_t const g, uint64_t const width, uint64_t const position)
    {
        SSZ_ASSERT(position < width);
        gindex_t scaled = 0;
        bool const mul_overflow = __builtin_mul_overflow(g, width, &scaled);
        SSZ_ASSERT(!mul_overflow);
        gindex_t result = 0;
        bool const add_overflow =
            __builtin_add_overflow(scaled, position, &result);
        SSZ_ASSERT(!add_overflow);
        return result;
    }
}

// Index `inner`, taken relative to the subtree rooted at `outer`
constexpr gindex_t concat_gindices(gindex_t const outer, gindex_t const inner)
{
    uint64_t const width = uint64_t{1} << gindex_depth(inner);
    return detail::descend(outer, width, inner - width);
}

// Field `index` of a container with `num_fields` fields rooted at `parent`
constexpr gindex_t field_gindex(
    gindex_t const parent, uint64_t const num_fields, uint64_t const index)
{
    return detail::descend(parent, next_power_of_two(num_fields), index);
}

// Chunk holding item `index` of a list of capacity `capacity`
template <TreeHashable T>
constexpr gindex_t list_item_gindex(
    gindex_t const parent, uint64_t const capacity, uint64_t const index)
{
    SSZ_ASSERT(index < capacity);
    return detail::descend(
        parent,
        2 * next_power_of_two(chunk_count<T>(capacity)),
        chunk_position<T>(index));
}

// Chunk holding item `index` of a vector of length `capacity`
template <TreeHashable T>
constexpr gindex_t vector_item_gindex(
    gindex_t const parent, uint64_t const capacity, uint64_t const index)
{
    SSZ_ASSERT(index < capacity);
    return detail::descend(
        parent,
        next_power_of_two(chunk_count<T>(capacity)),
        chunk_position<T>(index));
}

// Builds the gindex of a nested value one step at a time, from the root
// of the outermost container down
class GindexPath
{
    gindex_t g_{1};

public:
    constexpr GindexPath() = default;

    constexpr explicit GindexPath(gindex_t const root)
        : g_{root}
    {
    }

    constexpr GindexPath &field(uint64_t const num_fields, uint64_t const index)
    {
        g_ = field_gindex(g_, num_fields, index);
        return *this;
    }

    template <TreeHashable T>
    constexpr GindexPath &
    list_item(uint64_t const capacity, uint64_t const index)
    {
        g_ = list_item_gindex<T>(g_, capacity, index);
        return *this;
    }

    template <TreeHashable T>
    constexpr GindexPath &
    vector_item(uint64_t const capacity, uint64_t const index)
    {
        g_ = vector_item_gindex<T>(g_, capacity, index);
        return *this;
    }

    constexpr gindex_t value() const noexcept
    {
        return g_;
    }
};

SSZ_MERKLE_NAMESPACE_END
