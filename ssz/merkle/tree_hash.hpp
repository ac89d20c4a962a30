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
#include <ssz/merkle/merkleize.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

SSZ_MERKLE_NAMESPACE_BEGIN

enum class TreeHashKind : uint8_t
{
    Basic, // fixed width scalar, packed with its neighbours into a chunk
    Composite, // one chunk per value, holding the value's own root
};

/**
 * Merkleization of a type. Every specialization provides
 *
 *   static constexpr TreeHashKind kind;
 *   static bytes32_t root(T const &);
 *
 * and Basic ones also
 *
 *   static constexpr size_t packed_size;
 *   static void pack(T const &, byte_string &);
 */
template <class T>
struct TreeHash;

template <class T>
concept TreeHashable = requires(T const &value) {
    { TreeHash<T>::kind } -> std::convertible_to<TreeHashKind>;
    { TreeHash<T>::root(value) } -> std::same_as<bytes32_t>;
};

template <std::unsigned_integral T>
struct TreeHash<T>
{
    static constexpr TreeHashKind kind = TreeHashKind::Basic;
    static constexpr size_t packed_size = sizeof(T);

    static void pack(T const &value, byte_string &out)
    {
        append_little_endian(out, value);
    }

    static bytes32_t root(T const &value)
    {
        byte_string out;
        pack(value, out);
        return to_bytes32(out);
    }
};

template <>
struct TreeHash<bool>
{
    static constexpr TreeHashKind kind = TreeHashKind::Basic;
    static constexpr size_t packed_size = 1;

    static void pack(bool const &value, byte_string &out)
    {
        out.push_back(value ? 1 : 0);
    }

    static bytes32_t root(bool const &value)
    {
        bytes32_t ret{};
        ret.bytes[0] = value ? 1 : 0;
        return ret;
    }
};

template <>
struct TreeHash<bytes32_t>
{
    static constexpr TreeHashKind kind = TreeHashKind::Composite;

    static bytes32_t root(bytes32_t const &value)
    {
        return value;
    }
};

template <TreeHashable T>
bytes32_t tree_hash_root(T const &value)
{
    return TreeHash<T>::root(value);
}

// Number of values sharing one chunk
template <TreeHashable T>
constexpr uint64_t packing_factor() noexcept
{
    if constexpr (TreeHash<T>::kind == TreeHashKind::Basic) {
        static_assert(
            TreeHash<T>::packed_size > 0 &&
            BYTES_PER_CHUNK % TreeHash<T>::packed_size == 0);
        return BYTES_PER_CHUNK / TreeHash<T>::packed_size;
    }
    else {
        return 1;
    }
}

// Leaf count of a sequence of capacity `capacity`, before padding
template <TreeHashable T>
constexpr uint64_t chunk_count(uint64_t const capacity) noexcept
{
    constexpr uint64_t factor = packing_factor<T>();
    return capacity / factor + (capacity % factor != 0 ? 1 : 0);
}

// Leaf holding the value at `index` of a sequence
template <TreeHashable T>
constexpr uint64_t chunk_position(uint64_t const index) noexcept
{
    return index / packing_factor<T>();
}

template <TreeHashable T>
std::vector<bytes32_t> vec_chunks(std::span<T const> const items)
{
    if constexpr (TreeHash<T>::kind == TreeHashKind::Basic) {
        byte_string packed;
        packed.reserve(items.size() * TreeHash<T>::packed_size);
        if constexpr (std::same_as<T, uint8_t>) {
            packed.append(items.data(), items.size());
        }
        else {
            for (auto const &item : items) {
                TreeHash<T>::pack(item, packed);
            }
        }
        return pack_chunks(packed);
    }
    else {
        std::vector<bytes32_t> chunks;
        chunks.reserve(items.size());
        for (auto const &item : items) {
            chunks.push_back(TreeHash<T>::root(item));
        }
        return chunks;
    }
}

// Root of `items` in a tree sized for `capacity` values, without length
template <TreeHashable T>
bytes32_t
vec_tree_hash_root(std::span<T const> const items, uint64_t const capacity)
{
    auto const chunks = vec_chunks(items);
    return merkleize(chunks, chunk_count<T>(capacity));
}

SSZ_MERKLE_NAMESPACE_END
