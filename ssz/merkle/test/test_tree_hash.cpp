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

#include <ssz/container/fixed_vector.hpp>
#include <ssz/container/optional.hpp>
#include <ssz/container/runtime_fixed_vector.hpp>
#include <ssz/container/runtime_variable_list.hpp>
#include <ssz/container/variable_list.hpp>
#include <ssz/core/byte_string.hpp>
#include <ssz/core/bytes.hpp>
#include <ssz/merkle/container_tree_hash.hpp>
#include <ssz/merkle/hasher.hpp>
#include <ssz/merkle/merkleize.hpp>
#include <ssz/merkle/tree_hash.hpp>
#include <ssz/merkle/zero_hash.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <vector>

using namespace ssz;
using namespace ssz::merkle;

namespace
{
    bytes32_t packed_chunk(std::vector<uint8_t> const &bytes)
    {
        return to_bytes32(byte_string_view{bytes.data(), bytes.size()});
    }

    std::vector<uint8_t> counting_bytes(size_t const n)
    {
        std::vector<uint8_t> bytes(n);
        for (size_t i = 0; i < n; ++i) {
            bytes[i] = static_cast<uint8_t>(i + 1);
        }
        return bytes;
    }
}

TEST(tree_hash, packing_factor)
{
    EXPECT_EQ(packing_factor<uint8_t>(), 32);
    EXPECT_EQ(packing_factor<uint16_t>(), 16);
    EXPECT_EQ(packing_factor<uint32_t>(), 8);
    EXPECT_EQ(packing_factor<uint64_t>(), 4);
    EXPECT_EQ(packing_factor<bool>(), 32);
    EXPECT_EQ(packing_factor<bytes32_t>(), 1);
    EXPECT_EQ((packing_factor<VariableList<uint8_t, 4>>()), 1);

    EXPECT_EQ(chunk_count<uint64_t>(10), 3);
    EXPECT_EQ(chunk_count<uint64_t>(8), 2);
    EXPECT_EQ(chunk_count<uint8_t>(0), 0);
    EXPECT_EQ(chunk_count<bytes32_t>(5), 5);
    EXPECT_EQ(
        chunk_count<uint8_t>(std::numeric_limits<uint64_t>::max()),
        uint64_t{1} << 59);
}

TEST(tree_hash, basic_roots)
{
    bytes32_t expected{};
    expected.bytes[0] = 0x02;
    expected.bytes[1] = 0x01;
    EXPECT_EQ(tree_hash_root(uint16_t{0x0102}), expected);
    EXPECT_EQ(tree_hash_root(false), bytes32_t{});
}

// Append-built byte list: one leaf, length mixed in
TEST(tree_hash, byte_list_of_four)
{
    ByteList<4> list;
    for (int i = 0; i < 4; ++i) {
        ASSERT_FALSE(list.append(42).has_error());
    }
    auto const leaf = packed_chunk({42, 42, 42, 42});
    EXPECT_EQ(tree_hash_root(list), mix_in_length(leaf, 4));
    EXPECT_EQ(tree_hash_root(list), hash_pair(leaf, length_chunk(4)));
}

TEST(tree_hash, fixed_vector_has_no_length)
{
    std::vector<uint64_t> values;
    for (uint64_t i = 0; i < 8; ++i) {
        values.push_back(i);
    }
    auto const vec = FixedVector<uint64_t, 8>::make(values).value();

    byte_string first;
    byte_string second;
    for (uint64_t i = 0; i < 4; ++i) {
        append_little_endian(first, i);
        append_little_endian(second, i + 4);
    }
    EXPECT_EQ(
        tree_hash_root(vec),
        hash_pair(to_bytes32(first), to_bytes32(second)));
}

TEST(tree_hash, zero_capacity)
{
    EXPECT_EQ(tree_hash_root(FixedVector<uint8_t, 0>{}), bytes32_t{});
    EXPECT_EQ(
        tree_hash_root(VariableList<uint8_t, 0>{}),
        mix_in_length(bytes32_t{}, 0));
}

// Shape depends on the capacity, not on the length
TEST(tree_hash, capacity_sets_depth)
{
    auto const small = VariableList<uint64_t, 4>::make({1}).value();
    auto const large = VariableList<uint64_t, 64>::make({1}).value();
    auto const leaf = tree_hash_root(uint64_t{1});
    EXPECT_EQ(tree_hash_root(small), mix_in_length(leaf, 1));
    EXPECT_EQ(
        tree_hash_root(large),
        mix_in_length(extend_to_depth(leaf, 0, 4), 1));
    EXPECT_NE(tree_hash_root(small), tree_hash_root(large));
}

TEST(tree_hash, length_mix_in)
{
    auto const three = VariableList<uint64_t, 8>::make({1, 2, 3}).value();
    auto const four = VariableList<uint64_t, 8>::make({1, 2, 3, 0}).value();
    EXPECT_NE(tree_hash_root(three), tree_hash_root(four));
    EXPECT_EQ(tree_hash_root(three), tree_hash_root(three));

    // The data roots agree, only the mixed in length differs
    EXPECT_EQ(
        vec_tree_hash_root(three.as_span(), 8),
        vec_tree_hash_root(four.as_span(), 8));

    auto const truncated = VariableList<uint64_t, 3>::truncated({1, 2, 3, 4});
    auto const direct = VariableList<uint64_t, 3>::make({1, 2, 3}).value();
    EXPECT_EQ(tree_hash_root(truncated), tree_hash_root(direct));
}

// With a capacity of 64 bytes the tree has two leaves; the second one only
// fills once the list is longer than 32 bytes
TEST(tree_hash, packing_boundary)
{
    auto const bytes = counting_bytes(33);
    bytes32_t const first = packed_chunk(bytes);

    for (size_t const len : {size_t{31}, size_t{32}}) {
        auto const list = ByteList<64>::make(
                              std::vector<uint8_t>(
                                  bytes.begin(),
                                  bytes.begin() + static_cast<long>(len)))
                              .value();
        std::vector<uint8_t> const prefix(
            bytes.begin(), bytes.begin() + static_cast<long>(len));
        EXPECT_EQ(
            tree_hash_root(list),
            mix_in_length(hash_pair(packed_chunk(prefix), bytes32_t{}), len));
    }

    auto const list = ByteList<64>::make(bytes).value();
    bytes32_t second{};
    second.bytes[0] = 33;
    EXPECT_EQ(
        tree_hash_root(list),
        mix_in_length(hash_pair(first, second), 33));
}

TEST(tree_hash, composite_elements)
{
    bytes32_t a{};
    a.bytes[0] = 1;
    bytes32_t b{};
    b.bytes[0] = 2;
    bytes32_t c{};
    c.bytes[0] = 3;
    auto const list = VariableList<bytes32_t, 4>::make({a, b, c}).value();
    EXPECT_EQ(
        tree_hash_root(list),
        mix_in_length(
            hash_pair(hash_pair(a, b), hash_pair(c, bytes32_t{})), 3));

    using Inner = VariableList<uint8_t, 4>;
    auto const inner0 = Inner::make({1}).value();
    auto const inner1 = Inner::make({2, 3}).value();
    auto const nested = FixedVector<Inner, 2>::make({inner0, inner1}).value();
    EXPECT_EQ(
        tree_hash_root(nested),
        hash_pair(tree_hash_root(inner0), tree_hash_root(inner1)));
}

TEST(tree_hash, large_capacity)
{
    auto const list =
        VariableList<uint64_t, (uint64_t{1} << 40)>::make({1, 2, 3}).value();
    auto const small = VariableList<uint64_t, 4>::make({1, 2, 3}).value();
    // 2^40 values packed four to a chunk is a tree of depth 38
    EXPECT_EQ(
        tree_hash_root(list),
        mix_in_length(
            extend_to_depth(vec_tree_hash_root(small.as_span(), 4), 0, 38),
            3));

    auto const widest =
        VariableList<bytes32_t, std::numeric_limits<uint64_t>::max()>::make(
            {bytes32_t{}})
            .value();
    EXPECT_EQ(tree_hash_root(widest), mix_in_length(zero_hash(64), 1));
}

TEST(tree_hash, runtime_containers_match)
{
    std::vector<uint16_t> const values{1, 2, 3, 4, 5};
    auto const list = VariableList<uint16_t, 40>::make(values).value();
    auto const runtime_list =
        RuntimeVariableList<uint16_t>::make(values, 40).value();
    EXPECT_EQ(tree_hash_root(list), tree_hash_root(runtime_list));

    auto const vec = FixedVector<uint16_t, 5>::make(values).value();
    auto const runtime_vec = RuntimeFixedVector<uint16_t>::from_vec(values);
    EXPECT_EQ(tree_hash_root(vec), tree_hash_root(runtime_vec));
}

TEST(tree_hash, optional)
{
    EXPECT_EQ(tree_hash_root(Optional<uint16_t>{}), zero_hash(1));
    EXPECT_EQ(
        tree_hash_root(Optional<uint16_t>{0x0102}),
        mix_in_length(tree_hash_root(uint16_t{0x0102}), 1));

    auto const inner = VariableList<uint8_t, 4>::make({1, 2}).value();
    EXPECT_EQ(
        tree_hash_root(Optional<VariableList<uint8_t, 4>>{inner}),
        mix_in_length(tree_hash_root(inner), 1));
}
