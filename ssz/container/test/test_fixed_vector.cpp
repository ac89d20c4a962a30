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
#include <ssz/container/length_error.hpp>
#include <ssz/container/runtime_fixed_vector.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <functional>
#include <list>
#include <stdexcept>
#include <vector>

using namespace ssz;

TEST(fixed_vector, make_requires_exact_length)
{
    auto const ok = FixedVector<uint64_t, 4>::make({1, 2, 3, 4});
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value().as_vec(), (std::vector<uint64_t>{1, 2, 3, 4}));

    auto const short_res = FixedVector<uint64_t, 4>::make({1, 2, 3});
    ASSERT_TRUE(short_res.has_error());
    EXPECT_EQ(
        short_res.error(),
        (LengthError{LengthError::Kind::Mismatch, 3, 4}));

    auto const long_res = FixedVector<uint64_t, 4>::make({1, 2, 3, 4, 5});
    ASSERT_TRUE(long_res.has_error());
    EXPECT_EQ(
        long_res.error(),
        (LengthError{LengthError::Kind::Mismatch, 5, 4}));
    EXPECT_EQ(
        long_res.error().message(), "length 5 does not match fixed length 4");
}

TEST(fixed_vector, default_and_from_elem)
{
    FixedVector<uint16_t, 5> const zeros;
    EXPECT_EQ(zeros.size(), 5);
    for (auto const v : zeros) {
        EXPECT_EQ(v, 0);
    }

    auto const sevens = FixedVector<uint16_t, 3>::from_elem(7);
    EXPECT_EQ(sevens.as_vec(), (std::vector<uint16_t>{7, 7, 7}));
    EXPECT_EQ((FixedVector<uint16_t, 3>::capacity()), 3);
}

TEST(fixed_vector, resized)
{
    auto const padded = FixedVector<uint8_t, 4>::resized({1, 2});
    EXPECT_EQ(padded.as_vec(), (std::vector<uint8_t>{1, 2, 0, 0}));

    auto const cut = FixedVector<uint8_t, 2>::resized({1, 2, 3, 4});
    EXPECT_EQ(cut.as_vec(), (std::vector<uint8_t>{1, 2}));
}

TEST(fixed_vector, indexing)
{
    auto vec = FixedVector<uint32_t, 3>::from_elem(0);
    vec[1] = 42;
    vec.as_span()[2] = 43;
    EXPECT_EQ(vec[0], 0);
    EXPECT_EQ(vec[1], 42);
    EXPECT_EQ(vec.at(2), 43);
    EXPECT_THROW((void)vec.at(3), std::out_of_range);
}

TEST(fixed_vector, try_from_iter)
{
    std::list<uint8_t> const exact{1, 2, 3};
    auto const ok =
        FixedVector<uint8_t, 3>::try_from_iter(exact.begin(), exact.end());
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value().as_vec(), (std::vector<uint8_t>{1, 2, 3}));

    auto const too_short =
        FixedVector<uint8_t, 4>::try_from_iter(exact.begin(), exact.end());
    ASSERT_TRUE(too_short.has_error());
    EXPECT_EQ(
        too_short.error(), (LengthError{LengthError::Kind::Mismatch, 3, 4}));

    auto const too_long =
        FixedVector<uint8_t, 2>::try_from_iter(exact.begin(), exact.end());
    ASSERT_TRUE(too_long.has_error());
    EXPECT_EQ(
        too_long.error(), (LengthError{LengthError::Kind::Mismatch, 3, 2}));
}

TEST(fixed_vector, equality_and_hash)
{
    auto const a = FixedVector<uint8_t, 0>::make({}).value();
    auto const b = FixedVector<uint8_t, 0>::make({}).value();
    EXPECT_EQ(a, b);

    auto const c = FixedVector<uint8_t, 2>::make({1, 2}).value();
    auto const d = FixedVector<uint8_t, 2>::make({1, 3}).value();
    EXPECT_NE(c, d);
    EXPECT_NE(
        (std::hash<FixedVector<uint8_t, 2>>{}(c)),
        (std::hash<FixedVector<uint8_t, 2>>{}(d)));
}

TEST(runtime_fixed_vector, construction)
{
    auto const ok = RuntimeFixedVector<uint64_t>::make({1, 2}, 2);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value().len(), 2);

    auto const bad = RuntimeFixedVector<uint64_t>::make({1, 2}, 3);
    ASSERT_TRUE(bad.has_error());
    EXPECT_EQ(bad.error(), (LengthError{LengthError::Kind::Mismatch, 2, 3}));

    auto const from_vec = RuntimeFixedVector<uint64_t>::from_vec({5, 6, 7});
    EXPECT_EQ(from_vec.len(), 3);

    auto const filled = RuntimeFixedVector<uint64_t>::from_elem(9, 2);
    EXPECT_EQ(filled.as_vec(), (std::vector<uint64_t>{9, 9}));

    auto const zeros = RuntimeFixedVector<uint64_t>::default_of(3);
    EXPECT_EQ(zeros.as_vec(), (std::vector<uint64_t>{0, 0, 0}));
}

TEST(runtime_fixed_vector, take_leaves_defaults)
{
    auto vec = RuntimeFixedVector<uint64_t>::from_vec({1, 2, 3});
    auto const taken = vec.take();
    EXPECT_EQ(taken, (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(vec.len(), 3);
    EXPECT_EQ(vec.as_vec(), (std::vector<uint64_t>{0, 0, 0}));
}
