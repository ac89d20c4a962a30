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
#include <ssz/container/json.hpp>
#include <ssz/container/json_error.hpp>
#include <ssz/container/length_error.hpp>
#include <ssz/container/runtime_variable_list.hpp>
#include <ssz/container/variable_list.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

using namespace ssz;

TEST(json, write_as_array)
{
    auto const list = VariableList<uint64_t, 8>::make({1, 2, 3}).value();
    nlohmann::json const j = list;
    EXPECT_EQ(j.dump(), "[1,2,3]");

    auto const vec = FixedVector<uint16_t, 2>::from_elem(7);
    EXPECT_EQ(nlohmann::json(vec).dump(), "[7,7]");
}

TEST(json, read_variable_list)
{
    auto const j = nlohmann::json::parse("[1,2,3]");
    EXPECT_EQ(
        (j.get<VariableList<uint64_t, 3>>().as_vec()),
        (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ((j.get<VariableList<uint64_t, 8>>().size()), 3);
    EXPECT_THROW(
        ((void)j.get<VariableList<uint64_t, 2>>()), std::invalid_argument);

    auto const res = variable_list_from_json<uint64_t, 2>(j);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().kind, JsonError::Kind::Length);
    EXPECT_EQ(
        res.error().length, (LengthError{LengthError::Kind::Exceeded, 3, 2}));
    EXPECT_EQ(res.error().message(), "length 3 exceeds maximum of 2");
}

// Too short is only an error for vectors
TEST(json, read_fixed_vector)
{
    auto const j = nlohmann::json::parse("[4,5]");
    EXPECT_EQ(
        (j.get<FixedVector<uint8_t, 2>>().as_vec()),
        (std::vector<uint8_t>{4, 5}));
    EXPECT_THROW(
        ((void)j.get<FixedVector<uint8_t, 3>>()), std::invalid_argument);
    EXPECT_THROW(
        ((void)j.get<FixedVector<uint8_t, 1>>()), std::invalid_argument);

    auto const res = fixed_vector_from_json<uint8_t, 3>(j);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().kind, JsonError::Kind::Length);
    EXPECT_EQ(
        res.error().length, (LengthError{LengthError::Kind::Mismatch, 2, 3}));
}

TEST(json, read_runtime_variable_list)
{
    auto const j = nlohmann::json::parse("[9,8,7,6]");
    auto const ok = runtime_variable_list_from_json<uint32_t>(j, 4);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value().max_len(), 4);
    EXPECT_TRUE(runtime_variable_list_from_json<uint32_t>(j, 3).has_error());

    nlohmann::json const out = ok.value();
    EXPECT_EQ(out, j);
}

TEST(json, not_an_array)
{
    for (auto const *const text : {"{}", "\"x\"", "7", "null"}) {
        auto const j = nlohmann::json::parse(text);
        auto const list = variable_list_from_json<uint8_t, 4>(j);
        ASSERT_TRUE(list.has_error()) << text;
        EXPECT_EQ(list.error(), JsonError{JsonError::Kind::NotAnArray});
        EXPECT_TRUE((fixed_vector_from_json<uint8_t, 1>(j).has_error()));
        EXPECT_TRUE(runtime_fixed_vector_from_json<uint8_t>(j, 1).has_error());
    }
    EXPECT_EQ(
        (JsonError{JsonError::Kind::NotAnArray}.message()),
        "expected a JSON array");
}

// Elements are range checked instead of being cast to the element type
TEST(json, element_out_of_range)
{
    auto const res =
        variable_list_from_json<uint8_t, 4>(nlohmann::json::parse("[1,300]"));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), (JsonError{JsonError::Kind::InvalidElement, 1}));
    EXPECT_EQ(res.error().message(), "element 1 is not a valid value");

    EXPECT_TRUE(
        (variable_list_from_json<uint8_t, 4>(nlohmann::json::parse("[255]"))
             .has_value()));
    EXPECT_TRUE((fixed_vector_from_json<uint16_t, 1>(
                     nlohmann::json::parse("[65536]"))
                     .has_error()));
    EXPECT_TRUE((fixed_vector_from_json<uint64_t, 1>(
                     nlohmann::json::parse("[18446744073709551615]"))
                     .has_value()));

    EXPECT_THROW(
        (void)nlohmann::json::parse("[300]").get<ByteList<4>>(),
        std::invalid_argument);
}

TEST(json, negative_element)
{
    auto const res = runtime_variable_list_from_json<uint32_t>(
        nlohmann::json::parse("[0,-1]"), 4);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), (JsonError{JsonError::Kind::InvalidElement, 1}));
}

TEST(json, element_of_wrong_type)
{
    for (auto const *const text : {"[true]", "[1.5]", "[\"1\"]", "[[1]]"}) {
        auto const res =
            variable_list_from_json<uint64_t, 4>(nlohmann::json::parse(text));
        ASSERT_TRUE(res.has_error()) << text;
        EXPECT_EQ(res.error().kind, JsonError::Kind::InvalidElement) << text;
    }

    auto const bools =
        fixed_vector_from_json<bool, 2>(nlohmann::json::parse("[true,false]"));
    ASSERT_TRUE(bools.has_value());
    EXPECT_EQ(bools.value().as_vec(), (std::vector<bool>{true, false}));
    EXPECT_TRUE(
        (fixed_vector_from_json<bool, 1>(nlohmann::json::parse("[1]"))
             .has_error()));
}

TEST(json, nested_lists)
{
    using Inner = VariableList<uint8_t, 2>;
    auto const j = nlohmann::json::parse("[[1],[2,3],[]]");
    auto const ok = variable_list_from_json<Inner, 3>(j);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value()[1].as_vec(), (std::vector<uint8_t>{2, 3}));
    EXPECT_EQ(nlohmann::json(ok.value()), j);

    auto const too_long = variable_list_from_json<Inner, 3>(
        nlohmann::json::parse("[[1],[1,2,3]]"));
    ASSERT_TRUE(too_long.has_error());
    EXPECT_EQ(
        too_long.error(), (JsonError{JsonError::Kind::InvalidElement, 1}));

    auto const bad_inner =
        variable_list_from_json<Inner, 3>(nlohmann::json::parse("[[256]]"));
    ASSERT_TRUE(bad_inner.has_error());
    EXPECT_EQ(
        bad_inner.error(), (JsonError{JsonError::Kind::InvalidElement, 0}));
}
