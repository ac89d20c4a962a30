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
#include <ssz/container/json_error.hpp>
#include <ssz/container/length_error.hpp>
#include <ssz/container/runtime_fixed_vector.hpp>
#include <ssz/container/runtime_variable_list.hpp>
#include <ssz/container/variable_list.hpp>
#include <ssz/core/config.hpp>
#include <ssz/core/result.hpp>

#include <nlohmann/json.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

SSZ_NAMESPACE_BEGIN

// Containers are written as JSON arrays of their elements. Reading checks
// every element before converting it, so a value that does not fit the
// element type is an error rather than a truncated number. An array of the
// wrong length is rejected: too long for every shape, too short only for
// vectors.

namespace detail
{
    template <class T>
    struct JsonElement;

    template <std::unsigned_integral T>
    struct JsonElement<T>
    {
        static std::optional<T> read(nlohmann::json const &e)
        {
            if constexpr (std::same_as<T, bool>) {
                if (!e.is_boolean()) {
                    return std::nullopt;
                }
                return e.get<bool>();
            }
            else {
                if (!e.is_number_integer()) {
                    return std::nullopt;
                }
                if (!e.is_number_unsigned() && e.get<int64_t>() < 0) {
                    return std::nullopt;
                }
                auto const v = e.get<uint64_t>();
                if (v > std::numeric_limits<T>::max()) {
                    return std::nullopt;
                }
                return static_cast<T>(v);
            }
        }
    };

    template <class T>
    JsonResult<std::vector<T>> read_json_elements(nlohmann::json const &j)
    {
        if (!j.is_array()) {
            return JsonError{JsonError::Kind::NotAnArray};
        }
        std::vector<T> elements;
        elements.reserve(j.size());
        for (size_t i = 0; i < j.size(); ++i) {
            auto element = JsonElement<T>::read(j[i]);
            if (!element.has_value()) {
                return JsonError{JsonError::Kind::InvalidElement, i};
            }
            elements.push_back(std::move(*element));
        }
        return elements;
    }

    template <class Container>
    JsonResult<Container> json_length_checked(LengthResult<Container> res)
    {
        if (res.has_error()) {
            return JsonError{JsonError::Kind::Length, 0, res.error()};
        }
        return std::move(res).value();
    }
}

template <class T, uint64_t N>
JsonResult<FixedVector<T, N>> fixed_vector_from_json(nlohmann::json const &j)
{
    BOOST_OUTCOME_TRY(auto elements, detail::read_json_elements<T>(j));
    return detail::json_length_checked(
        FixedVector<T, N>::make(std::move(elements)));
}

template <class T, uint64_t N>
JsonResult<VariableList<T, N>> variable_list_from_json(nlohmann::json const &j)
{
    BOOST_OUTCOME_TRY(auto elements, detail::read_json_elements<T>(j));
    return detail::json_length_checked(
        VariableList<T, N>::make(std::move(elements)));
}

template <class T>
JsonResult<RuntimeVariableList<T>> runtime_variable_list_from_json(
    nlohmann::json const &j, uint64_t const max_len)
{
    BOOST_OUTCOME_TRY(auto elements, detail::read_json_elements<T>(j));
    return detail::json_length_checked(
        RuntimeVariableList<T>::make(std::move(elements), max_len));
}

template <class T>
JsonResult<RuntimeFixedVector<T>>
runtime_fixed_vector_from_json(nlohmann::json const &j, uint64_t const len)
{
    BOOST_OUTCOME_TRY(auto elements, detail::read_json_elements<T>(j));
    return detail::json_length_checked(
        RuntimeFixedVector<T>::make(std::move(elements), len));
}

namespace detail
{
    // Nested containers are read with the same checks as the outer one
    template <class T, uint64_t N>
    struct JsonElement<FixedVector<T, N>>
    {
        static std::optional<FixedVector<T, N>> read(nlohmann::json const &e)
        {
            auto res = fixed_vector_from_json<T, N>(e);
            if (res.has_error()) {
                return std::nullopt;
            }
            return std::move(res).value();
        }
    };

    template <class T, uint64_t N>
    struct JsonElement<VariableList<T, N>>
    {
        static std::optional<VariableList<T, N>> read(nlohmann::json const &e)
        {
            auto res = variable_list_from_json<T, N>(e);
            if (res.has_error()) {
                return std::nullopt;
            }
            return std::move(res).value();
        }
    };
}

template <class T, uint64_t N>
void to_json(nlohmann::json &j, FixedVector<T, N> const &value)
{
    j = value.as_vec();
}

template <class T, uint64_t N>
void from_json(nlohmann::json const &j, FixedVector<T, N> &value)
{
    auto res = fixed_vector_from_json<T, N>(j);
    if (res.has_error()) {
        throw std::invalid_argument(res.error().message());
    }
    value = std::move(res).value();
}

template <class T, uint64_t N>
void to_json(nlohmann::json &j, VariableList<T, N> const &value)
{
    j = value.as_vec();
}

template <class T, uint64_t N>
void from_json(nlohmann::json const &j, VariableList<T, N> &value)
{
    auto res = variable_list_from_json<T, N>(j);
    if (res.has_error()) {
        throw std::invalid_argument(res.error().message());
    }
    value = std::move(res).value();
}

template <class T>
void to_json(nlohmann::json &j, RuntimeVariableList<T> const &value)
{
    j = value.as_vec();
}

template <class T>
void to_json(nlohmann::json &j, RuntimeFixedVector<T> const &value)
{
    j = value.as_vec();
}

SSZ_NAMESPACE_END
