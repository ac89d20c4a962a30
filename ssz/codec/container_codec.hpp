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

#include <ssz/codec/codec.hpp>
#include <ssz/codec/decode_error.hpp>
#include <ssz/codec/sequence.hpp>
#include <ssz/container/fixed_vector.hpp>
#include <ssz/container/optional.hpp>
#include <ssz/container/runtime_fixed_vector.hpp>
#include <ssz/container/runtime_variable_list.hpp>
#include <ssz/container/variable_list.hpp>
#include <ssz/core/byte_string.hpp>
#include <ssz/core/config.hpp>
#include <ssz/core/result.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

SSZ_NAMESPACE_BEGIN

namespace detail
{
    // Items of a sequence holding `limit` items when `exact`, at most
    // `limit` otherwise
    template <Serializable T>
    DecodeResult<std::vector<T>> decode_sequence(
        byte_string_view const bytes, uint64_t const limit, bool const exact,
        char const *const name)
    {
        if constexpr (Codec<T>::is_fixed_len()) {
            BOOST_OUTCOME_TRY(
                auto const num_items, fixed_item_count<T>(bytes));
            if (exact && num_items != limit) {
                return DecodeError::bytes_invalid(fmt::format(
                    "{} of {} items has {} items", name, limit, num_items));
            }
            if (!exact && num_items > limit) {
                return DecodeError::bytes_invalid(fmt::format(
                    "{} of {} items exceeds maximum of {}",
                    name,
                    num_items,
                    limit));
            }
            return decode_fixed_items<T>(bytes, num_items);
        }
        else {
            return decode_list_of_variable_length_items<T>(bytes, limit);
        }
    }

    inline DecodeError wrap_length_error(
        char const *const name, LengthError const &error)
    {
        return DecodeError::bytes_invalid(fmt::format(
            "wrong number of {} elements: {}", name, error.message()));
    }

    template <Serializable T>
    DecodeResult<std::vector<T>> decode_fixed_sequence(
        byte_string_view const bytes, uint64_t const len,
        char const *const name)
    {
        if (bytes.empty()) {
            if (len == 0) {
                return std::vector<T>{};
            }
            return DecodeError::invalid_byte_length(0, 1);
        }
        return decode_sequence<T>(bytes, len, true, name);
    }

    template <Serializable T>
    DecodeResult<std::vector<T>> decode_variable_sequence(
        byte_string_view const bytes, uint64_t const max_len,
        char const *const name)
    {
        if (bytes.empty()) {
            return std::vector<T>{};
        }
        return decode_sequence<T>(bytes, max_len, false, name);
    }
}

template <Serializable T, uint64_t N>
struct Codec<FixedVector<T, N>>
{
    static constexpr bool is_fixed_len()
    {
        return Codec<T>::is_fixed_len();
    }

    static constexpr size_t fixed_len()
    {
        if constexpr (Codec<T>::is_fixed_len()) {
            return static_cast<size_t>(Codec<T>::fixed_len() * N);
        }
        else {
            return BYTES_PER_LENGTH_OFFSET;
        }
    }

    static size_t bytes_len(FixedVector<T, N> const &value)
    {
        return detail::sequence_bytes_len(value.as_span());
    }

    static void encode(FixedVector<T, N> const &value, byte_string &out)
    {
        detail::encode_sequence(value.as_span(), out);
    }

    static DecodeResult<FixedVector<T, N>> decode(byte_string_view const in)
    {
        BOOST_OUTCOME_TRY(
            auto vec,
            detail::decode_fixed_sequence<T>(in, N, "FixedVector"));
        auto res = FixedVector<T, N>::make(std::move(vec));
        if (res.has_error()) {
            return detail::wrap_length_error("FixedVector", res.error());
        }
        return std::move(res).value();
    }
};

template <Serializable T, uint64_t N>
struct Codec<VariableList<T, N>>
{
    static constexpr bool is_fixed_len()
    {
        return false;
    }

    static constexpr size_t fixed_len()
    {
        return BYTES_PER_LENGTH_OFFSET;
    }

    static size_t bytes_len(VariableList<T, N> const &value)
    {
        return detail::sequence_bytes_len(value.as_span());
    }

    static void encode(VariableList<T, N> const &value, byte_string &out)
    {
        detail::encode_sequence(value.as_span(), out);
    }

    static DecodeResult<VariableList<T, N>> decode(byte_string_view const in)
    {
        BOOST_OUTCOME_TRY(
            auto vec,
            detail::decode_variable_sequence<T>(in, N, "VariableList"));
        auto res = VariableList<T, N>::make(std::move(vec));
        if (res.has_error()) {
            return detail::wrap_length_error("VariableList", res.error());
        }
        return std::move(res).value();
    }
};

template <Serializable T>
struct Codec<Optional<T>>
{
    static constexpr uint8_t SELECTOR = 0x01;

    static constexpr bool is_fixed_len()
    {
        return false;
    }

    static constexpr size_t fixed_len()
    {
        return BYTES_PER_LENGTH_OFFSET;
    }

    static size_t bytes_len(Optional<T> const &value)
    {
        return value.has_value() ? 1 + Codec<T>::bytes_len(*value) : 0;
    }

    static void encode(Optional<T> const &value, byte_string &out)
    {
        if (value.has_value()) {
            out.push_back(SELECTOR);
            Codec<T>::encode(*value, out);
        }
    }

    static DecodeResult<Optional<T>> decode(byte_string_view const in)
    {
        if (in.empty()) {
            return Optional<T>{};
        }
        if (in[0] != SELECTOR) {
            return DecodeError::bytes_invalid(
                "missing Optional identifier byte");
        }
        BOOST_OUTCOME_TRY(auto value, Codec<T>::decode(in.substr(1)));
        return Optional<T>{std::move(value)};
    }
};

// Runtime sized containers need their bound at decode time, so they are
// encoded and decoded through these functions rather than a Codec.

template <Serializable T>
size_t bytes_len(RuntimeVariableList<T> const &value)
{
    return detail::sequence_bytes_len(value.as_span());
}

template <Serializable T>
byte_string encode(RuntimeVariableList<T> const &value)
{
    byte_string out;
    out.reserve(bytes_len(value));
    detail::encode_sequence(value.as_span(), out);
    return out;
}

template <Serializable T>
DecodeResult<RuntimeVariableList<T>>
decode_runtime_variable_list(byte_string_view const in, uint64_t const max_len)
{
    BOOST_OUTCOME_TRY(
        auto vec,
        detail::decode_variable_sequence<T>(
            in, max_len, "RuntimeVariableList"));
    auto res = RuntimeVariableList<T>::make(std::move(vec), max_len);
    if (res.has_error()) {
        return detail::wrap_length_error("RuntimeVariableList", res.error());
    }
    return std::move(res).value();
}

template <Serializable T>
size_t bytes_len(RuntimeFixedVector<T> const &value)
{
    return detail::sequence_bytes_len(value.as_span());
}

template <Serializable T>
byte_string encode(RuntimeFixedVector<T> const &value)
{
    byte_string out;
    out.reserve(bytes_len(value));
    detail::encode_sequence(value.as_span(), out);
    return out;
}

template <Serializable T>
DecodeResult<RuntimeFixedVector<T>>
decode_runtime_fixed_vector(byte_string_view const in, uint64_t const len)
{
    BOOST_OUTCOME_TRY(
        auto vec,
        detail::decode_fixed_sequence<T>(in, len, "RuntimeFixedVector"));
    auto res = RuntimeFixedVector<T>::make(std::move(vec), len);
    if (res.has_error()) {
        return detail::wrap_length_error("RuntimeFixedVector", res.error());
    }
    return std::move(res).value();
}

SSZ_NAMESPACE_END
