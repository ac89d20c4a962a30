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
#include <ssz/codec/offsets.hpp>
#include <ssz/core/byte_string.hpp>
#include <ssz/core/config.hpp>
#include <ssz/core/result.hpp>

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

SSZ_NAMESPACE_BEGIN

/**
 * Decode an offset table followed by the items it points at. Fails before
 * decoding any item when the table announces more than `max_len` items.
 */
template <Serializable T>
DecodeResult<std::vector<T>> decode_list_of_variable_length_items(
    byte_string_view const bytes, std::optional<uint64_t> const max_len)
{
    if (bytes.empty()) {
        return std::vector<T>{};
    }

    BOOST_OUTCOME_TRY(auto const offset0, read_offset(bytes));
    BOOST_OUTCOME_TRY(
        auto const first_offset,
        sanitize_offset(offset0, std::nullopt, bytes.size(), offset0));
    if (first_offset % BYTES_PER_LENGTH_OFFSET != 0 ||
        first_offset < BYTES_PER_LENGTH_OFFSET) {
        return DecodeError::offset(
            DecodeErrorCode::InvalidListFixedBytesLen, first_offset);
    }

    size_t const num_items = first_offset / BYTES_PER_LENGTH_OFFSET;
    if (max_len.has_value() && num_items > *max_len) {
        return DecodeError::bytes_invalid(fmt::format(
            "variable length list of {} items exceeds maximum of {}",
            num_items,
            *max_len));
    }

    std::vector<T> values;
    values.reserve(num_items);
    size_t offset = first_offset;
    for (size_t i = 1; i <= num_items; ++i) {
        size_t const start = offset;
        if (i < num_items) {
            BOOST_OUTCOME_TRY(
                auto const next,
                read_offset(bytes.substr(i * BYTES_PER_LENGTH_OFFSET)));
            BOOST_OUTCOME_TRY(
                auto const sanitized,
                sanitize_offset(next, offset, bytes.size(), first_offset));
            offset = sanitized;
        }
        else {
            offset = bytes.size();
        }
        BOOST_OUTCOME_TRY(
            auto item, Codec<T>::decode(bytes.substr(start, offset - start)));
        values.push_back(std::move(item));
    }
    return values;
}

namespace detail
{
    template <Serializable T>
    size_t sequence_bytes_len(std::span<T const> const items)
    {
        if constexpr (Codec<T>::is_fixed_len()) {
            return Codec<T>::fixed_len() * items.size();
        }
        else {
            size_t len = BYTES_PER_LENGTH_OFFSET * items.size();
            for (auto const &item : items) {
                len += Codec<T>::bytes_len(item);
            }
            return len;
        }
    }

    template <Serializable T>
    void encode_sequence(std::span<T const> const items, byte_string &out)
    {
        if constexpr (std::same_as<T, uint8_t>) {
            out.append(items.data(), items.size());
        }
        else if constexpr (Codec<T>::is_fixed_len()) {
            for (auto const &item : items) {
                Codec<T>::encode(item, out);
            }
        }
        else {
            size_t offset = BYTES_PER_LENGTH_OFFSET * items.size();
            for (auto const &item : items) {
                encode_offset(offset, out);
                offset += Codec<T>::bytes_len(item);
            }
            for (auto const &item : items) {
                Codec<T>::encode(item, out);
            }
        }
    }

    // Item count of a sequence of fixed length items
    template <Serializable T>
        requires(Codec<T>::is_fixed_len())
    DecodeResult<size_t> fixed_item_count(byte_string_view const bytes)
    {
        constexpr size_t item_len = Codec<T>::fixed_len();
        if constexpr (item_len == 0) {
            return DecodeError{DecodeErrorCode::ZeroLengthItem, 0, 0, {}};
        }
        else {
            if (bytes.size() % item_len != 0) {
                return DecodeError::bytes_invalid(fmt::format(
                    "{} bytes is not a multiple of the item length {}",
                    bytes.size(),
                    item_len));
            }
            return bytes.size() / item_len;
        }
    }

    // `bytes` holds a whole number of items, checked by fixed_item_count
    template <Serializable T>
        requires(Codec<T>::is_fixed_len())
    DecodeResult<std::vector<T>>
    decode_fixed_items(byte_string_view const bytes, size_t const num_items)
    {
        if constexpr (std::same_as<T, uint8_t>) {
            return std::vector<T>(bytes.begin(), bytes.end());
        }
        else {
            constexpr size_t item_len = Codec<T>::fixed_len();
            std::vector<T> values;
            values.reserve(num_items);
            for (size_t i = 0; i < num_items; ++i) {
                BOOST_OUTCOME_TRY(
                    auto item,
                    Codec<T>::decode(bytes.substr(i * item_len, item_len)));
                values.push_back(std::move(item));
            }
            return values;
        }
    }
}

SSZ_NAMESPACE_END
