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

#include <ssz/codec/decode_error.hpp>
#include <ssz/core/byte_string.hpp>
#include <ssz/core/bytes.hpp>
#include <ssz/core/config.hpp>

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <cstdint>

SSZ_NAMESPACE_BEGIN

// Width of a little endian offset in the variable part of a sequence
inline constexpr size_t BYTES_PER_LENGTH_OFFSET = 4;

/**
 * Serialization of a type. Specializations provide
 *
 *   static constexpr bool is_fixed_len();
 *   static constexpr size_t fixed_len();  // BYTES_PER_LENGTH_OFFSET when
 *                                         // the length is variable
 *   static size_t bytes_len(T const &);
 *   static void encode(T const &, byte_string &);
 *   static DecodeResult<T> decode(byte_string_view);
 *
 * `decode` is handed exactly the bytes of one value.
 */
template <class T>
struct Codec;

template <class T>
concept Serializable =
    requires(T const &value, byte_string &out, byte_string_view const in) {
        { Codec<T>::is_fixed_len() } -> std::same_as<bool>;
        { Codec<T>::fixed_len() } -> std::same_as<size_t>;
        { Codec<T>::bytes_len(value) } -> std::same_as<size_t>;
        { Codec<T>::encode(value, out) } -> std::same_as<void>;
        { Codec<T>::decode(in) } -> std::same_as<DecodeResult<T>>;
    };

template <std::unsigned_integral T>
struct Codec<T>
{
    static constexpr bool is_fixed_len()
    {
        return true;
    }

    static constexpr size_t fixed_len()
    {
        return sizeof(T);
    }

    static size_t bytes_len(T const &)
    {
        return sizeof(T);
    }

    static void encode(T const &value, byte_string &out)
    {
        append_little_endian(out, value);
    }

    static DecodeResult<T> decode(byte_string_view const in)
    {
        if (in.size() != sizeof(T)) {
            return DecodeError::invalid_byte_length(in.size(), sizeof(T));
        }
        return load_little_endian<T>(in);
    }
};

template <>
struct Codec<bool>
{
    static constexpr bool is_fixed_len()
    {
        return true;
    }

    static constexpr size_t fixed_len()
    {
        return 1;
    }

    static size_t bytes_len(bool const &)
    {
        return 1;
    }

    static void encode(bool const &value, byte_string &out)
    {
        out.push_back(value ? 1 : 0);
    }

    static DecodeResult<bool> decode(byte_string_view const in)
    {
        if (in.size() != 1) {
            return DecodeError::invalid_byte_length(in.size(), 1);
        }
        if (in[0] > 1) {
            return DecodeError::bytes_invalid(
                fmt::format("invalid bool value {:#04x}", in[0]));
        }
        return in[0] == 1;
    }
};

template <>
struct Codec<bytes32_t>
{
    static constexpr bool is_fixed_len()
    {
        return true;
    }

    static constexpr size_t fixed_len()
    {
        return BYTES_PER_CHUNK;
    }

    static size_t bytes_len(bytes32_t const &)
    {
        return BYTES_PER_CHUNK;
    }

    static void encode(bytes32_t const &value, byte_string &out)
    {
        out.append(value.bytes, BYTES_PER_CHUNK);
    }

    static DecodeResult<bytes32_t> decode(byte_string_view const in)
    {
        if (in.size() != BYTES_PER_CHUNK) {
            return DecodeError::invalid_byte_length(in.size(), BYTES_PER_CHUNK);
        }
        return to_bytes32(in);
    }
};

template <Serializable T>
byte_string encode(T const &value)
{
    byte_string out;
    out.reserve(Codec<T>::bytes_len(value));
    Codec<T>::encode(value, out);
    return out;
}

template <Serializable T>
DecodeResult<T> decode(byte_string_view const in)
{
    return Codec<T>::decode(in);
}

SSZ_NAMESPACE_END
