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

#include <ssz/container/bounded_collect.hpp>
#include <ssz/container/length_error.hpp>
#include <ssz/core/assert.h>
#include <ssz/core/config.hpp>
#include <ssz/core/length_guard.hpp>

#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <span>
#include <utility>
#include <vector>

SSZ_NAMESPACE_BEGIN

/**
 * A sequence of exactly `N` elements.
 *
 * Equality and hashing only look at the elements, never at N.
 */
template <class T, uint64_t N>
class FixedVector
{
    std::vector<T> vec_;

    explicit FixedVector(std::vector<T> &&vec)
        : vec_(std::move(vec))
    {
    }

public:
    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    // N default constructed elements
    FixedVector()
        : vec_(safe_len(N))
    {
    }

    static LengthResult<FixedVector> make(std::vector<T> vec)
    {
        if (vec.size() != N) {
            return LengthError{LengthError::Kind::Mismatch, vec.size(), N};
        }
        return FixedVector{std::move(vec)};
    }

    static FixedVector from_elem(T const &value)
    {
        return FixedVector{std::vector<T>(safe_len(N), value)};
    }

    // Truncates or pads with default elements to exactly N
    static FixedVector resized(std::vector<T> vec)
    {
        vec.resize(safe_len(N));
        return FixedVector{std::move(vec)};
    }

    template <std::input_iterator It, std::sentinel_for<It> S>
    static LengthResult<FixedVector> try_from_iter(It first, S last)
    {
        auto res = collect_bounded<T>(std::move(first), std::move(last), N);
        if (res.has_error()) {
            return LengthError{
                LengthError::Kind::Mismatch, res.error().length, N};
        }
        return make(std::move(res).value());
    }

    static constexpr uint64_t capacity() noexcept
    {
        return N;
    }

    size_t size() const noexcept
    {
        return vec_.size();
    }

    bool is_empty() const noexcept
    {
        return vec_.empty();
    }

    T &operator[](size_t const i)
    {
        SSZ_DEBUG_ASSERT(i < vec_.size());
        return vec_[i];
    }

    T const &operator[](size_t const i) const
    {
        SSZ_DEBUG_ASSERT(i < vec_.size());
        return vec_[i];
    }

    T &at(size_t const i)
    {
        return vec_.at(i);
    }

    T const &at(size_t const i) const
    {
        return vec_.at(i);
    }

    std::span<T> as_span() noexcept
    {
        return vec_;
    }

    std::span<T const> as_span() const noexcept
    {
        return vec_;
    }

    std::vector<T> const &as_vec() const noexcept
    {
        return vec_;
    }

    std::vector<T> into_vec() &&
    {
        return std::move(vec_);
    }

    iterator begin() noexcept
    {
        return vec_.begin();
    }

    iterator end() noexcept
    {
        return vec_.end();
    }

    const_iterator begin() const noexcept
    {
        return vec_.begin();
    }

    const_iterator end() const noexcept
    {
        return vec_.end();
    }

    template <uint64_t M>
    bool operator==(FixedVector<T, M> const &other) const
    {
        return std::ranges::equal(vec_, other.as_vec());
    }
};

template <uint64_t N>
using ByteVector = FixedVector<uint8_t, N>;

SSZ_NAMESPACE_END

template <class T, uint64_t N>
struct std::hash<ssz::FixedVector<T, N>>
{
    size_t operator()(ssz::FixedVector<T, N> const &v) const
    {
        return boost::hash_range(v.begin(), v.end());
    }
};
