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
#include <ssz/core/result.hpp>

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
 * A sequence of at most `N` elements that only grows through append.
 *
 * Equality and hashing only look at the elements, never at N: a
 * VariableList<T, 4> and a VariableList<T, 8> holding the same values
 * compare equal.
 */
template <class T, uint64_t N>
class VariableList
{
    std::vector<T> vec_;

    explicit VariableList(std::vector<T> &&vec)
        : vec_(std::move(vec))
    {
    }

public:
    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    VariableList() = default;

    static LengthResult<VariableList> make(std::vector<T> vec)
    {
        if (vec.size() > N) {
            return LengthError{LengthError::Kind::Exceeded, vec.size(), N};
        }
        return VariableList{std::move(vec)};
    }

    static VariableList empty()
    {
        return VariableList{};
    }

    static VariableList repeat_full(T const &value)
    {
        return VariableList{std::vector<T>(safe_len(N), value)};
    }

    // Drops everything past the first N elements
    static VariableList truncated(std::vector<T> vec)
    {
        if (vec.size() > N) {
            vec.resize(safe_len(N));
        }
        return VariableList{std::move(vec)};
    }

    template <std::input_iterator It, std::sentinel_for<It> S>
    static LengthResult<VariableList> try_from_iter(It first, S last)
    {
        BOOST_OUTCOME_TRY(
            auto vec,
            collect_bounded<T>(std::move(first), std::move(last), N));
        return VariableList{std::move(vec)};
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

    // On failure the list is left untouched
    Result<void, LengthError> append(T value)
    {
        if (vec_.size() >= N) {
            return LengthError{
                LengthError::Kind::Exceeded, vec_.size() + uint64_t{1}, N};
        }
        vec_.push_back(std::move(value));
        return success();
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
    bool operator==(VariableList<T, M> const &other) const
    {
        return std::ranges::equal(vec_, other.as_vec());
    }
};

template <uint64_t N>
using ByteList = VariableList<uint8_t, N>;

SSZ_NAMESPACE_END

template <class T, uint64_t N>
struct std::hash<ssz::VariableList<T, N>>
{
    size_t operator()(ssz::VariableList<T, N> const &v) const
    {
        return boost::hash_range(v.begin(), v.end());
    }
};
