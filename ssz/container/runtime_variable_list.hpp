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
 * VariableList whose maximum length is chosen at run time. The maximum is
 * set by the factory that creates the list and cannot change afterwards.
 */
template <class T>
class RuntimeVariableList
{
    std::vector<T> vec_;
    uint64_t max_len_{0};

    RuntimeVariableList(std::vector<T> &&vec, uint64_t const max_len)
        : vec_(std::move(vec))
        , max_len_{max_len}
    {
    }

public:
    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    static LengthResult<RuntimeVariableList>
    make(std::vector<T> vec, uint64_t const max_len)
    {
        if (vec.size() > max_len) {
            return LengthError{
                LengthError::Kind::Exceeded, vec.size(), max_len};
        }
        return RuntimeVariableList{std::move(vec), max_len};
    }

    static RuntimeVariableList empty(uint64_t const max_len)
    {
        return RuntimeVariableList{{}, max_len};
    }

    static RuntimeVariableList
    truncated(std::vector<T> vec, uint64_t const max_len)
    {
        if (vec.size() > max_len) {
            vec.resize(safe_len(max_len));
        }
        return RuntimeVariableList{std::move(vec), max_len};
    }

    template <std::input_iterator It, std::sentinel_for<It> S>
    static LengthResult<RuntimeVariableList>
    try_from_iter(It first, S last, uint64_t const max_len)
    {
        BOOST_OUTCOME_TRY(
            auto vec,
            collect_bounded<T>(std::move(first), std::move(last), max_len));
        return RuntimeVariableList{std::move(vec), max_len};
    }

    uint64_t max_len() const noexcept
    {
        return max_len_;
    }

    size_t size() const noexcept
    {
        return vec_.size();
    }

    bool is_empty() const noexcept
    {
        return vec_.empty();
    }

    Result<void, LengthError> append(T value)
    {
        if (vec_.size() >= max_len_) {
            return LengthError{
                LengthError::Kind::Exceeded,
                vec_.size() + uint64_t{1},
                max_len_};
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

    bool operator==(RuntimeVariableList const &other) const
    {
        return vec_ == other.vec_;
    }
};

SSZ_NAMESPACE_END

template <class T>
struct std::hash<ssz::RuntimeVariableList<T>>
{
    size_t operator()(ssz::RuntimeVariableList<T> const &v) const
    {
        return boost::hash_range(v.begin(), v.end());
    }
};
