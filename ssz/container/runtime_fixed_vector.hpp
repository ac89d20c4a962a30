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

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <span>
#include <utility>
#include <vector>

SSZ_NAMESPACE_BEGIN

// FixedVector whose length is chosen at run time
template <class T>
class RuntimeFixedVector
{
    std::vector<T> vec_;
    uint64_t len_{0};

    RuntimeFixedVector(std::vector<T> &&vec, uint64_t const len)
        : vec_(std::move(vec))
        , len_{len}
    {
    }

public:
    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    static LengthResult<RuntimeFixedVector>
    make(std::vector<T> vec, uint64_t const len)
    {
        if (vec.size() != len) {
            return LengthError{LengthError::Kind::Mismatch, vec.size(), len};
        }
        return RuntimeFixedVector{std::move(vec), len};
    }

    // The length is the size of `vec`
    static RuntimeFixedVector from_vec(std::vector<T> vec)
    {
        uint64_t const len = vec.size();
        return RuntimeFixedVector{std::move(vec), len};
    }

    static RuntimeFixedVector from_elem(T const &value, uint64_t const len)
    {
        return RuntimeFixedVector{std::vector<T>(safe_len(len), value), len};
    }

    static RuntimeFixedVector default_of(uint64_t const len)
    {
        return RuntimeFixedVector{std::vector<T>(safe_len(len)), len};
    }

    template <std::input_iterator It, std::sentinel_for<It> S>
    static LengthResult<RuntimeFixedVector>
    try_from_iter(It first, S last, uint64_t const len)
    {
        auto res = collect_bounded<T>(std::move(first), std::move(last), len);
        if (res.has_error()) {
            return LengthError{
                LengthError::Kind::Mismatch, res.error().length, len};
        }
        return make(std::move(res).value(), len);
    }

    // Moves the elements out, leaving `len()` default elements behind
    std::vector<T> take()
    {
        std::vector<T> out(safe_len(len_));
        out.swap(vec_);
        return out;
    }

    uint64_t len() const noexcept
    {
        return len_;
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

    bool operator==(RuntimeFixedVector const &other) const
    {
        return vec_ == other.vec_;
    }
};

SSZ_NAMESPACE_END

template <class T>
struct std::hash<ssz::RuntimeFixedVector<T>>
{
    size_t operator()(ssz::RuntimeFixedVector<T> const &v) const
    {
        return boost::hash_range(v.begin(), v.end());
    }
};
