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

#include <ssz/core/assert.h>
#include <ssz/core/config.hpp>

#include <optional>
#include <utility>

SSZ_NAMESPACE_BEGIN

/**
 * Optional value (EIP-6475). Behaves like a list of at most one element:
 * serialized as nothing or as a 0x01 selector followed by the value, and
 * merkleized with its length mixed in.
 */
template <class T>
class Optional
{
    std::optional<T> value_;

public:
    using value_type = T;

    Optional() = default;

    Optional(T value)
        : value_{std::move(value)}
    {
    }

    Optional(std::nullopt_t) {}

    static Optional none()
    {
        return Optional{};
    }

    bool has_value() const noexcept
    {
        return value_.has_value();
    }

    explicit operator bool() const noexcept
    {
        return has_value();
    }

    T const &operator*() const
    {
        SSZ_DEBUG_ASSERT(value_.has_value());
        return *value_;
    }

    T &operator*()
    {
        SSZ_DEBUG_ASSERT(value_.has_value());
        return *value_;
    }

    T const *operator->() const
    {
        SSZ_DEBUG_ASSERT(value_.has_value());
        return &*value_;
    }

    std::optional<T> const &as_optional() const noexcept
    {
        return value_;
    }

    friend bool operator==(Optional const &, Optional const &) = default;
};

SSZ_NAMESPACE_END
