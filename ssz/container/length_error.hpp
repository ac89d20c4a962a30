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

#include <ssz/core/config.hpp>
#include <ssz/core/result.hpp>

#include <cstdint>
#include <string>

SSZ_NAMESPACE_BEGIN

/**
 * A container was asked to hold a number of elements its capacity does not
 * allow. `length` is the offending length: for a failed append it is the
 * length the container would have had, not its current one.
 */
struct LengthError
{
    enum class Kind : uint8_t
    {
        Mismatch, // fixed shape, length != capacity
        Exceeded, // variable shape, length > capacity
    };

    Kind kind{Kind::Mismatch};
    uint64_t length{0};
    uint64_t limit{0};

    friend bool operator==(LengthError const &, LengthError const &) = default;

    std::string message() const;
};

template <class T>
using LengthResult = Result<T, LengthError>;

SSZ_NAMESPACE_END
