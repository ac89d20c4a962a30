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

#include <ssz/container/length_error.hpp>
#include <ssz/core/config.hpp>
#include <ssz/core/result.hpp>

#include <cstdint>
#include <string>

SSZ_NAMESPACE_BEGIN

/**
 * A JSON value could not be read as a container. `index` names the first
 * rejected element for InvalidElement; `length` carries the capacity
 * violation for Length.
 */
struct JsonError
{
    enum class Kind : uint8_t
    {
        NotAnArray,
        InvalidElement, // wrong type, negative, or out of range of the element
        Length,
    };

    Kind kind{Kind::NotAnArray};
    uint64_t index{0};
    LengthError length{};

    friend bool operator==(JsonError const &, JsonError const &) = default;

    std::string message() const;
};

template <class T>
using JsonResult = Result<T, JsonError>;

SSZ_NAMESPACE_END
