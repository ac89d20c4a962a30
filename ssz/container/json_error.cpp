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

#include <ssz/container/json_error.hpp>
#include <ssz/core/config.hpp>

#include <fmt/format.h>

#include <string>

SSZ_NAMESPACE_BEGIN

std::string JsonError::message() const
{
    switch (kind) {
    case Kind::NotAnArray:
        return "expected a JSON array";
    case Kind::InvalidElement:
        return fmt::format("element {} is not a valid value", index);
    case Kind::Length:
        return length.message();
    }
    return "invalid JSON value";
}

SSZ_NAMESPACE_END
