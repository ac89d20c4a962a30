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

#include <ssz/core/bytes.hpp>
#include <ssz/core/config.hpp>

SSZ_MERKLE_NAMESPACE_BEGIN

// Deepest tree a 64 bit chunk count can need
inline constexpr unsigned MAX_TREE_DEPTH = 64;

// Root of a tree of `depth` levels whose leaves are all zero chunks.
// zero_hash(0) is the zero chunk itself.
bytes32_t const &zero_hash(unsigned depth);

SSZ_MERKLE_NAMESPACE_END
