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

#include <ssz/core/assert.h>
#include <ssz/core/byte_string.hpp>
#include <ssz/core/bytes.hpp>
#include <ssz/core/config.hpp>
#include <ssz/merkle/hasher.hpp>

#include <openssl/evp.h>

#include <cstddef>
#include <cstring>

SSZ_MERKLE_NAMESPACE_BEGIN

void Sha256Hasher::hash(
    unsigned char const *const in, size_t const len, unsigned char *const out)
{
    unsigned int out_len = 0;
    int const ok = EVP_Digest(in, len, out, &out_len, EVP_sha256(), nullptr);
    SSZ_ASSERT(ok == 1 && out_len == HASH_SIZE);
}

bytes32_t hash_pair(bytes32_t const &left, bytes32_t const &right)
{
    unsigned char buf[2 * HASH_SIZE];
    std::memcpy(buf, left.bytes, HASH_SIZE);
    std::memcpy(buf + HASH_SIZE, right.bytes, HASH_SIZE);
    bytes32_t ret;
    Sha256Hasher::hash(buf, sizeof(buf), ret.bytes);
    return ret;
}

bytes32_t hash_bytes(byte_string_view const data)
{
    bytes32_t ret;
    Sha256Hasher::hash(data.data(), data.size(), ret.bytes);
    return ret;
}

SSZ_MERKLE_NAMESPACE_END
