/*
    This file is part of sctl-library

    This library is free software; you can redistribute it and/or
    modify it under the terms of the GNU Lesser General Public
    License as published by the Free Software Foundation; either
    version 2.1 of the License, or (at your option) any later version.

    This library is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
    Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public
    License along with this library; if not, write to the Free Software
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA

    Copyright Topology LP 2016-2017
*/

#pragma once

#include <cstddef>
#include <vector>

class sctl_secure_random;

namespace sctl {
namespace impl {

static constexpr size_t AES_IGE_KEY_SIZE = 32;
static constexpr size_t AES_IGE_IV_SIZE = 32;

// AES-256 in Infinite Garble Extension mode. The 32 byte iv is the pair
// (previous ciphertext block, previous plaintext block) seeding the chain.
//
// Throws sctl_cipher_error if the data is not a whole number of blocks or the
// key or iv has the wrong size. Nothing is padded here.
void aes_ige_encrypt(const unsigned char* from, size_t from_len, unsigned char* to,
        const unsigned char* key, size_t key_len, const unsigned char* iv, size_t iv_len);
void aes_ige_decrypt(const unsigned char* from, size_t from_len, unsigned char* to,
        const unsigned char* key, size_t key_len, const unsigned char* iv, size_t iv_len);

std::vector<unsigned char> aes_ige_encrypt(const std::vector<unsigned char>& plaintext,
        const std::vector<unsigned char>& key, const std::vector<unsigned char>& iv);
std::vector<unsigned char> aes_ige_decrypt(const std::vector<unsigned char>& ciphertext,
        const std::vector<unsigned char>& key, const std::vector<unsigned char>& iv);

// Appends random bytes until the size is a multiple of the AES block size.
// The original length is not recorded anywhere.
void pad_to_block(std::vector<unsigned char>& data, sctl_secure_random& random);

}
}
