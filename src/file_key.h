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

    Copyright Vitaly Valtman 2014-2015
    Copyright Topology LP 2016-2017
*/

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

class sctl_secure_random;

namespace sctl {
namespace impl {

// The key and iv a single file is encrypted with. They travel to the peer
// inside the encrypted message and are never derived from the chat key.
class file_key_material
{
public:
    file_key_material(const std::array<unsigned char, 32>& key, const std::array<unsigned char, 32>& iv);
    ~file_key_material();

    file_key_material(const file_key_material&) = delete;
    file_key_material& operator=(const file_key_material&) = delete;

    static std::unique_ptr<file_key_material> generate(sctl_secure_random& random);

    const std::array<unsigned char, 32>& key() const { return m_key; }
    const std::array<unsigned char, 32>& iv() const { return m_iv; }
    int32_t fingerprint() const { return m_fingerprint; }

private:
    std::array<unsigned char, 32> m_key;
    std::array<unsigned char, 32> m_iv;
    int32_t m_fingerprint;
};

// digest = md5(key + iv), fingerprint = digest[0..4] ^ digest[4..8] read as
// a little endian int32.
int32_t compute_key_fingerprint(const unsigned char* key, size_t key_len, const unsigned char* iv, size_t iv_len);

struct encrypted_file {
    std::vector<unsigned char> ciphertext;
    std::unique_ptr<file_key_material> key_material;
};

// Pads the data with random bytes to a whole number of blocks and encrypts it
// with a freshly generated file key.
encrypted_file encrypt_file(const std::vector<unsigned char>& data, sctl_secure_random& random);

// Verifies the fingerprint before touching the ciphertext and throws
// sctl_key_fingerprint_mismatch if it does not match. The result is truncated
// to plaintext_size when it is given and not larger than the ciphertext.
std::vector<unsigned char> decrypt_file(const std::vector<unsigned char>& ciphertext,
        const std::vector<unsigned char>& key, const std::vector<unsigned char>& iv,
        int32_t fingerprint, size_t plaintext_size = static_cast<size_t>(-1));

}
}
