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

#include "file_key.h"

#include "aes_ige.h"
#include "crypto/crypto_sha.h"
#include "sctl/sctl_error.h"
#include "sctl/sctl_log.h"
#include "sctl/sctl_secure_random.h"
#include "tools.h"

#include <string.h>

namespace sctl {
namespace impl {

file_key_material::file_key_material(const std::array<unsigned char, 32>& key, const std::array<unsigned char, 32>& iv)
    : m_key(key)
    , m_iv(iv)
    , m_fingerprint(compute_key_fingerprint(key.data(), key.size(), iv.data(), iv.size()))
{
}

file_key_material::~file_key_material()
{
    sctl_secure_clear(m_key);
    sctl_secure_clear(m_iv);
}

std::unique_ptr<file_key_material> file_key_material::generate(sctl_secure_random& random)
{
    std::array<unsigned char, 32> key;
    std::array<unsigned char, 32> iv;
    random.fill(key.data(), key.size());
    random.fill(iv.data(), iv.size());
    std::unique_ptr<file_key_material> material(new file_key_material(key, iv));
    sctl_secure_clear(key);
    sctl_secure_clear(iv);
    return material;
}

int32_t compute_key_fingerprint(const unsigned char* key, size_t key_len, const unsigned char* iv, size_t iv_len)
{
    if (key_len != AES_IGE_KEY_SIZE || iv_len != AES_IGE_IV_SIZE) {
        throw sctl_cipher_error("file key and iv must be 32 bytes each");
    }

    unsigned char md5[SCTLC_MD5_DIGEST_LENGTH];
    unsigned char str[64];
    memcpy(str, key, 32);
    memcpy(str + 32, iv, 32);
    SCTLC_md5(str, sizeof(str), md5);
    sctl_secure_zero(str, sizeof(str));

    uint32_t fingerprint = 0;
    for (size_t i = 0; i < 4; ++i) {
        fingerprint |= static_cast<uint32_t>(md5[i] ^ md5[i + 4]) << (8 * i);
    }
    return static_cast<int32_t>(fingerprint);
}

encrypted_file encrypt_file(const std::vector<unsigned char>& data, sctl_secure_random& random)
{
    encrypted_file result;
    result.key_material = file_key_material::generate(random);

    result.ciphertext = data;
    pad_to_block(result.ciphertext, random);

    const auto& key = result.key_material->key();
    const auto& iv = result.key_material->iv();
    aes_ige_encrypt(result.ciphertext.data(), result.ciphertext.size(), result.ciphertext.data(),
            key.data(), key.size(), iv.data(), iv.size());

    SCTL_DEBUG("encrypted file of " << data.size() << " bytes into " << result.ciphertext.size()
            << " bytes, fingerprint " << result.key_material->fingerprint());
    return result;
}

std::vector<unsigned char> decrypt_file(const std::vector<unsigned char>& ciphertext,
        const std::vector<unsigned char>& key, const std::vector<unsigned char>& iv,
        int32_t fingerprint, size_t plaintext_size)
{
    int32_t actual = compute_key_fingerprint(key.data(), key.size(), iv.data(), iv.size());
    if (actual != fingerprint) {
        SCTL_WARNING("refusing to decrypt file: fingerprint " << actual << " does not match " << fingerprint);
        throw sctl_key_fingerprint_mismatch(fingerprint, actual);
    }

    std::vector<unsigned char> plaintext = aes_ige_decrypt(ciphertext, key, iv);
    if (plaintext_size < plaintext.size()) {
        plaintext.resize(plaintext_size);
    }
    return plaintext;
}

}
}
