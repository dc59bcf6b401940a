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

#include "aes_ige.h"

#include "crypto/crypto_aes.h"
#include "sctl/sctl_error.h"
#include "sctl/sctl_secure_random.h"
#include "tools.h"

#include <string.h>
#include <string>

namespace sctl {
namespace impl {

static constexpr size_t BLOCK = SCTLC_AES_BLOCK_SIZE;

static void check_arguments(size_t data_len, size_t key_len, size_t iv_len)
{
    if (data_len % BLOCK) {
        throw sctl_cipher_error("data length " + std::to_string(data_len) + " is not a multiple of the block size");
    }
    if (key_len != AES_IGE_KEY_SIZE) {
        throw sctl_cipher_error("aes key must be 32 bytes, got " + std::to_string(key_len));
    }
    if (iv_len != AES_IGE_IV_SIZE) {
        throw sctl_cipher_error("aes iv must be 32 bytes, got " + std::to_string(iv_len));
    }
}

static inline void xor_block(unsigned char* dst, const unsigned char* a, const unsigned char* b)
{
    for (size_t i = 0; i < BLOCK; ++i) {
        dst[i] = a[i] ^ b[i];
    }
}

void aes_ige_encrypt(const unsigned char* from, size_t from_len, unsigned char* to,
        const unsigned char* key, size_t key_len, const unsigned char* iv, size_t iv_len)
{
    check_arguments(from_len, key_len, iv_len);

    SCTLC_aes_key aes_key;
    if (!SCTLC_aes_set_encrypt_key(key, 256, &aes_key)) {
        throw sctl_cipher_error("failed to set the aes encryption key");
    }

    // iv1 follows the ciphertext, iv2 the plaintext.
    unsigned char iv1[BLOCK];
    unsigned char iv2[BLOCK];
    memcpy(iv1, iv, BLOCK);
    memcpy(iv2, iv + BLOCK, BLOCK);

    unsigned char plain[BLOCK];
    unsigned char buffer[BLOCK];
    for (size_t offset = 0; offset < from_len; offset += BLOCK) {
        memcpy(plain, from + offset, BLOCK);
        xor_block(buffer, plain, iv1);
        if (!SCTLC_aes_block(&aes_key, buffer, buffer)) {
            throw sctl_cipher_error("aes block encryption failed");
        }
        xor_block(to + offset, buffer, iv2);
        memcpy(iv1, to + offset, BLOCK);
        memcpy(iv2, plain, BLOCK);
    }

    sctl_secure_zero(iv1, sizeof(iv1));
    sctl_secure_zero(iv2, sizeof(iv2));
    sctl_secure_zero(plain, sizeof(plain));
    sctl_secure_zero(buffer, sizeof(buffer));
}

void aes_ige_decrypt(const unsigned char* from, size_t from_len, unsigned char* to,
        const unsigned char* key, size_t key_len, const unsigned char* iv, size_t iv_len)
{
    check_arguments(from_len, key_len, iv_len);

    SCTLC_aes_key aes_key;
    if (!SCTLC_aes_set_decrypt_key(key, 256, &aes_key)) {
        throw sctl_cipher_error("failed to set the aes decryption key");
    }

    unsigned char iv1[BLOCK];
    unsigned char iv2[BLOCK];
    memcpy(iv1, iv, BLOCK);
    memcpy(iv2, iv + BLOCK, BLOCK);

    unsigned char cipher[BLOCK];
    unsigned char buffer[BLOCK];
    for (size_t offset = 0; offset < from_len; offset += BLOCK) {
        memcpy(cipher, from + offset, BLOCK);
        xor_block(buffer, cipher, iv2);
        if (!SCTLC_aes_block(&aes_key, buffer, buffer)) {
            throw sctl_cipher_error("aes block decryption failed");
        }
        xor_block(to + offset, buffer, iv1);
        memcpy(iv1, cipher, BLOCK);
        memcpy(iv2, to + offset, BLOCK);
    }

    sctl_secure_zero(iv1, sizeof(iv1));
    sctl_secure_zero(iv2, sizeof(iv2));
    sctl_secure_zero(buffer, sizeof(buffer));
}

std::vector<unsigned char> aes_ige_encrypt(const std::vector<unsigned char>& plaintext,
        const std::vector<unsigned char>& key, const std::vector<unsigned char>& iv)
{
    std::vector<unsigned char> result(plaintext.size());
    aes_ige_encrypt(plaintext.data(), plaintext.size(), result.data(), key.data(), key.size(), iv.data(), iv.size());
    return result;
}

std::vector<unsigned char> aes_ige_decrypt(const std::vector<unsigned char>& ciphertext,
        const std::vector<unsigned char>& key, const std::vector<unsigned char>& iv)
{
    std::vector<unsigned char> result(ciphertext.size());
    aes_ige_decrypt(ciphertext.data(), ciphertext.size(), result.data(), key.data(), key.size(), iv.data(), iv.size());
    return result;
}

void pad_to_block(std::vector<unsigned char>& data, sctl_secure_random& random)
{
    size_t padding_size = (BLOCK - data.size() % BLOCK) % BLOCK;
    if (!padding_size) {
        return;
    }
    size_t old_size = data.size();
    data.resize(old_size + padding_size);
    random.fill(data.data() + old_size, padding_size);
}

}
}
