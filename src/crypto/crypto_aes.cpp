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

    Copyright Topology LP 2016
*/

#include "crypto/crypto_aes.h"

#include <new>

SCTLC_aes_key::SCTLC_aes_key()
    : m_ctx(EVP_CIPHER_CTX_new())
{
    if (!m_ctx) {
        throw std::bad_alloc();
    }
}

SCTLC_aes_key::~SCTLC_aes_key()
{
    // Frees and cleanses the expanded key schedule.
    EVP_CIPHER_CTX_free(m_ctx);
}

static int aes_init(const unsigned char* key, int bits, SCTLC_aes_key* aes_key, int enc)
{
    if (bits != 256) {
        return 0;
    }
    if (EVP_CipherInit_ex(aes_key->ctx(), EVP_aes_256_ecb(), nullptr, key, nullptr, enc) != 1) {
        return 0;
    }
    return EVP_CIPHER_CTX_set_padding(aes_key->ctx(), 0) == 1 ? 1 : 0;
}

int SCTLC_aes_set_encrypt_key(const unsigned char* key, int bits, SCTLC_aes_key* aes_key)
{
    return aes_init(key, bits, aes_key, 1);
}

int SCTLC_aes_set_decrypt_key(const unsigned char* key, int bits, SCTLC_aes_key* aes_key)
{
    return aes_init(key, bits, aes_key, 0);
}

int SCTLC_aes_block(const SCTLC_aes_key* aes_key, const unsigned char* in, unsigned char* out)
{
    int len = 0;
    if (EVP_CipherUpdate(aes_key->ctx(), out, &len, in, static_cast<int>(SCTLC_AES_BLOCK_SIZE)) != 1) {
        return 0;
    }
    return len == static_cast<int>(SCTLC_AES_BLOCK_SIZE) ? 1 : 0;
}
