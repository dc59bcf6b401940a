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

#ifndef __SCTL_CRYPTO_AES_H__
#define __SCTL_CRYPTO_AES_H__

#include <openssl/evp.h>

#include <cstddef>

static constexpr size_t SCTLC_AES_BLOCK_SIZE = 16;

// Single block AES-256 keyed for one direction. OpenSSL only sees ECB with
// padding disabled, any chaining is done by the caller.
class SCTLC_aes_key
{
public:
    SCTLC_aes_key();
    ~SCTLC_aes_key();

    SCTLC_aes_key(const SCTLC_aes_key&) = delete;
    SCTLC_aes_key& operator=(const SCTLC_aes_key&) = delete;

    EVP_CIPHER_CTX* ctx() const { return m_ctx; }

private:
    EVP_CIPHER_CTX* m_ctx;
};

// Both return 1 on success and 0 on failure, like OpenSSL.
int SCTLC_aes_set_encrypt_key(const unsigned char* key, int bits, SCTLC_aes_key* aes_key);
int SCTLC_aes_set_decrypt_key(const unsigned char* key, int bits, SCTLC_aes_key* aes_key);

// Transforms exactly one block in the direction the key was set up for.
int SCTLC_aes_block(const SCTLC_aes_key* aes_key, const unsigned char* in, unsigned char* out);

#endif
