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

#ifndef __SCTL_CRYPTO_SHA_H__
#define __SCTL_CRYPTO_SHA_H__

#include <openssl/evp.h>

#include <cstddef>

static constexpr size_t SCTLC_SHA1_DIGEST_LENGTH = 20;
static constexpr size_t SCTLC_SHA256_DIGEST_LENGTH = 32;
static constexpr size_t SCTLC_MD5_DIGEST_LENGTH = 16;

void SCTLC_sha1(const unsigned char* d, size_t n, unsigned char* md);
void SCTLC_sha256(const unsigned char* d, size_t n, unsigned char* md);
void SCTLC_md5(const unsigned char* d, size_t n, unsigned char* md);

// Incremental SHA-256 for inputs that live in separate buffers.
class SCTLC_sha256_ctx
{
public:
    SCTLC_sha256_ctx();
    ~SCTLC_sha256_ctx();

    SCTLC_sha256_ctx(const SCTLC_sha256_ctx&) = delete;
    SCTLC_sha256_ctx& operator=(const SCTLC_sha256_ctx&) = delete;

    void update(const unsigned char* d, size_t n);
    void final(unsigned char* md);

private:
    EVP_MD_CTX* m_ctx;
};

#endif
