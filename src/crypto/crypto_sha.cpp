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

#include "crypto/crypto_sha.h"

#include "sctl/sctl_error.h"

#include <new>

static void digest(const EVP_MD* type, const unsigned char* d, size_t n, unsigned char* md)
{
    if (EVP_Digest(d, n, md, nullptr, type, nullptr) != 1) {
        throw sctl_cipher_error("digest computation failed");
    }
}

void SCTLC_sha1(const unsigned char* d, size_t n, unsigned char* md)
{
    digest(EVP_sha1(), d, n, md);
}

void SCTLC_sha256(const unsigned char* d, size_t n, unsigned char* md)
{
    digest(EVP_sha256(), d, n, md);
}

void SCTLC_md5(const unsigned char* d, size_t n, unsigned char* md)
{
    digest(EVP_md5(), d, n, md);
}

SCTLC_sha256_ctx::SCTLC_sha256_ctx()
    : m_ctx(EVP_MD_CTX_new())
{
    if (!m_ctx) {
        throw std::bad_alloc();
    }
    if (EVP_DigestInit_ex(m_ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(m_ctx);
        throw sctl_cipher_error("sha256 init failed");
    }
}

SCTLC_sha256_ctx::~SCTLC_sha256_ctx()
{
    EVP_MD_CTX_free(m_ctx);
}

void SCTLC_sha256_ctx::update(const unsigned char* d, size_t n)
{
    if (EVP_DigestUpdate(m_ctx, d, n) != 1) {
        throw sctl_cipher_error("sha256 update failed");
    }
}

void SCTLC_sha256_ctx::final(unsigned char* md)
{
    if (EVP_DigestFinal_ex(m_ctx, md, nullptr) != 1) {
        throw sctl_cipher_error("sha256 final failed");
    }
}
