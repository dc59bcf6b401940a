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

    Copyright Vitaly Valtman 2013-2015
    Copyright Topology LP 2016-2017
*/

#include "sctl/sctl_secret_chat.h"

#include "crypto/crypto_sha.h"
#include "tools.h"

#include <cstring>
#include <stdexcept>
#include <string>

sctl_shared_secret::sctl_shared_secret(const unsigned char* key, size_t size, bool is_originator)
    : m_is_originator(is_originator)
    , m_key_fingerprint(0)
{
    if (!key || size != key_size()) {
        throw std::invalid_argument("the shared secret must be " + std::to_string(key_size())
                + " bytes, got " + std::to_string(size));
    }

    memcpy(m_key.data(), key, m_key.size());

    unsigned char sha1_buffer[SCTLC_SHA1_DIGEST_LENGTH];
    SCTLC_sha1(m_key.data(), m_key.size(), sha1_buffer);
    memcpy(&m_key_fingerprint, sha1_buffer + 12, 8);
    sctl_secure_zero(sha1_buffer, sizeof(sha1_buffer));
}

sctl_shared_secret::sctl_shared_secret(const std::vector<unsigned char>& key, bool is_originator)
    : sctl_shared_secret(key.data(), key.size(), is_originator)
{
}

sctl_shared_secret::~sctl_shared_secret()
{
    sctl_secure_clear(m_key);
}
