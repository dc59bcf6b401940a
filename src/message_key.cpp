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

#include "message_key.h"

#include "crypto/crypto_sha.h"
#include "sctl/sctl_secret_chat.h"
#include "tools.h"

#include <string.h>

namespace sctl {
namespace impl {

message_key_material::~message_key_material()
{
    sctl_secure_clear(msg_key);
    sctl_secure_clear(aes_key);
    sctl_secure_clear(aes_iv);
}

void derive_message_key(const unsigned char* msg_key, const sctl_shared_secret& secret, bool is_outgoing,
        message_key_material& material)
{
    const unsigned char* key = secret.key();
    size_t x = direction_offset(is_outgoing);

    unsigned char sha256a_buffer[SCTLC_SHA256_DIGEST_LENGTH];
    unsigned char sha256b_buffer[SCTLC_SHA256_DIGEST_LENGTH];
    unsigned char buf[52];

    memcpy(buf, msg_key, 16);
    memcpy(buf + 16, key + x, 36);
    SCTLC_sha256(buf, sizeof(buf), sha256a_buffer);

    memcpy(buf, key + 40 + x, 36);
    memcpy(buf + 36, msg_key, 16);
    SCTLC_sha256(buf, sizeof(buf), sha256b_buffer);

    memcpy(material.msg_key.data(), msg_key, 16);

    memcpy(material.aes_key.data(), sha256a_buffer, 8);
    memcpy(material.aes_key.data() + 8, sha256b_buffer + 8, 16);
    memcpy(material.aes_key.data() + 24, sha256a_buffer + 24, 8);

    memcpy(material.aes_iv.data(), sha256b_buffer, 8);
    memcpy(material.aes_iv.data() + 8, sha256a_buffer + 8, 16);
    memcpy(material.aes_iv.data() + 24, sha256b_buffer + 24, 8);

    sctl_secure_zero(buf, sizeof(buf));
    sctl_secure_zero(sha256a_buffer, sizeof(sha256a_buffer));
    sctl_secure_zero(sha256b_buffer, sizeof(sha256b_buffer));
}

}
}
