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

#include "secret_chat_encryptor.h"

#include "aes_ige.h"
#include "crypto/crypto_aes.h"
#include "crypto/crypto_sha.h"
#include "message_key.h"
#include "sctl/sctl_error.h"
#include "sctl/sctl_log.h"
#include "sctl/sctl_secret_chat.h"
#include "sctl/sctl_secure_random.h"
#include "tools.h"

#include <openssl/crypto.h>

#include <string.h>

namespace sctl {
namespace impl {

void compute_msg_key(const unsigned char* padded_plaintext, size_t size, const sctl_shared_secret& secret,
        bool is_outgoing, unsigned char* msg_key)
{
    unsigned char sha256_buffer[SCTLC_SHA256_DIGEST_LENGTH];
    SCTLC_sha256_ctx ctx;
    ctx.update(secret.key() + 88 + direction_offset(is_outgoing), 32);
    ctx.update(padded_plaintext, size);
    ctx.final(sha256_buffer);
    memcpy(msg_key, sha256_buffer + 8, MSG_KEY_SIZE);
    sctl_secure_zero(sha256_buffer, sizeof(sha256_buffer));
}

std::vector<unsigned char> encrypt_message(const std::vector<unsigned char>& plaintext,
        const sctl_shared_secret& secret, bool is_outgoing, sctl_secure_random& random)
{
    size_t padding = random.uniform(MESSAGE_MIN_PADDING, MESSAGE_MAX_PADDING);
    while ((plaintext.size() + padding) % SCTLC_AES_BLOCK_SIZE) {
        ++padding;
    }

    std::vector<unsigned char> envelope(MSG_KEY_SIZE + plaintext.size() + padding);
    unsigned char* body = envelope.data() + MSG_KEY_SIZE;
    if (!plaintext.empty()) {
        memcpy(body, plaintext.data(), plaintext.size());
    }
    random.fill(body + plaintext.size(), padding);

    message_key_material material;
    compute_msg_key(body, plaintext.size() + padding, secret, is_outgoing, material.msg_key.data());
    derive_message_key(material.msg_key.data(), secret, is_outgoing, material);
    memcpy(envelope.data(), material.msg_key.data(), MSG_KEY_SIZE);

    aes_ige_encrypt(body, plaintext.size() + padding, body,
            material.aes_key.data(), material.aes_key.size(), material.aes_iv.data(), material.aes_iv.size());

    SCTL_DEBUG("encrypted message of " << plaintext.size() << " bytes with " << padding << " bytes of padding");
    return envelope;
}

std::vector<unsigned char> decrypt_message(const unsigned char* envelope, size_t size,
        const sctl_shared_secret& secret, bool is_outgoing)
{
    if (size < MSG_KEY_SIZE + SCTLC_AES_BLOCK_SIZE || (size - MSG_KEY_SIZE) % SCTLC_AES_BLOCK_SIZE) {
        throw sctl_cipher_error("invalid encrypted message length " + std::to_string(size));
    }

    message_key_material material;
    derive_message_key(envelope, secret, is_outgoing, material);

    std::vector<unsigned char> plaintext(size - MSG_KEY_SIZE);
    aes_ige_decrypt(envelope + MSG_KEY_SIZE, plaintext.size(), plaintext.data(),
            material.aes_key.data(), material.aes_key.size(), material.aes_iv.data(), material.aes_iv.size());

    unsigned char msg_key[MSG_KEY_SIZE];
    compute_msg_key(plaintext.data(), plaintext.size(), secret, is_outgoing, msg_key);
    if (CRYPTO_memcmp(msg_key, envelope, MSG_KEY_SIZE)) {
        sctl_secure_clear(plaintext);
        SCTL_WARNING("msg_key mismatch in encrypted message of " << size << " bytes");
        throw sctl_cipher_error("msg_key mismatch");
    }

    return plaintext;
}

}
}
