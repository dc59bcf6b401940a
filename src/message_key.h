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

#pragma once

#include <array>
#include <cstddef>

class sctl_shared_secret;

namespace sctl {
namespace impl {

static constexpr size_t MSG_KEY_SIZE = 16;

// Per message keys. They only exist while one message is being encrypted or
// decrypted and are wiped afterwards.
struct message_key_material {
    std::array<unsigned char, 16> msg_key;
    std::array<unsigned char, 32> aes_key;
    std::array<unsigned char, 32> aes_iv;

    message_key_material() = default;
    ~message_key_material();

    message_key_material(const message_key_material&) = delete;
    message_key_material& operator=(const message_key_material&) = delete;
};

// 0 for messages travelling from the chat originator, 8 the other way.
static inline size_t direction_offset(bool is_outgoing)
{
    return is_outgoing ? 0 : 8;
}

// MTProto 2.0 key derivation:
//   a = sha256(msg_key + secret[x:x+36]), b = sha256(secret[40+x:76+x] + msg_key)
//   aes_key = a[0:8] + b[8:24] + a[24:32], aes_iv = b[0:8] + a[8:24] + b[24:32]
void derive_message_key(const unsigned char* msg_key, const sctl_shared_secret& secret, bool is_outgoing,
        message_key_material& material);

}
}
