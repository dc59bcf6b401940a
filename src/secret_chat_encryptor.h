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

#include <cstddef>
#include <vector>

class sctl_secure_random;
class sctl_shared_secret;

namespace sctl {
namespace impl {

static constexpr size_t MESSAGE_MIN_PADDING = 12;
static constexpr size_t MESSAGE_MAX_PADDING = 1024;

// msg_key = sha256(secret[88+x : 120+x] + padded_plaintext)[8:24]
void compute_msg_key(const unsigned char* padded_plaintext, size_t size, const sctl_shared_secret& secret,
        bool is_outgoing, unsigned char* msg_key);

// Appends 12 to 1024 random bytes, then enough more to reach a multiple of the
// block size, and returns msg_key + IGE(padded plaintext). The receiver finds
// the end of the record from the TL encoding itself.
std::vector<unsigned char> encrypt_message(const std::vector<unsigned char>& plaintext,
        const sctl_shared_secret& secret, bool is_outgoing, sctl_secure_random& random);

// The inverse, including the msg_key check. Throws sctl_cipher_error on a
// malformed envelope or when msg_key does not verify. The result still
// carries its random padding.
std::vector<unsigned char> decrypt_message(const unsigned char* envelope, size_t size,
        const sctl_shared_secret& secret, bool is_outgoing);

}
}
