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

#include "message_key.h"
#include "sctl/sctl_secret_chat.h"
#include "tools.h"

#include <gtest/gtest.h>

#include <cstring>

using namespace sctl::impl;

namespace {

std::vector<unsigned char> counting_secret()
{
    std::vector<unsigned char> key(256);
    for (size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<unsigned char>(i);
    }
    return key;
}

std::string hex(const std::array<unsigned char, 32>& a)
{
    return sctl_binary_to_hex(a.data(), a.size());
}

}

TEST(message_key, known_answer_both_directions)
{
    sctl_shared_secret secret(counting_secret());
    unsigned char msg_key[16];
    memset(msg_key, 0xaa, sizeof(msg_key));

    message_key_material outgoing;
    derive_message_key(msg_key, secret, true, outgoing);
    EXPECT_EQ("1dcee139e6e1563405577528cf5ca3da6094ea00cd5aaf002ee49a9bbd87bc82", hex(outgoing.aes_key));
    EXPECT_EQ("17024326916d33720de6a5a4a789017ab46e4cee87d96fbc7a9b5ac4d43af581", hex(outgoing.aes_iv));
    EXPECT_EQ(0, memcmp(msg_key, outgoing.msg_key.data(), 16));

    message_key_material incoming;
    derive_message_key(msg_key, secret, false, incoming);
    EXPECT_EQ("ac3e04b8f5eb9635d493eb86c047af3fe1bc191d2f20d8baaf3bb7da769df0c8", hex(incoming.aes_key));
    EXPECT_EQ("79a1d21469d2fc235dc2a99b5f5229097d299edfffc9ac9f375d9340432b7141", hex(incoming.aes_iv));
}

TEST(message_key, direction_changes_key_and_iv)
{
    sctl_shared_secret secret(counting_secret());
    unsigned char msg_key[16] = { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16 };

    message_key_material a;
    message_key_material b;
    derive_message_key(msg_key, secret, true, a);
    derive_message_key(msg_key, secret, false, b);
    EXPECT_NE(a.aes_key, b.aes_key);
    EXPECT_NE(a.aes_iv, b.aes_iv);
}

TEST(message_key, derivation_is_deterministic)
{
    sctl_shared_secret secret(counting_secret(), false);
    unsigned char msg_key[16] = { 0 };

    message_key_material a;
    message_key_material b;
    derive_message_key(msg_key, secret, false, a);
    derive_message_key(msg_key, secret, false, b);
    EXPECT_EQ(a.aes_key, b.aes_key);
    EXPECT_EQ(a.aes_iv, b.aes_iv);
}

TEST(message_key, direction_offset)
{
    EXPECT_EQ(0u, direction_offset(true));
    EXPECT_EQ(8u, direction_offset(false));
}
