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
#include <cstdint>
#include <vector>

// The encrypted chat as the server knows it.
struct sctl_input_peer {
    int32_t chat_id;
    int64_t access_hash;

    sctl_input_peer()
        : chat_id(0), access_hash(0)
    {}

    sctl_input_peer(int32_t chat_id, int64_t access_hash)
        : chat_id(chat_id), access_hash(access_hash)
    {}

    bool empty() const { return chat_id == 0 && access_hash == 0; }
};

inline bool operator==(const sctl_input_peer& lhs, const sctl_input_peer& rhs)
{
    return lhs.chat_id == rhs.chat_id && lhs.access_hash == rhs.access_hash;
}

// The long-term key agreed on by the key exchange. It is handed over once by
// the session layer and only ever read afterwards.
class sctl_shared_secret
{
public:
    // Throws std::invalid_argument unless exactly key_size() bytes are given.
    // is_originator tells whether this side created the chat, which selects
    // the key derivation direction of the messages it sends.
    sctl_shared_secret(const unsigned char* key, size_t size, bool is_originator = true);
    explicit sctl_shared_secret(const std::vector<unsigned char>& key, bool is_originator = true);
    ~sctl_shared_secret();

    sctl_shared_secret(const sctl_shared_secret&) = delete;
    sctl_shared_secret& operator=(const sctl_shared_secret&) = delete;

    const unsigned char* key() const { return m_key.data(); }
    bool is_originator() const { return m_is_originator; }

    // Lower 64 bits of SHA1(key), the id both peers use for this key.
    int64_t key_fingerprint() const { return m_key_fingerprint; }

    static constexpr size_t key_size() { return 256; }

private:
    std::array<unsigned char, 256> m_key;
    bool m_is_originator;
    int64_t m_key_fingerprint;
};
