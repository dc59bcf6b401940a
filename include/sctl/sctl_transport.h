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

#pragma once

#include "sctl_secret_chat.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

enum class sctl_transport_status
{
    ok,
    failed,
    timed_out,
};

inline static std::string to_string(sctl_transport_status status)
{
    switch (status) {
    case sctl_transport_status::ok:
        return "ok";
    case sctl_transport_status::failed:
        return "failed";
    case sctl_transport_status::timed_out:
        return "timed out";
    default:
        return "unknown transport status";
    }
}

inline static std::ostream& operator<<(std::ostream& os, sctl_transport_status status)
{
    os << to_string(status);
    return os;
}

// One slice of an encrypted file on its way to the server.
struct sctl_file_part
{
    int64_t file_id;
    int32_t part_index;
    int32_t total_parts;
    bool is_big;
    std::shared_ptr<const std::vector<unsigned char>> bytes;

    sctl_file_part()
        : file_id(0)
        , part_index(0)
        , total_parts(0)
        , is_big(false)
    { }
};

// Refers to a completely uploaded file when the message is sent.
struct sctl_input_encrypted_file
{
    int64_t file_id;
    int32_t parts;
    int32_t key_fingerprint;
    bool is_big;

    sctl_input_encrypted_file()
        : file_id(0)
        , parts(0)
        , key_fingerprint(0)
        , is_big(false)
    { }
};

// What the server returns for a delivered message.
struct sctl_message_handle
{
    int64_t random_id;
    int32_t date;
    std::shared_ptr<const std::vector<unsigned char>> server_payload;

    sctl_message_handle()
        : random_id(0)
        , date(0)
    { }
};

using sctl_upload_part_callback = std::function<void(sctl_transport_status)>;
using sctl_send_encrypted_callback = std::function<void(sctl_transport_status, const sctl_message_handle&)>;

// Implemented by the host on top of its RPC client. Both calls must invoke
// their callback exactly once unless the call is abandoned by a timeout, in
// which case a late callback is ignored.
class sctl_transport
{
public:
    virtual ~sctl_transport() { }

    // Repeating a call with the same file_id, part_index and bytes is harmless.
    virtual void upload_part(const sctl_file_part& part, const sctl_upload_part_callback& callback) = 0;

    // file is null for a message without attachment. The encoded TL reference
    // is passed along so the transport does not have to build it.
    virtual void send_encrypted_file(const sctl_input_peer& peer, int64_t random_id,
            const std::shared_ptr<const std::vector<unsigned char>>& envelope,
            const std::shared_ptr<const sctl_input_encrypted_file>& file,
            const std::shared_ptr<const std::vector<unsigned char>>& file_tl,
            const sctl_send_encrypted_callback& callback) = 0;
};
