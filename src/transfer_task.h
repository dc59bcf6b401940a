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

#include "sctl/sctl_media.h"
#include "sctl/sctl_secret_chat.h"
#include "sctl/sctl_transfer_manager.h"
#include "sctl/sctl_transport.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

class sctl_timer;

namespace sctl {
namespace impl {

class chunked_uploader;
class file_key_material;
struct decrypted_message_media;

// Everything one send owns: the file key, the ciphertext parts through the
// uploader, the serialized message and the envelope. Nothing is shared with
// other transfers except the secret.
class transfer_task {
public:
    int64_t random_id;
    sctl_input_peer peer;
    std::shared_ptr<const sctl_shared_secret> secret;
    std::string text;
    std::shared_ptr<const std::vector<unsigned char>> file_bytes;
    sctl_media_meta meta;
    sctl_send_options options;

    sctl_transfer_state state;
    int64_t uploaded_bytes;
    int64_t total_bytes;

    std::unique_ptr<file_key_material> file_key;
    std::shared_ptr<chunked_uploader> uploader;
    std::shared_ptr<const sctl_input_encrypted_file> uploaded_file;
    std::shared_ptr<const std::vector<unsigned char>> uploaded_file_tl;
    std::shared_ptr<decrypted_message_media> media;
    std::vector<unsigned char> serialized_message;
    std::shared_ptr<const std::vector<unsigned char>> envelope;

    int32_t send_attempts;
    uint64_t send_call_id;
    bool send_in_flight;
    std::shared_ptr<sctl_timer> send_timeout_timer;
    std::shared_ptr<sctl_timer> send_retry_timer;

    sctl_send_callback callback;
    sctl_transfer_state_callback state_callback;

    transfer_task();
    ~transfer_task();

    bool has_file() const { return static_cast<bool>(file_bytes); }
    bool is_finished() const { return state == sctl_transfer_state::sent || state == sctl_transfer_state::failed; }

    void set_state(sctl_transfer_state state);
    void set_uploaded_bytes(int64_t uploaded_bytes);

    // Terminal transitions. Each wipes the key material and reports to the
    // callback; only the first one has any effect.
    void succeed(const sctl_message_handle& message);
    void fail(sctl_transfer_error error);

private:
    void wipe();
    void report(const sctl_send_result& result);
};

}
}
