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

#ifndef __SCTL_TRANSFER_MANAGER_H__
#define __SCTL_TRANSFER_MANAGER_H__

#include "sctl_config.h"
#include "sctl_error.h"
#include "sctl_media.h"
#include "sctl_secret_chat.h"
#include "sctl_transport.h"

#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

class sctl_secure_random;
class sctl_timer_factory;

enum class sctl_transfer_state
{
    idle,
    encrypting,
    uploading,
    descriptor_built,
    message_serialized,
    message_encrypted,
    sent,
    failed,
};

inline static std::string to_string(sctl_transfer_state state)
{
    switch (state) {
    case sctl_transfer_state::idle:
        return "idle";
    case sctl_transfer_state::encrypting:
        return "encrypting";
    case sctl_transfer_state::uploading:
        return "uploading";
    case sctl_transfer_state::descriptor_built:
        return "descriptor built";
    case sctl_transfer_state::message_serialized:
        return "message serialized";
    case sctl_transfer_state::message_encrypted:
        return "message encrypted";
    case sctl_transfer_state::sent:
        return "sent";
    case sctl_transfer_state::failed:
        return "failed";
    }

    return "unknown";
}

inline static std::ostream& operator<<(std::ostream& os, sctl_transfer_state state)
{
    os << to_string(state);
    return os;
}

struct sctl_send_result
{
    int64_t random_id;
    sctl_transfer_error error;
    sctl_message_handle message;

    sctl_send_result()
        : random_id(0)
        , error(sctl_transfer_error::none)
    { }

    bool succeeded() const { return error == sctl_transfer_error::none; }
};

// Called exactly once per transfer.
using sctl_send_callback = std::function<void(const sctl_send_result& result)>;

// Called on every state change and after every acknowledged upload part.
using sctl_transfer_state_callback = std::function<void(sctl_transfer_state state,
        int64_t uploaded_bytes, int64_t total_bytes)>;

class sctl_transfer_manager
{
public:
    virtual ~sctl_transfer_manager() { }

    // Sends text with an optional file attachment to an encrypted chat and
    // returns the random_id identifying the message. file_bytes may be null.
    // Throws std::invalid_argument for a null secret or an empty, non-null file.
    virtual int64_t send_encrypted_media(const std::shared_ptr<const sctl_shared_secret>& secret,
            const sctl_input_peer& peer,
            const std::string& text,
            const std::shared_ptr<const std::vector<unsigned char>>& file_bytes,
            const sctl_media_meta& meta,
            const sctl_send_options& options,
            const sctl_send_callback& callback,
            const sctl_transfer_state_callback& state_callback = nullptr) = 0;

    // Abandons the transfer, ignores any late transport callback and reports
    // sctl_transfer_error::cancelled. Unknown ids are ignored.
    virtual void cancel_transfer(int64_t random_id) = 0;

    // Chat teardown: cancels every transfer in flight.
    virtual void cancel_all() = 0;

    virtual bool is_transferring(int64_t random_id) const = 0;
    virtual size_t transfer_count() const = 0;
};

// Validates the config first, see sctl_transfer_config::validate(). A null
// random source selects sctl_default_secure_random().
std::shared_ptr<sctl_transfer_manager> sctl_create_transfer_manager(
        const std::shared_ptr<sctl_transport>& transport,
        const std::shared_ptr<sctl_timer_factory>& timer_factory,
        const sctl_transfer_config& config = sctl_transfer_config(),
        const std::shared_ptr<sctl_secure_random>& random = nullptr);

#endif
