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

#include "transfer_task.h"

#include "chunked_uploader.h"
#include "decrypted_message.h"
#include "file_key.h"
#include "sctl/sctl_log.h"
#include "sctl/sctl_timer.h"
#include "tools.h"

#include <algorithm>

namespace sctl {
namespace impl {

transfer_task::transfer_task()
    : random_id(0)
    , state(sctl_transfer_state::idle)
    , uploaded_bytes(0)
    , total_bytes(0)
    , send_attempts(0)
    , send_call_id(0)
    , send_in_flight(false)
{
}

transfer_task::~transfer_task()
{
    wipe();
}

void transfer_task::set_state(sctl_transfer_state new_state)
{
    SCTL_DEBUG("transfer " << random_id << ": " << state << " -> " << new_state);
    state = new_state;
    if (state_callback) {
        state_callback(state, uploaded_bytes, total_bytes);
    }
}

void transfer_task::set_uploaded_bytes(int64_t bytes)
{
    // The ciphertext is padded, the observer only ever sees plaintext sizes.
    uploaded_bytes = std::min(bytes, total_bytes);
    if (state_callback) {
        state_callback(state, uploaded_bytes, total_bytes);
    }
}

void transfer_task::succeed(const sctl_message_handle& message)
{
    if (is_finished()) {
        return;
    }

    wipe();
    set_state(sctl_transfer_state::sent);

    sctl_send_result result;
    result.random_id = random_id;
    result.message = message;
    report(result);
}

void transfer_task::fail(sctl_transfer_error error)
{
    if (is_finished()) {
        return;
    }

    wipe();
    set_state(sctl_transfer_state::failed);

    sctl_send_result result;
    result.random_id = random_id;
    result.error = error;
    report(result);
}

void transfer_task::wipe()
{
    if (uploader) {
        uploader->cancel();
        uploader.reset();
    }
    if (send_timeout_timer) {
        send_timeout_timer->cancel();
        send_timeout_timer.reset();
    }
    if (send_retry_timer) {
        send_retry_timer->cancel();
        send_retry_timer.reset();
    }
    send_in_flight = false;

    file_key.reset();
    media.reset();
    sctl_secure_clear(serialized_message);
    serialized_message.clear();
}

void transfer_task::report(const sctl_send_result& result)
{
    auto cb = std::move(callback);
    callback = nullptr;
    state_callback = nullptr;
    if (cb) {
        cb(result);
    }
}

}
}
