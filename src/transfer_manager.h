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

#include "sctl/sctl_config.h"
#include "sctl/sctl_transfer_manager.h"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

class sctl_secure_random;
class sctl_timer_factory;

namespace sctl {
namespace impl {

class transfer_task;
struct decrypted_message_media;

class transfer_manager: public std::enable_shared_from_this<transfer_manager>, public sctl_transfer_manager
{
public:
    transfer_manager(const std::shared_ptr<sctl_transport>& transport,
            const std::shared_ptr<sctl_timer_factory>& timer_factory,
            const sctl_transfer_config& config,
            const std::shared_ptr<sctl_secure_random>& random);
    ~transfer_manager();

    virtual int64_t send_encrypted_media(const std::shared_ptr<const sctl_shared_secret>& secret,
            const sctl_input_peer& peer,
            const std::string& text,
            const std::shared_ptr<const std::vector<unsigned char>>& file_bytes,
            const sctl_media_meta& meta,
            const sctl_send_options& options,
            const sctl_send_callback& callback,
            const sctl_transfer_state_callback& state_callback = nullptr) override;
    virtual void cancel_transfer(int64_t random_id) override;
    virtual void cancel_all() override;
    virtual bool is_transferring(int64_t random_id) const override;
    virtual size_t transfer_count() const override { return m_transfers.size(); }

private:
    std::shared_ptr<transfer_task> find_transfer(int64_t random_id) const;
    int64_t new_random_id();

    void encrypt_and_upload(const std::shared_ptr<transfer_task>& task);
    void upload_progress(int64_t random_id, int64_t uploaded_bytes);
    void upload_finished(int64_t random_id, sctl_transfer_error error);
    void serialize_and_encrypt(const std::shared_ptr<transfer_task>& task);
    void send_message(const std::shared_ptr<transfer_task>& task);
    void send_finished(int64_t random_id, uint64_t call_id, sctl_transport_status status,
            const sctl_message_handle& message);
    void finish_transfer(const std::shared_ptr<transfer_task>& task, sctl_transfer_error error);

private:
    std::shared_ptr<sctl_transport> m_transport;
    std::shared_ptr<sctl_timer_factory> m_timer_factory;
    sctl_transfer_config m_config;
    std::shared_ptr<sctl_secure_random> m_random;
    std::map<int64_t, std::shared_ptr<transfer_task>> m_transfers;
};

// Picks the descriptor kind from the explicit type or, for auto_detect, from
// the mime type.
std::string media_mime_type(const sctl_media_meta& meta);
std::shared_ptr<decrypted_message_media> build_media_descriptor(const sctl_media_meta& meta,
        int32_t file_size, const std::array<unsigned char, 32>& key, const std::array<unsigned char, 32>& iv);

}
}
