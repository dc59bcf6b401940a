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

#include "transfer_manager.h"

#include "chunked_uploader.h"
#include "decrypted_message.h"
#include "file_key.h"
#include "retry_policy.h"
#include "sctl/sctl_log.h"
#include "sctl/sctl_mime_type.h"
#include "sctl/sctl_secure_random.h"
#include "sctl/sctl_timer.h"
#include "secret_chat_encryptor.h"
#include "tl/tl_serializer.h"
#include "tools.h"
#include "transfer_task.h"

#include <boost/filesystem.hpp>

#include <cstring>
#include <stdexcept>

namespace sctl {
namespace impl {

static bool starts_with(const std::string& s, const char* prefix)
{
    return s.compare(0, strlen(prefix), prefix) == 0;
}

static std::string file_base_name(const std::string& file_name)
{
    if (file_name.empty()) {
        return std::string();
    }
    return boost::filesystem::path(file_name).filename().string();
}

std::string media_mime_type(const sctl_media_meta& meta)
{
    if (!meta.mime_type.empty()) {
        return meta.mime_type;
    }
    return sctl_mime_type_by_filename(file_base_name(meta.file_name));
}

static decrypted_media_type detect_media_type(const sctl_media_meta& meta, const std::string& mime_type)
{
    switch (meta.type) {
    case sctl_media_type::photo:
        return decrypted_media_type::photo;
    case sctl_media_type::video:
        return decrypted_media_type::video;
    case sctl_media_type::document:
        return decrypted_media_type::document;
    case sctl_media_type::auto_detect:
        break;
    }

    if (meta.is_animated) {
        return decrypted_media_type::document;
    }

    // The photo descriptor has no mime type, the receiver assumes a jpeg or png.
    if (mime_type == "image/jpeg" || mime_type == "image/png") {
        return decrypted_media_type::photo;
    }

    if (starts_with(mime_type, "video/")) {
        return decrypted_media_type::video;
    }

    return decrypted_media_type::document;
}

std::shared_ptr<decrypted_message_media> build_media_descriptor(const sctl_media_meta& meta,
        int32_t file_size, const std::array<unsigned char, 32>& key, const std::array<unsigned char, 32>& iv)
{
    std::string mime_type = media_mime_type(meta);

    auto media = std::make_shared<decrypted_message_media>();
    media->type = detect_media_type(meta, mime_type);
    media->thumb = meta.thumb_data;
    media->thumb_width = meta.thumb_width;
    media->thumb_height = meta.thumb_height;
    media->width = meta.width;
    media->height = meta.height;
    media->duration = meta.duration;
    media->mime_type = mime_type;
    media->size = file_size;
    media->key.assign(key.begin(), key.end());
    media->iv.assign(iv.begin(), iv.end());
    media->caption = meta.caption;

    if (media->type != decrypted_media_type::document) {
        return media;
    }

    std::string base_name = file_base_name(meta.file_name);
    if (!base_name.empty()) {
        media->attributes.push_back(sctl_document_attribute::filename(base_name));
    }
    if (starts_with(mime_type, "image/") && (meta.width || meta.height)) {
        media->attributes.push_back(sctl_document_attribute::image_size(meta.width, meta.height));
    }
    if (meta.is_animated || mime_type == "image/gif") {
        media->attributes.push_back(sctl_document_attribute::animated());
    }
    if (starts_with(mime_type, "video/")) {
        media->attributes.push_back(sctl_document_attribute::video(meta.duration, meta.width, meta.height));
    } else if (starts_with(mime_type, "audio/")) {
        media->attributes.push_back(sctl_document_attribute::audio(meta.duration));
    }
    media->attributes.insert(media->attributes.end(), meta.extra_attributes.begin(), meta.extra_attributes.end());

    return media;
}

transfer_manager::transfer_manager(const std::shared_ptr<sctl_transport>& transport,
        const std::shared_ptr<sctl_timer_factory>& timer_factory,
        const sctl_transfer_config& config,
        const std::shared_ptr<sctl_secure_random>& random)
    : m_transport(transport)
    , m_timer_factory(timer_factory)
    , m_config(config)
    , m_random(random ? random : sctl_default_secure_random())
{
    if (!m_transport || !m_timer_factory) {
        throw std::invalid_argument("a transport and a timer factory are required");
    }
    m_config.validate();
}

transfer_manager::~transfer_manager()
{
    // Tasks wipe themselves; nobody is told since the owner is going away.
    for (auto& it: m_transfers) {
        it.second->callback = nullptr;
        it.second->state_callback = nullptr;
    }
}

std::shared_ptr<transfer_task> transfer_manager::find_transfer(int64_t random_id) const
{
    auto it = m_transfers.find(random_id);
    if (it == m_transfers.end()) {
        return nullptr;
    }
    return it->second;
}

int64_t transfer_manager::new_random_id()
{
    int64_t id = 0;
    while (!id || m_transfers.count(id)) {
        id = m_random->value<int64_t>();
    }
    return id;
}

int64_t transfer_manager::send_encrypted_media(const std::shared_ptr<const sctl_shared_secret>& secret,
        const sctl_input_peer& peer,
        const std::string& text,
        const std::shared_ptr<const std::vector<unsigned char>>& file_bytes,
        const sctl_media_meta& meta,
        const sctl_send_options& options,
        const sctl_send_callback& callback,
        const sctl_transfer_state_callback& state_callback)
{
    if (!secret) {
        throw std::invalid_argument("no shared secret for the encrypted chat");
    }
    if (file_bytes && file_bytes->empty()) {
        throw std::invalid_argument("can not send an empty file");
    }

    auto task = std::make_shared<transfer_task>();
    task->random_id = new_random_id();
    task->peer = peer;
    task->secret = secret;
    task->text = text;
    task->file_bytes = file_bytes;
    task->meta = meta;
    task->options = options;
    task->total_bytes = file_bytes ? static_cast<int64_t>(file_bytes->size()) : 0;
    task->callback = callback;
    task->state_callback = state_callback;

    int64_t random_id = task->random_id;
    m_transfers[random_id] = task;

    SCTL_NOTICE("sending message " << random_id << " to encrypted chat " << peer.chat_id
            << (file_bytes ? " with a file of " + std::to_string(file_bytes->size()) + " bytes" : std::string()));

    task->set_state(sctl_transfer_state::idle);
    if (task->is_finished()) {
        return random_id;
    }

    if (task->has_file()) {
        encrypt_and_upload(task);
    } else {
        serialize_and_encrypt(task);
    }

    return random_id;
}

void transfer_manager::encrypt_and_upload(const std::shared_ptr<transfer_task>& task)
{
    size_t parts = part_count(task->file_bytes->size(), m_config.part_size);
    if (parts > m_config.max_parts) {
        SCTL_ERROR("file of " << task->file_bytes->size() << " bytes needs " << parts << " parts, at most "
                << m_config.max_parts << " are allowed");
        finish_transfer(task, sctl_transfer_error::file_too_large);
        return;
    }

    task->set_state(sctl_transfer_state::encrypting);
    if (task->is_finished()) {
        return;
    }

    int64_t random_id = task->random_id;
    std::weak_ptr<transfer_manager> weak_this = shared_from_this();
    try {
        encrypted_file encrypted = encrypt_file(*task->file_bytes, *m_random);
        task->file_key = std::move(encrypted.key_material);

        int64_t file_id = 0;
        while (!file_id) {
            file_id = m_random->value<int64_t>();
        }

        auto ciphertext = std::make_shared<const std::vector<unsigned char>>(std::move(encrypted.ciphertext));
        task->uploader = std::make_shared<chunked_uploader>(m_transport, m_timer_factory, m_config, file_id, ciphertext,
                [weak_this, random_id](sctl_transfer_error error) {
                    if (auto self = weak_this.lock()) {
                        self->upload_finished(random_id, error);
                    }
                },
                [weak_this, random_id](int64_t uploaded_bytes) {
                    if (auto self = weak_this.lock()) {
                        self->upload_progress(random_id, uploaded_bytes);
                    }
                });
    } catch (const sctl_error& e) {
        SCTL_ERROR("encrypting the file of transfer " << random_id << " failed: " << e.what());
        finish_transfer(task, e.code());
        return;
    }

    SCTL_DEBUG("file of transfer " << random_id << " encrypted, fingerprint " << task->file_key->fingerprint());

    task->set_state(sctl_transfer_state::uploading);
    if (task->is_finished()) {
        return;
    }

    // Keep the uploader alive even if a synchronous transport finishes the task.
    auto uploader = task->uploader;
    uploader->start();
}

void transfer_manager::upload_progress(int64_t random_id, int64_t uploaded_bytes)
{
    auto task = find_transfer(random_id);
    if (task) {
        task->set_uploaded_bytes(uploaded_bytes);
    }
}

void transfer_manager::upload_finished(int64_t random_id, sctl_transfer_error error)
{
    auto task = find_transfer(random_id);
    if (!task || task->is_finished()) {
        SCTL_DEBUG("upload of transfer " << random_id << " finished after the transfer ended");
        return;
    }

    if (error != sctl_transfer_error::none) {
        SCTL_ERROR("upload of transfer " << random_id << " failed: " << error);
        finish_transfer(task, error);
        return;
    }

    auto file = std::make_shared<sctl_input_encrypted_file>();
    file->file_id = task->uploader->file_id();
    file->parts = task->uploader->total_parts();
    file->key_fingerprint = task->file_key->fingerprint();
    file->is_big = task->uploader->is_big();
    task->uploaded_file = file;

    SCTL_DEBUG("uploaded all " << file->parts << " parts of file " << file->file_id);

    try {
        tl_serializer s;
        serialize_input_encrypted_file(s, *file);
        task->uploaded_file_tl = std::make_shared<const std::vector<unsigned char>>(s.release());

        task->media = build_media_descriptor(task->meta, static_cast<int32_t>(task->file_bytes->size()),
                task->file_key->key(), task->file_key->iv());
    } catch (const sctl_error& e) {
        SCTL_ERROR("building the descriptor of transfer " << random_id << " failed: " << e.what());
        finish_transfer(task, e.code());
        return;
    }

    task->set_state(sctl_transfer_state::descriptor_built);
    if (task->is_finished()) {
        return;
    }

    serialize_and_encrypt(task);
}

void transfer_manager::serialize_and_encrypt(const std::shared_ptr<transfer_task>& task)
{
    try {
        decrypted_message message;
        message.random_id = task->random_id;
        message.ttl = task->options.ttl;
        message.message = task->text;
        message.media = task->media;
        message.entities = task->options.entities;
        message.via_bot_name = task->options.via_bot_name;
        message.reply_to_random_id = task->options.reply_to_random_id;

        tl_serializer s;
        serialize_decrypted_message(s, message);
        task->serialized_message = s.release();
    } catch (const sctl_error& e) {
        SCTL_ERROR("serializing message " << task->random_id << " failed: " << e.what());
        finish_transfer(task, e.code());
        return;
    }

    task->set_state(sctl_transfer_state::message_serialized);
    if (task->is_finished()) {
        return;
    }

    try {
        std::vector<unsigned char> envelope = encrypt_message(task->serialized_message, *task->secret,
                task->secret->is_originator(), *m_random);
        task->envelope = std::make_shared<const std::vector<unsigned char>>(std::move(envelope));
    } catch (const sctl_error& e) {
        SCTL_ERROR("encrypting message " << task->random_id << " failed: " << e.what());
        finish_transfer(task, e.code());
        return;
    }

    // The plaintext carries the file key.
    sctl_secure_clear(task->serialized_message);
    task->serialized_message.clear();

    task->set_state(sctl_transfer_state::message_encrypted);
    if (task->is_finished()) {
        return;
    }

    send_message(task);
}

void transfer_manager::send_message(const std::shared_ptr<transfer_task>& task)
{
    int64_t random_id = task->random_id;
    uint64_t call_id = ++task->send_call_id;
    task->send_in_flight = true;

    std::weak_ptr<transfer_manager> weak_this = shared_from_this();
    task->send_timeout_timer = m_timer_factory->create_timer([weak_this, random_id, call_id] {
        if (auto self = weak_this.lock()) {
            self->send_finished(random_id, call_id, sctl_transport_status::timed_out, sctl_message_handle());
        }
    });
    task->send_timeout_timer->start(m_config.request_timeout);

    SCTL_DEBUG("sending message " << random_id << ", attempt " << task->send_attempts + 1);
    m_transport->send_encrypted_file(task->peer, random_id, task->envelope, task->uploaded_file, task->uploaded_file_tl,
            [weak_this, random_id, call_id](sctl_transport_status status, const sctl_message_handle& message) {
                if (auto self = weak_this.lock()) {
                    self->send_finished(random_id, call_id, status, message);
                }
            });
}

void transfer_manager::send_finished(int64_t random_id, uint64_t call_id, sctl_transport_status status,
        const sctl_message_handle& message)
{
    auto task = find_transfer(random_id);
    if (!task || !task->send_in_flight || task->send_call_id != call_id) {
        SCTL_DEBUG("ignoring stale send result " << status << " for message " << random_id);
        return;
    }

    task->send_in_flight = false;
    if (task->send_timeout_timer) {
        task->send_timeout_timer->cancel();
        task->send_timeout_timer.reset();
    }

    if (status == sctl_transport_status::ok) {
        SCTL_NOTICE("message " << random_id << " sent");
        m_transfers.erase(random_id);
        sctl_message_handle handle = message;
        if (!handle.random_id) {
            handle.random_id = random_id;
        }
        task->succeed(handle);
        return;
    }

    ++task->send_attempts;
    if (!can_retry(m_config, task->send_attempts)) {
        SCTL_ERROR("sending message " << random_id << " failed " << task->send_attempts << " times, giving up: " << status);
        finish_transfer(task, transport_error(status, sctl_transfer_error::send_failure));
        return;
    }

    double delay = retry_delay(m_config, task->send_attempts - 1);
    SCTL_WARNING("sending message " << random_id << " " << status << ", retrying in " << delay << " seconds");

    std::weak_ptr<transfer_manager> weak_this = shared_from_this();
    task->send_retry_timer = m_timer_factory->create_timer([weak_this, random_id] {
        if (auto self = weak_this.lock()) {
            auto task = self->find_transfer(random_id);
            if (task && !task->is_finished()) {
                task->send_retry_timer.reset();
                self->send_message(task);
            }
        }
    });
    task->send_retry_timer->start(delay);
}

void transfer_manager::finish_transfer(const std::shared_ptr<transfer_task>& task, sctl_transfer_error error)
{
    m_transfers.erase(task->random_id);
    task->fail(error);
}

void transfer_manager::cancel_transfer(int64_t random_id)
{
    auto task = find_transfer(random_id);
    if (!task) {
        SCTL_DEBUG("transfer " << random_id << " is not in flight");
        return;
    }

    SCTL_NOTICE("cancelling transfer " << random_id << " in state " << task->state);
    finish_transfer(task, sctl_transfer_error::cancelled);
}

void transfer_manager::cancel_all()
{
    if (m_transfers.empty()) {
        return;
    }

    SCTL_NOTICE("cancelling " << m_transfers.size() << " transfers");
    std::map<int64_t, std::shared_ptr<transfer_task>> transfers;
    transfers.swap(m_transfers);
    for (auto& it: transfers) {
        it.second->fail(sctl_transfer_error::cancelled);
    }
}

bool transfer_manager::is_transferring(int64_t random_id) const
{
    return m_transfers.count(random_id) != 0;
}

}
}

std::shared_ptr<sctl_transfer_manager> sctl_create_transfer_manager(
        const std::shared_ptr<sctl_transport>& transport,
        const std::shared_ptr<sctl_timer_factory>& timer_factory,
        const sctl_transfer_config& config,
        const std::shared_ptr<sctl_secure_random>& random)
{
    return std::make_shared<sctl::impl::transfer_manager>(transport, timer_factory, config, random);
}
