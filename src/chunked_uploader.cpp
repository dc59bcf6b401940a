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

#include "chunked_uploader.h"

#include "retry_policy.h"
#include "sctl/sctl_log.h"
#include "sctl/sctl_timer.h"

#include <algorithm>
#include <stdexcept>

namespace sctl {
namespace impl {

size_t part_count(size_t size, size_t part_size)
{
    if (!part_size) {
        throw std::invalid_argument("part size must not be zero");
    }
    return (size + part_size - 1) / part_size;
}

file_part_list split_into_parts(const std::vector<unsigned char>& data, size_t part_size)
{
    file_part_list parts;
    parts.reserve(part_count(data.size(), part_size));
    for (size_t offset = 0; offset < data.size(); offset += part_size) {
        size_t length = std::min(part_size, data.size() - offset);
        parts.push_back(std::make_shared<const std::vector<unsigned char>>(
                data.begin() + offset, data.begin() + offset + length));
    }
    return parts;
}

chunked_uploader::chunked_uploader(const std::shared_ptr<sctl_transport>& transport,
        const std::shared_ptr<sctl_timer_factory>& timer_factory,
        const sctl_transfer_config& config,
        int64_t file_id,
        const std::shared_ptr<const std::vector<unsigned char>>& data,
        const chunked_upload_done_callback& done_callback,
        const chunked_upload_progress_callback& progress_callback)
    : m_transport(transport)
    , m_timer_factory(timer_factory)
    , m_config(config)
    , m_file_id(file_id)
    , m_is_big(false)
    , m_next_part(0)
    , m_active_parts(0)
    , m_acknowledged_parts(0)
    , m_uploaded_bytes(0)
    , m_next_call_id(0)
    , m_started(false)
    , m_finished(false)
    , m_done_callback(done_callback)
    , m_progress_callback(progress_callback)
{
    if (!data || data->empty()) {
        throw std::invalid_argument("can not upload an empty file");
    }

    size_t parts = part_count(data->size(), m_config.part_size);
    if (parts > m_config.max_parts) {
        throw sctl_error(sctl_transfer_error::file_too_large, "file of " + std::to_string(data->size())
                + " bytes needs " + std::to_string(parts) + " parts, at most "
                + std::to_string(m_config.max_parts) + " are allowed");
    }

    m_is_big = data->size() >= m_config.big_file_threshold;
    m_parts = split_into_parts(*data, m_config.part_size);
    m_part_states.resize(m_parts.size());
}

chunked_uploader::~chunked_uploader()
{
    stop_timers();
}

void chunked_uploader::start()
{
    if (m_started) {
        return;
    }
    m_started = true;

    SCTL_DEBUG("uploading file " << m_file_id << " in " << m_parts.size() << (m_is_big ? " big" : "") << " parts");
    upload_multiple_parts();
}

void chunked_uploader::cancel()
{
    if (m_finished) {
        return;
    }

    SCTL_DEBUG("cancelling upload of file " << m_file_id);
    m_finished = true;
    stop_timers();
    m_parts.clear();
    m_done_callback = nullptr;
    m_progress_callback = nullptr;
}

void chunked_uploader::upload_multiple_parts()
{
    while (!m_finished && m_next_part < m_parts.size() && m_active_parts < m_config.max_parallel_parts) {
        ++m_active_parts;
        upload_part(m_next_part++);
    }
}

void chunked_uploader::upload_part(size_t index)
{
    if (m_finished) {
        return;
    }

    part_state& state = m_part_states[index];
    uint64_t call_id = ++m_next_call_id;
    state.call_id = call_id;
    state.in_flight = true;

    std::weak_ptr<chunked_uploader> weak_this = shared_from_this();
    state.timeout_timer = m_timer_factory->create_timer([weak_this, index, call_id] {
        if (auto self = weak_this.lock()) {
            self->upload_part_finished(index, call_id, sctl_transport_status::timed_out);
        }
    });
    state.timeout_timer->start(m_config.request_timeout);

    sctl_file_part part;
    part.file_id = m_file_id;
    part.part_index = static_cast<int32_t>(index);
    part.total_parts = static_cast<int32_t>(m_parts.size());
    part.is_big = m_is_big;
    part.bytes = m_parts[index];

    SCTL_DEBUG("uploading part " << index << " of file " << m_file_id << ", attempt " << state.attempts + 1);
    m_transport->upload_part(part, [weak_this, index, call_id](sctl_transport_status status) {
        if (auto self = weak_this.lock()) {
            self->upload_part_finished(index, call_id, status);
        }
    });
}

void chunked_uploader::upload_part_finished(size_t index, uint64_t call_id, sctl_transport_status status)
{
    if (m_finished || index >= m_part_states.size()) {
        return;
    }

    part_state& state = m_part_states[index];
    if (!state.in_flight || state.call_id != call_id) {
        SCTL_DEBUG("ignoring stale result " << status << " for part " << index << " of file " << m_file_id);
        return;
    }

    state.in_flight = false;
    if (state.timeout_timer) {
        state.timeout_timer->cancel();
        state.timeout_timer.reset();
    }

    if (status == sctl_transport_status::ok) {
        --m_active_parts;
        ++m_acknowledged_parts;
        m_uploaded_bytes += m_parts[index]->size();
        if (m_progress_callback) {
            m_progress_callback(m_uploaded_bytes);
        }
        if (m_finished) {
            return;
        }
        if (m_acknowledged_parts == m_parts.size()) {
            finish(sctl_transfer_error::none);
            return;
        }
        upload_multiple_parts();
        return;
    }

    ++state.attempts;
    if (!can_retry(m_config, state.attempts)) {
        SCTL_ERROR("part " << index << " of file " << m_file_id << " failed " << state.attempts
                << " times, giving up: " << status);
        finish(transport_error(status, sctl_transfer_error::upload_part_failure));
        return;
    }

    double delay = retry_delay(m_config, state.attempts - 1);
    SCTL_WARNING("part " << index << " of file " << m_file_id << " " << status << ", retrying in " << delay << " seconds");

    std::weak_ptr<chunked_uploader> weak_this = shared_from_this();
    state.retry_timer = m_timer_factory->create_timer([weak_this, index] {
        // Resetting the timer may destroy this closure.
        size_t part_index = index;
        if (auto self = weak_this.lock()) {
            self->m_part_states[part_index].retry_timer.reset();
            self->upload_part(part_index);
        }
    });
    state.retry_timer->start(delay);
}

void chunked_uploader::finish(sctl_transfer_error error)
{
    m_finished = true;
    stop_timers();

    if (error != sctl_transfer_error::none) {
        // None of the acknowledged parts will ever be referenced.
        m_parts.clear();
    }

    auto callback = std::move(m_done_callback);
    m_done_callback = nullptr;
    m_progress_callback = nullptr;
    if (callback) {
        callback(error);
    }
}

void chunked_uploader::stop_timers()
{
    for (auto& state: m_part_states) {
        if (state.timeout_timer) {
            state.timeout_timer->cancel();
            state.timeout_timer.reset();
        }
        if (state.retry_timer) {
            state.retry_timer->cancel();
            state.retry_timer.reset();
        }
        state.in_flight = false;
    }
}

}
}
