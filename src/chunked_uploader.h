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
#include "sctl/sctl_error.h"
#include "sctl/sctl_transport.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

class sctl_timer;
class sctl_timer_factory;

namespace sctl {
namespace impl {

using file_part_list = std::vector<std::shared_ptr<const std::vector<unsigned char>>>;

size_t part_count(size_t size, size_t part_size);

// Slices data into part_size chunks, the last one possibly shorter.
file_part_list split_into_parts(const std::vector<unsigned char>& data, size_t part_size);

using chunked_upload_done_callback = std::function<void(sctl_transfer_error)>;
using chunked_upload_progress_callback = std::function<void(int64_t uploaded_bytes)>;

// Uploads one encrypted file. At most max_parallel_parts calls are in flight,
// every call is bounded by request_timeout and a failed part is retried on its
// own with exponential backoff. The done callback runs once, after every part
// was acknowledged or after the first part ran out of attempts.
class chunked_uploader: public std::enable_shared_from_this<chunked_uploader>
{
public:
    // Throws sctl_error(file_too_large) when the file needs more than
    // config.max_parts parts and std::invalid_argument for an empty file.
    chunked_uploader(const std::shared_ptr<sctl_transport>& transport,
            const std::shared_ptr<sctl_timer_factory>& timer_factory,
            const sctl_transfer_config& config,
            int64_t file_id,
            const std::shared_ptr<const std::vector<unsigned char>>& data,
            const chunked_upload_done_callback& done_callback,
            const chunked_upload_progress_callback& progress_callback = nullptr);
    ~chunked_uploader();

    void start();

    // Stops dispatching, forgets the parts and never calls back.
    void cancel();

    int64_t file_id() const { return m_file_id; }
    int32_t total_parts() const { return static_cast<int32_t>(m_parts.size()); }
    bool is_big() const { return m_is_big; }
    int64_t uploaded_bytes() const { return m_uploaded_bytes; }
    bool finished() const { return m_finished; }

private:
    struct part_state {
        int32_t attempts;
        uint64_t call_id;
        bool in_flight;
        std::shared_ptr<sctl_timer> timeout_timer;
        std::shared_ptr<sctl_timer> retry_timer;

        part_state()
            : attempts(0)
            , call_id(0)
            , in_flight(false)
        { }
    };

    void upload_multiple_parts();
    void upload_part(size_t index);
    void upload_part_finished(size_t index, uint64_t call_id, sctl_transport_status status);
    void finish(sctl_transfer_error error);
    void stop_timers();

    std::shared_ptr<sctl_transport> m_transport;
    std::shared_ptr<sctl_timer_factory> m_timer_factory;
    sctl_transfer_config m_config;
    int64_t m_file_id;
    bool m_is_big;
    file_part_list m_parts;
    std::vector<part_state> m_part_states;
    size_t m_next_part;
    size_t m_active_parts;
    size_t m_acknowledged_parts;
    int64_t m_uploaded_bytes;
    uint64_t m_next_call_id;
    bool m_started;
    bool m_finished;
    chunked_upload_done_callback m_done_callback;
    chunked_upload_progress_callback m_progress_callback;
};

}
}
