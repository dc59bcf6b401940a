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

#include "sctl/sctl_secure_random.h"
#include "sctl/sctl_timer.h"
#include "sctl/sctl_transport.h"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace sctl {
namespace test {

// xorshift64*, so that every run sees the same keys, ids and padding.
class deterministic_random: public sctl_secure_random
{
public:
    explicit deterministic_random(uint64_t seed = 0x9e3779b97f4a7c15ULL)
        : m_state(seed ? seed : 1)
    { }

    virtual void fill(unsigned char* buffer, size_t length) override
    {
        for (size_t i = 0; i < length; ++i) {
            m_state ^= m_state >> 12;
            m_state ^= m_state << 25;
            m_state ^= m_state >> 27;
            buffer[i] = static_cast<unsigned char>((m_state * 0x2545f4914f6cdd1dULL) >> 56);
        }
        m_bytes_drawn += length;
    }

    size_t bytes_drawn() const { return m_bytes_drawn; }

private:
    uint64_t m_state;
    size_t m_bytes_drawn = 0;
};

// Virtual clock. Timers only fire from advance().
class manual_timer_factory: public sctl_timer_factory
{
public:
    class manual_timer: public sctl_timer
    {
    public:
        manual_timer(manual_timer_factory* factory, const std::function<void()>& cb)
            : m_factory(factory)
            , m_cb(cb)
            , m_armed(false)
            , m_deadline(0)
        { }

        virtual void start(double timeout_seconds) override
        {
            m_armed = true;
            m_deadline = m_factory->now() + std::max(timeout_seconds, 0.0);
            m_factory->m_started_timeouts.push_back(timeout_seconds);
        }

        virtual void cancel() override { m_armed = false; }

        bool armed() const { return m_armed; }
        double deadline() const { return m_deadline; }

    private:
        friend class manual_timer_factory;
        manual_timer_factory* m_factory;
        std::function<void()> m_cb;
        bool m_armed;
        double m_deadline;
    };

    virtual std::shared_ptr<sctl_timer> create_timer(const std::function<void()>& cb) override
    {
        auto timer = std::make_shared<manual_timer>(this, cb);
        m_timers.push_back(timer);
        return timer;
    }

    double now() const { return m_now; }

    // Fires every timer due within the next seconds, earliest first.
    void advance(double seconds)
    {
        double target = m_now + seconds;
        while (true) {
            std::shared_ptr<manual_timer> next;
            for (const auto& weak_timer: m_timers) {
                auto timer = weak_timer.lock();
                if (timer && timer->armed() && timer->deadline() <= target
                        && (!next || timer->deadline() < next->deadline())) {
                    next = timer;
                }
            }
            if (!next) {
                break;
            }
            m_now = next->deadline();
            next->m_armed = false;
            if (hold_timers_while_firing) {
                next->m_cb();
            } else {
                // Only the owner keeps the timer alive, as a host timer may.
                manual_timer* timer = next.get();
                next.reset();
                timer->m_cb();
            }
        }
        m_now = target;
    }

    size_t armed_timers() const
    {
        size_t count = 0;
        for (const auto& weak_timer: m_timers) {
            auto timer = weak_timer.lock();
            if (timer && timer->armed()) {
                ++count;
            }
        }
        return count;
    }

    // Every timeout passed to start(), in call order.
    const std::vector<double>& started_timeouts() const { return m_started_timeouts; }

    bool hold_timers_while_firing = true;

private:
    double m_now = 0;
    std::vector<std::weak_ptr<manual_timer>> m_timers;
    std::vector<double> m_started_timeouts;
};

// Records every call and leaves completing them to the test.
class fake_transport: public sctl_transport
{
public:
    struct upload_call {
        sctl_file_part part;
        sctl_upload_part_callback callback;
    };

    struct send_call {
        sctl_input_peer peer;
        int64_t random_id;
        std::shared_ptr<const std::vector<unsigned char>> envelope;
        std::shared_ptr<const sctl_input_encrypted_file> file;
        std::shared_ptr<const std::vector<unsigned char>> file_tl;
        sctl_send_encrypted_callback callback;
    };

    virtual void upload_part(const sctl_file_part& part, const sctl_upload_part_callback& callback) override
    {
        upload_call call;
        call.part = part;
        call.callback = callback;
        uploads.push_back(call);
        pending_uploads.push_back(call);
        max_pending_uploads = std::max(max_pending_uploads, pending_uploads.size());
    }

    virtual void send_encrypted_file(const sctl_input_peer& peer, int64_t random_id,
            const std::shared_ptr<const std::vector<unsigned char>>& envelope,
            const std::shared_ptr<const sctl_input_encrypted_file>& file,
            const std::shared_ptr<const std::vector<unsigned char>>& file_tl,
            const sctl_send_encrypted_callback& callback) override
    {
        send_call call;
        call.peer = peer;
        call.random_id = random_id;
        call.envelope = envelope;
        call.file = file;
        call.file_tl = file_tl;
        call.callback = callback;
        sends.push_back(call);
        pending_sends.push_back(call);
    }

    // Completes the oldest pending upload.
    void complete_upload(sctl_transport_status status)
    {
        upload_call call = pending_uploads.front();
        pending_uploads.pop_front();
        call.callback(status);
    }

    // Completes the oldest pending upload of the given part.
    bool complete_part(int32_t part_index, sctl_transport_status status)
    {
        for (auto it = pending_uploads.begin(); it != pending_uploads.end(); ++it) {
            if (it->part.part_index == part_index) {
                upload_call call = *it;
                pending_uploads.erase(it);
                call.callback(status);
                return true;
            }
        }
        return false;
    }

    // Completes the uploads pending right now, not the ones they trigger.
    void complete_uploads(sctl_transport_status status)
    {
        size_t count = pending_uploads.size();
        for (size_t i = 0; i < count && !pending_uploads.empty(); ++i) {
            complete_upload(status);
        }
    }

    // Keeps acknowledging until nothing is pending.
    void complete_all_uploads()
    {
        while (!pending_uploads.empty()) {
            complete_upload(sctl_transport_status::ok);
        }
    }

    void complete_send(sctl_transport_status status, int32_t date = 0)
    {
        send_call call = pending_sends.front();
        pending_sends.pop_front();
        sctl_message_handle handle;
        handle.random_id = call.random_id;
        handle.date = date;
        call.callback(status, handle);
    }

    std::vector<upload_call> uploads;
    std::deque<upload_call> pending_uploads;
    size_t max_pending_uploads = 0;
    std::vector<send_call> sends;
    std::deque<send_call> pending_sends;
};

inline std::vector<unsigned char> make_bytes(size_t size, unsigned char seed = 1)
{
    std::vector<unsigned char> bytes(size);
    for (size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<unsigned char>(seed + i * 7);
    }
    return bytes;
}

inline std::vector<unsigned char> from_hex(const std::string& hex)
{
    std::vector<unsigned char> result;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        result.push_back(static_cast<unsigned char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return result;
}

}
}
