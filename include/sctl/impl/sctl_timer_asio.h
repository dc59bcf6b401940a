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

    Copyright Topology LP 2016
*/

#ifndef __SCTL_TIMER_ASIO_H__
#define __SCTL_TIMER_ASIO_H__

#include "sctl/sctl_timer.h"

#include <boost/asio.hpp>

#include <cmath>
#include <cstdint>

// Header only so that the library itself does not pull in Boost.Asio. Hosts
// that run an io_service pass sctl_timer_factory_asio to the transfer manager.
class sctl_timer_asio : public std::enable_shared_from_this<sctl_timer_asio>
        , public sctl_timer
{
public:
    sctl_timer_asio(boost::asio::io_service& io_service, const std::function<void()>& cb)
        : m_timer(io_service)
        , m_cb(cb)
        , m_generation(0)
    { }

    virtual void start(double timeout_seconds) override
    {
        if (!(timeout_seconds > 0)) {
            timeout_seconds = 0;
        }

        ++m_generation;
        long long ms = static_cast<long long>(std::ceil(timeout_seconds * 1000));
        m_timer.expires_from_now(boost::posix_time::milliseconds(ms));
        std::weak_ptr<sctl_timer_asio> weak_self = shared_from_this();
        uint64_t generation = m_generation;
        m_timer.async_wait([weak_self, generation](const boost::system::error_code& error) {
            if (auto self = weak_self.lock()) {
                self->expired(error, generation);
            }
        });
    }

    virtual void cancel() override
    {
        ++m_generation;
        m_timer.cancel();
    }

private:
    void expired(const boost::system::error_code& error, uint64_t generation)
    {
        // A rearmed or cancelled timer may still see the old wait complete.
        if (error == boost::asio::error::operation_aborted || generation != m_generation) {
            return;
        }
        if (m_cb) {
            m_cb();
        }
    }

    boost::asio::deadline_timer m_timer;
    std::function<void()> m_cb;
    uint64_t m_generation;
};

class sctl_timer_factory_asio : public sctl_timer_factory {
public:
    explicit sctl_timer_factory_asio(boost::asio::io_service& io_service)
        : m_io_service(io_service)
    { }

    virtual std::shared_ptr<sctl_timer> create_timer(const std::function<void()>& cb) override
    {
        return std::make_shared<sctl_timer_asio>(m_io_service, cb);
    }

private:
    boost::asio::io_service& m_io_service;
};

#endif
