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

#include "retry_policy.h"

namespace sctl {
namespace impl {

double retry_delay(const sctl_transfer_config& config, int32_t failed_attempt)
{
    double delay = config.base_retry_delay;
    for (int32_t i = 0; i < failed_attempt; ++i) {
        delay *= 2;
    }
    return delay;
}

sctl_transfer_error transport_error(sctl_transport_status status, sctl_transfer_error failure)
{
    switch (status) {
    case sctl_transport_status::ok:
        return sctl_transfer_error::none;
    case sctl_transport_status::timed_out:
        return sctl_transfer_error::network_timeout;
    case sctl_transport_status::failed:
        return failure;
    }
    return failure;
}

}
}
