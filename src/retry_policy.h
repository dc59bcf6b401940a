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

#include "sctl/sctl_config.h"
#include "sctl/sctl_error.h"
#include "sctl/sctl_transport.h"

namespace sctl {
namespace impl {

// Seconds to wait after the failed attempt with the given zero based index.
double retry_delay(const sctl_transfer_config& config, int32_t failed_attempt);

// Whether another attempt is allowed after attempts_made calls failed.
inline bool can_retry(const sctl_transfer_config& config, int32_t attempts_made)
{
    return attempts_made < config.max_upload_attempts;
}

// Maps a failed transport status onto the error reported once retries run out.
sctl_transfer_error transport_error(sctl_transport_status status, sctl_transfer_error failure);

}
}
