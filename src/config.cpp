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

#include "sctl/sctl_config.h"

#include "sctl/sctl_error.h"

#include <stdexcept>
#include <string>

void sctl_transfer_config::validate() const
{
    if (layer != SCTL_ENCRYPTED_LAYER) {
        throw sctl_protocol_layer_unsupported(layer);
    }

    // The server accepts parts whose size is a multiple of 1 KiB and divides 512 KiB.
    if (part_size == 0 || part_size % 1024 || SCTL_MAX_PART_SIZE % part_size) {
        throw std::invalid_argument("invalid part size " + std::to_string(part_size));
    }

    if (max_upload_attempts < 1) {
        throw std::invalid_argument("at least one upload attempt is required");
    }

    if (base_retry_delay < 0 || request_timeout <= 0) {
        throw std::invalid_argument("negative retry delay or non-positive request timeout");
    }

    if (max_parallel_parts == 0 || max_parallel_parts > SCTL_MAX_PARALLEL_PARTS) {
        throw std::invalid_argument("max parallel parts must be between 1 and " + std::to_string(SCTL_MAX_PARALLEL_PARTS));
    }

    // The descriptor carries the file size as an int32.
    if (max_parts == 0 || max_parts > SCTL_MAX_PARTS_LIMIT) {
        throw std::invalid_argument("max parts must be between 1 and " + std::to_string(SCTL_MAX_PARTS_LIMIT));
    }
}
