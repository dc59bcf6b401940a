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

    Copyright Vitaly Valtman 2014-2015
    Copyright Topology LP 2016-2017
*/

#pragma once

#include <cstddef>
#include <cstdint>

// The only secret chat layer this library speaks. There is no negotiation
// and no fallback to older message layouts.
static constexpr int32_t SCTL_ENCRYPTED_LAYER = 73;

static constexpr size_t SCTL_MAX_PART_SIZE = 512 * 1024;
static constexpr size_t SCTL_BIG_FILE_THRESHOLD = 10 * 1024 * 1024;
static constexpr size_t SCTL_MAX_PARALLEL_PARTS = 8;
static constexpr size_t SCTL_MAX_PARTS_LIMIT = 4000;

struct sctl_transfer_config
{
    int32_t layer;
    size_t part_size;
    int32_t max_upload_attempts;
    double base_retry_delay; // seconds
    size_t max_parallel_parts;
    double request_timeout; // seconds
    size_t big_file_threshold;
    size_t max_parts;

    sctl_transfer_config()
        : layer(SCTL_ENCRYPTED_LAYER)
        , part_size(SCTL_MAX_PART_SIZE)
        , max_upload_attempts(3)
        , base_retry_delay(1.0)
        , max_parallel_parts(4)
        , request_timeout(20.0)
        , big_file_threshold(SCTL_BIG_FILE_THRESHOLD)
        , max_parts(3000)
    { }

    // Throws sctl_protocol_layer_unsupported for any layer other than
    // SCTL_ENCRYPTED_LAYER and std::invalid_argument for values out of range.
    void validate() const;
};
