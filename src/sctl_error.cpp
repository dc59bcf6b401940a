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

#include "sctl/sctl_error.h"

std::string to_string(sctl_transfer_error error)
{
    switch (error) {
    case sctl_transfer_error::none:
        return "none";
    case sctl_transfer_error::cipher_error:
        return "cipher error";
    case sctl_transfer_error::key_fingerprint_mismatch:
        return "key fingerprint mismatch";
    case sctl_transfer_error::serialization_error:
        return "serialization error";
    case sctl_transfer_error::upload_part_failure:
        return "upload part failure";
    case sctl_transfer_error::network_timeout:
        return "network timeout";
    case sctl_transfer_error::send_failure:
        return "send failure";
    case sctl_transfer_error::protocol_layer_unsupported:
        return "protocol layer unsupported";
    case sctl_transfer_error::file_too_large:
        return "file too large";
    case sctl_transfer_error::cancelled:
        return "cancelled";
    }

    return "unknown";
}
