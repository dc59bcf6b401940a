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

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

enum class sctl_transfer_error
{
    none,
    cipher_error,
    key_fingerprint_mismatch,
    serialization_error,
    upload_part_failure,
    network_timeout,
    send_failure,
    protocol_layer_unsupported,
    file_too_large,
    cancelled,
};

std::string to_string(sctl_transfer_error error);

inline static std::ostream& operator<<(std::ostream& os, sctl_transfer_error error)
{
    os << to_string(error);
    return os;
}

// Network failures are retried by the transfer manager, everything else
// aborts the transfer on first sight.
inline static bool sctl_is_retryable(sctl_transfer_error error)
{
    return error == sctl_transfer_error::upload_part_failure
            || error == sctl_transfer_error::network_timeout
            || error == sctl_transfer_error::send_failure;
}

class sctl_error: public std::runtime_error
{
public:
    sctl_error(sctl_transfer_error code, const std::string& what)
        : std::runtime_error(what)
        , m_code(code)
    { }

    sctl_transfer_error code() const { return m_code; }

private:
    sctl_transfer_error m_code;
};

// Misaligned or mis-sized buffer handed to the cipher, or a message whose
// msg_key does not verify.
class sctl_cipher_error: public sctl_error
{
public:
    explicit sctl_cipher_error(const std::string& what)
        : sctl_error(sctl_transfer_error::cipher_error, what)
    { }
};

class sctl_key_fingerprint_mismatch: public sctl_error
{
public:
    sctl_key_fingerprint_mismatch(int32_t expected, int32_t actual)
        : sctl_error(sctl_transfer_error::key_fingerprint_mismatch,
                "key fingerprint mismatch: expected " + std::to_string(expected) + ", got " + std::to_string(actual))
        , m_expected(expected)
        , m_actual(actual)
    { }

    int32_t expected() const { return m_expected; }
    int32_t actual() const { return m_actual; }

private:
    int32_t m_expected;
    int32_t m_actual;
};

class sctl_serialization_error: public sctl_error
{
public:
    explicit sctl_serialization_error(const std::string& what)
        : sctl_error(sctl_transfer_error::serialization_error, what)
    { }
};

class sctl_protocol_layer_unsupported: public sctl_error
{
public:
    explicit sctl_protocol_layer_unsupported(int32_t layer)
        : sctl_error(sctl_transfer_error::protocol_layer_unsupported,
                "unsupported secret chat layer " + std::to_string(layer))
        , m_layer(layer)
    { }

    int32_t layer() const { return m_layer; }

private:
    int32_t m_layer;
};
