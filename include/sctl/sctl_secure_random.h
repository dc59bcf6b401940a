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

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

// Source of every random byte the library consumes: file keys, padding,
// random ids. Tests install a deterministic one.
class sctl_secure_random
{
public:
    virtual ~sctl_secure_random() { }

    virtual void fill(unsigned char* buffer, size_t length) = 0;

    // Uniform in [low, high].
    uint32_t uniform(uint32_t low, uint32_t high);

    template<typename IntegerType>
    IntegerType value()
    {
        IntegerType v;
        fill(reinterpret_cast<unsigned char*>(&v), sizeof(v));
        return v;
    }
};

// OpenSSL RAND_bytes. Throws sctl_cipher_error when the generator fails.
std::shared_ptr<sctl_secure_random> sctl_default_secure_random();
