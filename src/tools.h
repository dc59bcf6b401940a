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
    Copyright Topology LP 2016
*/

#ifndef __SCTL_TOOLS_H__
#define __SCTL_TOOLS_H__

#include <openssl/crypto.h>

#include <cstddef>
#include <string>
#include <vector>

static inline void sctl_secure_zero(void* ptr, size_t size)
{
    if (ptr && size) {
        OPENSSL_cleanse(ptr, size);
    }
}

template<typename Container>
static inline void sctl_secure_clear(Container& c)
{
    sctl_secure_zero(c.data(), c.size() * sizeof(typename Container::value_type));
}

static inline std::string sctl_binary_to_hex(const unsigned char* buffer, size_t length)
{
    static const char table[16] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f' };
    std::vector<char> result(length * 2);

    size_t j = 0;
    for (size_t i = 0; i < length; ++i) {
        unsigned char c = buffer[i];
        result[j++] = table[c >> 4];
        result[j++] = table[c & 0xf];
    }

    return std::string(result.data(), result.size());
}

#endif
