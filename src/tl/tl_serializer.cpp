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

    Copyright Nikolay Durov, Andrey Lopatin 2012-2013
              Vitaly Valtman 2013-2015
    Copyright Topology LP 2016
*/

#include "tl/tl_serializer.h"

#include "sctl/sctl_error.h"
#include "tl/tl_constants.h"

#include <string.h>

namespace sctl {
namespace impl {

void tl_encode_i32(int32_t i, unsigned char* out)
{
    uint32_t u = static_cast<uint32_t>(i);
    out[0] = static_cast<unsigned char>(u);
    out[1] = static_cast<unsigned char>(u >> 8);
    out[2] = static_cast<unsigned char>(u >> 16);
    out[3] = static_cast<unsigned char>(u >> 24);
}

void tl_encode_i64(int64_t i, unsigned char* out)
{
    uint64_t u = static_cast<uint64_t>(i);
    tl_encode_i32(static_cast<int32_t>(static_cast<uint32_t>(u)), out);
    tl_encode_i32(static_cast<int32_t>(static_cast<uint32_t>(u >> 32)), out + 4);
}

size_t tl_bytes_encoded_size(size_t length)
{
    size_t prefix = length < 0xfe ? 1 : 4;
    return (prefix + length + 3) & ~static_cast<size_t>(3);
}

std::vector<unsigned char> tl_encode_bytes(const unsigned char* data, size_t length)
{
    if (length > TL_MAX_BYTES_LENGTH) {
        throw sctl_serialization_error("blob of " + std::to_string(length) + " bytes is too big");
    }

    std::vector<unsigned char> result(tl_bytes_encoded_size(length), 0);
    unsigned char* dest = result.data();
    if (length < 0xfe) {
        *dest++ = static_cast<unsigned char>(length);
    } else {
        *dest++ = 0xfe;
        *dest++ = static_cast<unsigned char>(length);
        *dest++ = static_cast<unsigned char>(length >> 8);
        *dest++ = static_cast<unsigned char>(length >> 16);
    }
    if (length) {
        memcpy(dest, data, length);
    }
    return result;
}

void tl_serializer::out_i32(int32_t i)
{
    size_t old_size = m_data.size();
    m_data.resize(old_size + 4);
    tl_encode_i32(i, m_data.data() + old_size);
}

void tl_serializer::out_i64(int64_t i)
{
    size_t old_size = m_data.size();
    m_data.resize(old_size + 8);
    tl_encode_i64(i, m_data.data() + old_size);
}

void tl_serializer::out_bytes(const unsigned char* data, size_t size)
{
    std::vector<unsigned char> encoded = tl_encode_bytes(data, size);
    m_data.insert(m_data.end(), encoded.begin(), encoded.end());
}

void tl_serializer::out_vector_header(size_t count)
{
    if (count > static_cast<size_t>(INT32_MAX)) {
        throw sctl_serialization_error("vector is too long");
    }
    out_u32(CODE_vector);
    out_i32(static_cast<int32_t>(count));
}

}
}
