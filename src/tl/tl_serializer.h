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

#ifndef __SCTL_TL_SERIALIZER_H__
#define __SCTL_TL_SERIALIZER_H__

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sctl {
namespace impl {

static constexpr size_t TL_MAX_BYTES_LENGTH = (1 << 24) - 1;

// Pure encoders. Integers are little endian regardless of the host.
void tl_encode_i32(int32_t i, unsigned char* out);
void tl_encode_i64(int64_t i, unsigned char* out);

// Size of a length prefixed, 4 byte aligned blob holding length bytes.
size_t tl_bytes_encoded_size(size_t length);

// Full encoding of a blob: [len < 254 ? len : 0xfe len24][bytes][zero padding].
// Throws sctl_serialization_error if length does not fit in 24 bits.
std::vector<unsigned char> tl_encode_bytes(const unsigned char* data, size_t length);

// Appending writer. Every out_* call keeps the buffer 4 byte aligned.
class tl_serializer
{
public:
    explicit tl_serializer(size_t initial_buffer_capacity = 1024 /*bytes*/)
    {
        m_data.reserve(initial_buffer_capacity);
    }

    void out_i32(int32_t i);
    void out_u32(uint32_t i) { out_i32(static_cast<int32_t>(i)); }
    void out_i64(int64_t i);

    void out_bytes(const unsigned char* data, size_t size);
    void out_bytes(const std::vector<unsigned char>& data) { out_bytes(data.data(), data.size()); }
    void out_string(const char* str, size_t size) { out_bytes(reinterpret_cast<const unsigned char*>(str), size); }
    void out_std_string(const std::string& str) { out_string(str.data(), str.size()); }

    // [vector tag][count]; the elements follow, each encoding itself.
    void out_vector_header(size_t count);

    const unsigned char* char_data() const { return m_data.data(); }
    size_t char_size() const { return m_data.size(); }
    const std::vector<unsigned char>& data() const { return m_data; }
    std::vector<unsigned char> release() { std::vector<unsigned char> result; result.swap(m_data); return result; }

private:
    std::vector<unsigned char> m_data;
};

}
}

#endif
