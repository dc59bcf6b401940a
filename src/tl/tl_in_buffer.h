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

#ifndef __SCTL_TL_IN_BUFFER_H__
#define __SCTL_TL_IN_BUFFER_H__

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sctl {
namespace impl {

// Reading cursor over a TL encoded buffer. Every fetch throws
// sctl_serialization_error instead of reading past the end.
struct tl_in_buffer {
    const unsigned char* ptr;
    const unsigned char* end;

    tl_in_buffer(const unsigned char* data, size_t size)
        : ptr(data), end(data + size)
    { }

    size_t remaining() const { return static_cast<size_t>(end - ptr); }
    bool empty() const { return ptr >= end; }

    int32_t prefetch_i32() const;
    int32_t fetch_i32();
    uint32_t fetch_u32() { return static_cast<uint32_t>(fetch_i32()); }
    int64_t fetch_i64();

    std::vector<unsigned char> fetch_bytes();
    std::string fetch_std_string();

    // Returns the element count after checking the vector tag.
    size_t fetch_vector_header();

    // Throws unless the next constructor is the expected one.
    void expect_constructor(uint32_t constructor, const char* type_name);
};

}
}

#endif
