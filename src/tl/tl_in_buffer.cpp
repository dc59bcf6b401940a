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

#include "tl/tl_in_buffer.h"

#include "sctl/sctl_error.h"
#include "tl/tl_constants.h"

#include <iomanip>
#include <sstream>

namespace sctl {
namespace impl {

static void need(const tl_in_buffer* in, size_t n)
{
    if (in->remaining() < n) {
        throw sctl_serialization_error("truncated input: need " + std::to_string(n)
                + " bytes, " + std::to_string(in->remaining()) + " left");
    }
}

int32_t tl_in_buffer::prefetch_i32() const
{
    need(this, 4);
    uint32_t u = static_cast<uint32_t>(ptr[0])
            | (static_cast<uint32_t>(ptr[1]) << 8)
            | (static_cast<uint32_t>(ptr[2]) << 16)
            | (static_cast<uint32_t>(ptr[3]) << 24);
    return static_cast<int32_t>(u);
}

int32_t tl_in_buffer::fetch_i32()
{
    int32_t r = prefetch_i32();
    ptr += 4;
    return r;
}

int64_t tl_in_buffer::fetch_i64()
{
    need(this, 8);
    uint64_t low = static_cast<uint32_t>(fetch_i32());
    uint64_t high = static_cast<uint32_t>(fetch_i32());
    return static_cast<int64_t>(low | (high << 32));
}

std::vector<unsigned char> tl_in_buffer::fetch_bytes()
{
    need(this, 1);
    size_t length;
    size_t prefix;
    if (ptr[0] < 0xfe) {
        length = ptr[0];
        prefix = 1;
    } else if (ptr[0] == 0xfe) {
        need(this, 4);
        length = static_cast<size_t>(ptr[1]) | (static_cast<size_t>(ptr[2]) << 8) | (static_cast<size_t>(ptr[3]) << 16);
        prefix = 4;
        if (length < 0xfe) {
            throw sctl_serialization_error("long length prefix used for a short blob");
        }
    } else {
        throw sctl_serialization_error("invalid blob length prefix 0xff");
    }

    size_t total = (prefix + length + 3) & ~static_cast<size_t>(3);
    need(this, total);

    std::vector<unsigned char> result(ptr + prefix, ptr + prefix + length);
    for (size_t i = prefix + length; i < total; ++i) {
        if (ptr[i]) {
            throw sctl_serialization_error("non zero blob padding");
        }
    }
    ptr += total;
    return result;
}

std::string tl_in_buffer::fetch_std_string()
{
    std::vector<unsigned char> bytes = fetch_bytes();
    return std::string(bytes.begin(), bytes.end());
}

size_t tl_in_buffer::fetch_vector_header()
{
    expect_constructor(CODE_vector, "vector");
    int32_t count = fetch_i32();
    // Every element takes at least four bytes.
    if (count < 0 || static_cast<size_t>(count) > remaining() / 4) {
        throw sctl_serialization_error("invalid vector length " + std::to_string(count));
    }
    return static_cast<size_t>(count);
}

void tl_in_buffer::expect_constructor(uint32_t constructor, const char* type_name)
{
    uint32_t actual = fetch_u32();
    if (actual != constructor) {
        std::ostringstream ss;
        ss << "expected " << type_name << " constructor 0x" << std::hex << std::setw(8) << std::setfill('0')
                << constructor << ", got 0x" << std::setw(8) << actual;
        throw sctl_serialization_error(ss.str());
    }
}

}
}
