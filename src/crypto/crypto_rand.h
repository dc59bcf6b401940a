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

#ifndef __SCTL_CRYPTO_RAND_H__
#define __SCTL_CRYPTO_RAND_H__

#include <openssl/rand.h>

#include <climits>
#include <cstddef>

inline static int SCTLC_rand_bytes(unsigned char* buf, size_t num)
{
    if (num > static_cast<size_t>(INT_MAX)) {
        return 0;
    }
    return RAND_bytes(buf, static_cast<int>(num));
}

#endif
