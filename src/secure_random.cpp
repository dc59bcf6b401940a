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

#include "sctl/sctl_secure_random.h"

#include "crypto/crypto_rand.h"
#include "sctl/sctl_error.h"
#include "sctl/sctl_log.h"

#include <stdexcept>

namespace {

class openssl_secure_random: public sctl_secure_random
{
public:
    virtual void fill(unsigned char* buffer, size_t length) override
    {
        if (!length) {
            return;
        }
        if (SCTLC_rand_bytes(buffer, length) != 1) {
            SCTL_ERROR("the random generator failed for " << length << " bytes");
            throw sctl_cipher_error("end of random");
        }
    }
};

}

uint32_t sctl_secure_random::uniform(uint32_t low, uint32_t high)
{
    if (low > high) {
        throw std::invalid_argument("empty random range");
    }

    uint64_t range = static_cast<uint64_t>(high) - low + 1;
    if (range > UINT32_MAX) {
        return value<uint32_t>();
    }

    // Reject the tail so that every value is equally likely.
    uint32_t limit = UINT32_MAX - static_cast<uint32_t>((static_cast<uint64_t>(UINT32_MAX) + 1) % range);
    uint32_t r;
    do {
        r = value<uint32_t>();
    } while (r > limit);

    return low + static_cast<uint32_t>(r % range);
}

std::shared_ptr<sctl_secure_random> sctl_default_secure_random()
{
    return std::make_shared<openssl_secure_random>();
}
