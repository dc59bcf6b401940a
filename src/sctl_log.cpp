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

#include "sctl/sctl_log.h"

namespace {

struct log_sink {
    sctl_log_function function;
    sctl_log_level level = sctl_log_level::level_notice;
};

// Function local so that logging from static initializers finds it constructed.
log_sink& sink()
{
    static log_sink s;
    return s;
}

}

void sctl_init_log(const sctl_log_function& log_function, sctl_log_level level)
{
    log_sink& s = sink();
    s.function = log_function;
    s.level = level;
}

bool sctl_log_enabled(sctl_log_level level)
{
    const log_sink& s = sink();
    return s.function && level <= s.level;
}

void sctl_log(const std::string& str, sctl_log_level level)
{
    if (sctl_log_enabled(level)) {
        sink().function(str, level);
    }
}
