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
    Copyright Topology LP 2016
*/

#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <sstream>

enum class sctl_log_level {
    level_error = 0,
    level_warning = 1,
    level_notice = 2,
    level_debug = 6,
};

using sctl_log_function = std::function<void(const std::string& log, sctl_log_level level)>;
void sctl_init_log(const sctl_log_function& log_function, sctl_log_level level);
void sctl_log(const std::string& str, sctl_log_level level);

// False when no sink is installed or the level is filtered out. The macros
// below check it before formatting anything.
bool sctl_log_enabled(sctl_log_level level);

constexpr int32_t sctl_basename_index(const char* const path, const int32_t index = 0, const int32_t slash_index = -1) {
    return path[index]
        ? (path[index] == '/' ? sctl_basename_index(path, index + 1, index) : sctl_basename_index(path, index + 1, slash_index))
        : (slash_index + 1);
}

#define SCTL_STRINGIZE_DETAIL(x) #x
#define SCTL_STRINGIZE(x) SCTL_STRINGIZE_DETAIL(x)

#define SCTL_FILELINE ({ static const int32_t basename_idx = sctl_basename_index(__FILE__); \
        static_assert (basename_idx >= 0, "compile-time basename"); \
        __FILE__ ":" SCTL_STRINGIZE(__LINE__) + basename_idx; })

#define SCTL_LOG_AT(LEVEL, X) do { if (sctl_log_enabled(LEVEL)) { std::ostringstream str_stream; \
                    str_stream << "[" << SCTL_FILELINE << "] [" << __FUNCTION__ << "] " << X ; \
                    sctl_log(str_stream.str(), LEVEL); } } while (false)

#ifndef NDEBUG
#define SCTL_DEBUG(X) SCTL_LOG_AT(sctl_log_level::level_debug, X)
#else
#define SCTL_DEBUG(X)
#endif

#define SCTL_NOTICE(X) SCTL_LOG_AT(sctl_log_level::level_notice, X)
#define SCTL_WARNING(X) SCTL_LOG_AT(sctl_log_level::level_warning, X)
#define SCTL_ERROR(X) SCTL_LOG_AT(sctl_log_level::level_error, X)
