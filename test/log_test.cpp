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
    Copyright Topology LP 2016-2017
*/

#include "sctl/sctl_log.h"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace {

class log_capture
{
public:
    explicit log_capture(sctl_log_level level)
    {
        sctl_init_log([this](const std::string& line, sctl_log_level line_level) {
            lines.push_back(std::make_pair(line_level, line));
        }, level);
    }

    ~log_capture()
    {
        sctl_init_log(nullptr, sctl_log_level::level_notice);
    }

    std::vector<std::pair<sctl_log_level, std::string>> lines;
};

}

TEST(log, filters_by_level)
{
    log_capture capture(sctl_log_level::level_warning);
    SCTL_ERROR("part " << 3 << " failed");
    SCTL_WARNING("retrying");
    SCTL_NOTICE("not shown");

    ASSERT_EQ(2u, capture.lines.size());
    EXPECT_EQ(sctl_log_level::level_error, capture.lines[0].first);
    EXPECT_NE(std::string::npos, capture.lines[0].second.find("part 3 failed"));
    EXPECT_EQ(sctl_log_level::level_warning, capture.lines[1].first);
}

TEST(log, prefixes_file_and_function)
{
    log_capture capture(sctl_log_level::level_notice);
    SCTL_NOTICE("hello");

    ASSERT_EQ(1u, capture.lines.size());
    const std::string& line = capture.lines[0].second;
    EXPECT_EQ(0u, line.find("[log_test.cpp:"));
    EXPECT_NE(std::string::npos, line.find("hello"));
    EXPECT_EQ(std::string::npos, line.find("/test/"));
}

TEST(log, no_sink_is_silent)
{
    sctl_init_log(nullptr, sctl_log_level::level_debug);
    SCTL_ERROR("nobody listens");
}

TEST(log, filtered_messages_are_not_formatted)
{
    log_capture capture(sctl_log_level::level_warning);
    int formatted = 0;
    auto count = [&formatted] { return ++formatted; };
    SCTL_NOTICE("value " << count());
    EXPECT_EQ(0, formatted);
    EXPECT_FALSE(sctl_log_enabled(sctl_log_level::level_notice));

    SCTL_WARNING("value " << count());
    EXPECT_EQ(1, formatted);
    ASSERT_EQ(1u, capture.lines.size());
    EXPECT_NE(std::string::npos, capture.lines[0].second.find("value 1"));
}
