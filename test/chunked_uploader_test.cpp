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

#include "chunked_uploader.h"
#include "retry_policy.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>

using namespace sctl::impl;
using sctl::test::fake_transport;
using sctl::test::make_bytes;
using sctl::test::manual_timer_factory;

namespace {

struct upload_fixture {
    std::shared_ptr<fake_transport> transport = std::make_shared<fake_transport>();
    std::shared_ptr<manual_timer_factory> timers = std::make_shared<manual_timer_factory>();
    sctl_transfer_config config;
    std::vector<sctl_transfer_error> results;
    std::vector<int64_t> progress;

    std::shared_ptr<chunked_uploader> create(size_t size)
    {
        auto data = std::make_shared<const std::vector<unsigned char>>(make_bytes(size));
        return std::make_shared<chunked_uploader>(transport, timers, config, 77, data,
                [this](sctl_transfer_error error) { results.push_back(error); },
                [this](int64_t uploaded) { progress.push_back(uploaded); });
    }
};

}

TEST(chunked_uploader, split_into_parts)
{
    const size_t part = 512 * 1024;
    auto data = make_bytes(2 * part + 1000);
    auto parts = split_into_parts(data, part);
    ASSERT_EQ(3u, parts.size());
    EXPECT_EQ(part, parts[0]->size());
    EXPECT_EQ(part, parts[1]->size());
    EXPECT_EQ(1000u, parts[2]->size());

    std::vector<unsigned char> joined;
    for (const auto& p: parts) {
        joined.insert(joined.end(), p->begin(), p->end());
    }
    EXPECT_EQ(data, joined);

    EXPECT_EQ(1u, split_into_parts(make_bytes(part), part).size());
    EXPECT_EQ(2u, split_into_parts(make_bytes(part + 1), part).size());
    EXPECT_TRUE(split_into_parts(std::vector<unsigned char>(), part).empty());
}

TEST(chunked_uploader, part_count)
{
    EXPECT_EQ(0u, part_count(0, 1024));
    EXPECT_EQ(1u, part_count(1, 1024));
    EXPECT_EQ(1u, part_count(1024, 1024));
    EXPECT_EQ(2u, part_count(1025, 1024));
    EXPECT_THROW(part_count(10, 0), std::invalid_argument);
}

TEST(chunked_uploader, uploads_every_part_with_bounded_concurrency)
{
    upload_fixture f;
    f.config.part_size = 1024;
    f.config.max_parallel_parts = 3;
    auto uploader = f.create(10 * 1024 + 5);
    EXPECT_EQ(11, uploader->total_parts());
    EXPECT_FALSE(uploader->is_big());

    uploader->start();
    EXPECT_EQ(3u, f.transport->pending_uploads.size());

    f.transport->complete_all_uploads();
    EXPECT_EQ(3u, f.transport->max_pending_uploads);
    ASSERT_EQ(1u, f.results.size());
    EXPECT_EQ(sctl_transfer_error::none, f.results[0]);
    EXPECT_TRUE(uploader->finished());
    EXPECT_EQ(10 * 1024 + 5, uploader->uploaded_bytes());
    EXPECT_EQ(11u, f.progress.size());
    EXPECT_EQ(10 * 1024 + 5, f.progress.back());

    std::set<int32_t> indexes;
    for (const auto& call: f.transport->uploads) {
        EXPECT_EQ(77, call.part.file_id);
        EXPECT_EQ(11, call.part.total_parts);
        indexes.insert(call.part.part_index);
    }
    EXPECT_EQ(11u, indexes.size());
    EXPECT_EQ(0, *indexes.begin());
    EXPECT_EQ(10, *indexes.rbegin());
    EXPECT_EQ(0u, f.timers->armed_timers());
}

TEST(chunked_uploader, join_waits_for_the_slowest_part)
{
    upload_fixture f;
    f.config.part_size = 1024;
    auto uploader = f.create(3 * 1024);
    uploader->start();
    ASSERT_EQ(3u, f.transport->pending_uploads.size());

    auto first = f.transport->pending_uploads.front();
    f.transport->pending_uploads.pop_front();
    f.transport->complete_uploads(sctl_transport_status::ok);
    EXPECT_TRUE(f.results.empty());

    first.callback(sctl_transport_status::ok);
    ASSERT_EQ(1u, f.results.size());
    EXPECT_EQ(sctl_transfer_error::none, f.results[0]);
}

TEST(chunked_uploader, big_files_are_flagged)
{
    upload_fixture f;
    f.config.big_file_threshold = 4096;
    f.config.part_size = 1024;
    auto small = f.create(4095);
    EXPECT_FALSE(small->is_big());
    auto big = f.create(4096);
    EXPECT_TRUE(big->is_big());

    big->start();
    EXPECT_TRUE(f.transport->uploads.front().part.is_big);
}

TEST(chunked_uploader, too_many_parts)
{
    upload_fixture f;
    f.config.part_size = 1024;
    f.config.max_parts = 4;
    EXPECT_NO_THROW(f.create(4 * 1024));
    try {
        f.create(4 * 1024 + 1);
        FAIL() << "accepted a file with too many parts";
    } catch (const sctl_error& e) {
        EXPECT_EQ(sctl_transfer_error::file_too_large, e.code());
    }
    EXPECT_THROW(f.create(0), std::invalid_argument);
}

TEST(chunked_uploader, failed_part_is_retried_with_backoff)
{
    upload_fixture f;
    f.config.part_size = 1024;
    f.config.base_retry_delay = 1.5;
    auto uploader = f.create(1024);
    uploader->start();

    f.transport->complete_upload(sctl_transport_status::failed);
    EXPECT_TRUE(f.transport->pending_uploads.empty());
    f.timers->advance(1.25);
    EXPECT_TRUE(f.transport->pending_uploads.empty());
    f.timers->advance(0.25);
    ASSERT_EQ(1u, f.transport->pending_uploads.size());

    f.transport->complete_upload(sctl_transport_status::failed);
    f.timers->advance(2.75);
    EXPECT_TRUE(f.transport->pending_uploads.empty());
    f.timers->advance(0.25);
    ASSERT_EQ(1u, f.transport->pending_uploads.size());

    f.transport->complete_upload(sctl_transport_status::ok);
    ASSERT_EQ(1u, f.results.size());
    EXPECT_EQ(sctl_transfer_error::none, f.results[0]);
    EXPECT_EQ(3u, f.transport->uploads.size());
    for (const auto& call: f.transport->uploads) {
        EXPECT_EQ(0, call.part.part_index);
        EXPECT_EQ(*f.transport->uploads.front().part.bytes, *call.part.bytes);
    }
}

TEST(chunked_uploader, retry_survives_its_timer_being_released)
{
    upload_fixture f;
    f.config.part_size = 1024;
    f.timers->hold_timers_while_firing = false;
    auto uploader = f.create(3 * 1024);
    uploader->start();

    ASSERT_TRUE(f.transport->complete_part(2, sctl_transport_status::failed));
    f.timers->advance(1);
    ASSERT_EQ(3u, f.transport->pending_uploads.size());
    EXPECT_EQ(2, f.transport->pending_uploads.back().part.part_index);

    f.transport->complete_all_uploads();
    ASSERT_EQ(1u, f.results.size());
    EXPECT_EQ(sctl_transfer_error::none, f.results[0]);
    EXPECT_EQ(0u, f.timers->armed_timers());
}

TEST(chunked_uploader, gives_up_after_the_last_attempt)
{
    upload_fixture f;
    f.config.part_size = 1024;
    f.config.max_parallel_parts = 2;
    auto uploader = f.create(4 * 1024);
    uploader->start();

    ASSERT_TRUE(f.transport->complete_part(0, sctl_transport_status::failed));
    f.timers->advance(1);
    ASSERT_TRUE(f.transport->complete_part(0, sctl_transport_status::failed));
    f.timers->advance(2);
    EXPECT_TRUE(f.results.empty());
    ASSERT_TRUE(f.transport->complete_part(0, sctl_transport_status::failed));

    ASSERT_EQ(1u, f.results.size());
    EXPECT_EQ(sctl_transfer_error::upload_part_failure, f.results[0]);
    EXPECT_TRUE(uploader->finished());

    // The other parts are abandoned and late acknowledgements change nothing.
    size_t calls = f.transport->uploads.size();
    EXPECT_EQ(4u, calls);
    f.transport->complete_all_uploads();
    f.timers->advance(100);
    EXPECT_EQ(calls, f.transport->uploads.size());
    EXPECT_EQ(1u, f.results.size());
    EXPECT_EQ(0u, f.timers->armed_timers());
}

TEST(chunked_uploader, timeouts_count_as_failures)
{
    upload_fixture f;
    f.config.part_size = 1024;
    f.config.request_timeout = 5;
    f.config.base_retry_delay = 1;
    auto uploader = f.create(1024);
    uploader->start();

    f.timers->advance(5); // first attempt times out, retry after 1 s
    f.timers->advance(1 + 5); // second attempt times out, retry after 2 s
    f.timers->advance(2 + 5); // third attempt times out
    ASSERT_EQ(1u, f.results.size());
    EXPECT_EQ(sctl_transfer_error::network_timeout, f.results[0]);
    EXPECT_EQ(3u, f.transport->uploads.size());

    // The abandoned calls may still answer.
    f.transport->complete_all_uploads();
    EXPECT_EQ(1u, f.results.size());
}

TEST(chunked_uploader, late_answer_after_timeout_is_ignored)
{
    upload_fixture f;
    f.config.part_size = 1024;
    f.config.request_timeout = 5;
    auto uploader = f.create(1024);
    uploader->start();

    auto first = f.transport->pending_uploads.front();
    f.transport->pending_uploads.pop_front();
    f.timers->advance(5);
    first.callback(sctl_transport_status::ok);
    EXPECT_TRUE(f.results.empty());

    f.timers->advance(1);
    f.transport->complete_upload(sctl_transport_status::ok);
    ASSERT_EQ(1u, f.results.size());
    EXPECT_EQ(sctl_transfer_error::none, f.results[0]);
}

TEST(chunked_uploader, cancel_stops_everything)
{
    upload_fixture f;
    f.config.part_size = 1024;
    f.config.max_parallel_parts = 2;
    auto uploader = f.create(8 * 1024);
    uploader->start();
    f.transport->complete_upload(sctl_transport_status::failed);

    uploader->cancel();
    EXPECT_TRUE(uploader->finished());
    EXPECT_EQ(0u, f.timers->armed_timers());

    size_t calls = f.transport->uploads.size();
    f.transport->complete_all_uploads();
    f.timers->advance(100);
    EXPECT_EQ(calls, f.transport->uploads.size());
    EXPECT_TRUE(f.results.empty());
}

TEST(retry_policy, exponential_delays)
{
    sctl_transfer_config config;
    config.base_retry_delay = 0.5;
    EXPECT_DOUBLE_EQ(0.5, retry_delay(config, 0));
    EXPECT_DOUBLE_EQ(1.0, retry_delay(config, 1));
    EXPECT_DOUBLE_EQ(2.0, retry_delay(config, 2));
    EXPECT_TRUE(can_retry(config, 2));
    EXPECT_FALSE(can_retry(config, 3));
    EXPECT_EQ(sctl_transfer_error::network_timeout,
            transport_error(sctl_transport_status::timed_out, sctl_transfer_error::send_failure));
    EXPECT_EQ(sctl_transfer_error::send_failure,
            transport_error(sctl_transport_status::failed, sctl_transfer_error::send_failure));
}
