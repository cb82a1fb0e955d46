/* Ripple-Bridge: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "ripple/bridge/async_read_launcher.hpp"
#include "ripple/test/test_common_util.hpp"
#include "ripple/test/test_fake_completion_sink.hpp"
#include "ripple/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <boost/thread/future.hpp>
#include <algorithm>
#include <atomic>

namespace ripple::bridge
{

namespace
{

using test::Temp_dir;
using test::Test_logger;
using test::Fake_completion_sink;
using Launcher = Async_read_launcher<Fake_completion_sink>;
using boost::chrono::seconds;
using boost::chrono::milliseconds;
using std::string;
using std::vector;

} // Anonymous namespace

TEST(Async_read_launcher_test, FillsThenNotifies)
{
  Test_logger logger;
  Temp_dir dir;
  const auto content = test::pattern_content(300 * 1000);
  test::write_file(dir / "f", content);

  Fake_completion_sink sink;
  Raw_buffer buf;
  std::atomic<bool> content_ok_at_notify(false);
  // Runs in the worker at notification time: the content must already be complete.
  sink.set_on_notify([&](wire_request_id_t) { content_ok_at_notify = (string(buf.data(), buf.size()) == content); });

  Launcher launcher(&logger, "test", &sink, 2);
  const auto ticket = launcher.async_read(dir / "f", 77, &buf);
  ASSERT_TRUE(ticket);
  ASSERT_FALSE(buf.null());
  EXPECT_EQ(buf.size(), content.size());
  EXPECT_EQ(buf.capacity(), content.size() + 1);
  EXPECT_EQ(buf.data()[content.size()], '\0');
  EXPECT_EQ(ticket->request_id(), 77u);
  EXPECT_EQ(ticket->size(), content.size());

  ASSERT_TRUE(ticket->timed_wait_released(seconds(5)));
  EXPECT_EQ(ticket->state(), Read_ticket::State::S_RELEASED);
  EXPECT_FALSE(ticket->fill_result());
  EXPECT_EQ(ticket->n_filled(), content.size());
  EXPECT_TRUE(content_ok_at_notify);
  EXPECT_EQ(sink.ids(), vector<wire_request_id_t>{ 77 });
  EXPECT_EQ(string(buf.data(), buf.size()), content);
  EXPECT_EQ(buf.data()[content.size()], '\0');
}

TEST(Async_read_launcher_test, OpenFailureNeverNotifies)
{
  Test_logger logger;
  Temp_dir dir;
  Fake_completion_sink sink;
  Launcher launcher(&logger, "test", &sink);

  Raw_buffer buf;
  Error_code err_code;
  EXPECT_FALSE(launcher.async_read(dir / "missing", 1, &buf, &err_code));
  EXPECT_EQ(err_code, boost::system::errc::no_such_file_or_directory);
  EXPECT_TRUE(buf.null());

  EXPECT_FALSE(launcher.async_read(dir.path(), 2, &buf, &err_code));
  EXPECT_EQ(err_code, error::Code::S_NOT_A_REGULAR_FILE);

  EXPECT_THROW(launcher.async_read(dir / "missing", 3, &buf), flow::error::Runtime_error);

  EXPECT_EQ(launcher.n_outstanding(), 0u);
  EXPECT_FALSE(sink.wait_for_count(1, milliseconds(200)));
  EXPECT_TRUE(sink.ids().empty());
}

TEST(Async_read_launcher_test, EmptyFile)
{
  Test_logger logger;
  Temp_dir dir;
  test::write_file(dir / "empty", "");
  Fake_completion_sink sink;
  Raw_buffer buf;
  Launcher launcher(&logger, "test", &sink);

  const auto ticket = launcher.async_read(dir / "empty", 5, &buf);
  ASSERT_TRUE(ticket);
  EXPECT_EQ(buf.capacity(), 1u);
  EXPECT_EQ(buf.data()[0], '\0');
  ticket->wait_released();
  EXPECT_FALSE(ticket->fill_result());
  EXPECT_EQ(sink.ids(), vector<wire_request_id_t>{ 5 });
}

TEST(Async_read_launcher_test, ManyConcurrentRequestsAnyOrder)
{
  constexpr size_t N_REQS = 40;

  Test_logger logger;
  Temp_dir dir;
  Fake_completion_sink sink;
  vector<string> contents;
  vector<Raw_buffer> bufs(N_REQS);
  Launcher launcher(&logger, "test", &sink, 4);

  vector<Read_ticket::Ptr> tickets;
  for (size_t idx = 0; idx != N_REQS; ++idx)
  {
    // Alternate tiny and large so completion order likely differs from submission order.
    contents.push_back(test::pattern_content(((idx % 2) == 0) ? (2 * 1000 * 1000) : idx, unsigned(idx)));
    const auto path = dir / ("f" + std::to_string(idx));
    test::write_file(path, contents.back());
    tickets.push_back(launcher.async_read(path, 1000 + idx, &bufs[idx]));
    ASSERT_TRUE(tickets.back());
  }

  ASSERT_TRUE(sink.wait_for_count(N_REQS, seconds(30)));
  for (size_t idx = 0; idx != N_REQS; ++idx)
  {
    tickets[idx]->wait_released();
    EXPECT_EQ(string(bufs[idx].data(), bufs[idx].size()), contents[idx]) << "Request [" << idx << "].";
  }

  auto ids = sink.ids();
  std::sort(ids.begin(), ids.end());
  vector<wire_request_id_t> expected;
  for (size_t idx = 0; idx != N_REQS; ++idx)
  {
    expected.push_back(wire_request_id_t(1000 + idx));
  }
  EXPECT_EQ(ids, expected) << "Each accepted request should be announced exactly once.";
  EXPECT_EQ(launcher.n_outstanding(), 0u);
}

TEST(Async_read_launcher_test, DestructorWaitsForOutstanding)
{
  constexpr size_t N_REQS = 20;

  Test_logger logger;
  Temp_dir dir;
  const auto content = test::pattern_content(1000 * 1000);
  test::write_file(dir / "f", content);

  Fake_completion_sink sink;
  vector<Raw_buffer> bufs(N_REQS);
  {
    Launcher launcher(&logger, "test", &sink, 2);
    for (size_t idx = 0; idx != N_REQS; ++idx)
    {
      ASSERT_TRUE(launcher.async_read(dir / "f", idx, &bufs[idx]));
    }
  } // Blocks until all are released.

  EXPECT_EQ(sink.ids().size(), N_REQS);
  for (const auto& buf : bufs)
  {
    EXPECT_EQ(string(buf.data(), buf.size()), content);
  }
}

TEST(Async_read_launcher_test, ShortReadStillNotifies)
{
  Test_logger logger;
  Temp_dir dir;
  test::write_file(dir / "gate", "g");
  test::write_file(dir / "shrinks", string(100, 'a'));

  // One worker, held inside the first request's notification while we shrink the second request's file.
  boost::promise<void> gate;
  auto gate_opened = gate.get_future().share();
  Fake_completion_sink sink;
  sink.set_on_notify([gate_opened](wire_request_id_t id) mutable
  {
    if (id == 1)
    {
      gate_opened.wait();
    }
  });

  Raw_buffer gate_buf;
  Raw_buffer buf;
  Launcher launcher(&logger, "test", &sink, 1);
  const auto gate_ticket = launcher.async_read(dir / "gate", 1, &gate_buf);
  const auto ticket = launcher.async_read(dir / "shrinks", 2, &buf);
  ASSERT_TRUE(gate_ticket && ticket);
  EXPECT_EQ(buf.size(), 100u);

  fs::resize_file(dir / "shrinks", 10);
  gate.set_value();

  ASSERT_TRUE(ticket->timed_wait_released(seconds(5)));
  EXPECT_EQ(ticket->fill_result(), error::Code::S_FILE_SHORT_READ);
  EXPECT_EQ(ticket->n_filled(), 10u);
  EXPECT_EQ(string(buf.data(), 10), string(10, 'a'));
  EXPECT_EQ(buf.data()[100], '\0');
  EXPECT_EQ(sink.ids(), (vector<wire_request_id_t>{ 1, 2 }));
}

TEST(Async_read_launcher_test, WideIdIsTruncatedOnTheWire)
{
  Test_logger logger;
  Temp_dir dir;
  test::write_file(dir / "f", "x");
  Fake_completion_sink sink(false); // Delivery failure must change nothing for the launcher.
  Raw_buffer buf;
  Launcher launcher(&logger, "test", &sink);

  const auto ticket = launcher.async_read(dir / "f", 0x700000009ull, &buf);
  ASSERT_TRUE(ticket);
  ticket->wait_released();
  EXPECT_EQ(ticket->request_id(), 0x700000009ull);
  EXPECT_EQ(sink.ids(), vector<wire_request_id_t>{ 9 });
  EXPECT_EQ(logger.count_captured("does not fit"), 1u);
}

} // namespace ripple::bridge
