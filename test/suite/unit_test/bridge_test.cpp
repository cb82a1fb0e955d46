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
#include "ripple/bridge/bridge.hpp"
#include "ripple/test/test_common_util.hpp"
#include "ripple/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <boost/thread/thread.hpp>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cstdlib>

namespace ripple::bridge
{

namespace
{

using test::Temp_dir;
using test::Test_logger;
using test::Fifo_reader;
using boost::chrono::seconds;
using std::string;
using std::vector;

/// Sets an environment variable for the lifetime of the object; unsets it afterwards.
class Scoped_env_var :
  private boost::noncopyable
{
public:
  Scoped_env_var(const std::string& name, const char* val) :
    m_name(name)
  {
    ::setenv(m_name.c_str(), val, 1);
  }

  ~Scoped_env_var()
  {
    ::unsetenv(m_name.c_str());
  }

private:
  const std::string m_name;
};

} // Anonymous namespace

TEST(Bridge_config_test, FromEnvironment)
{
  using flow::log::Sev;

  Test_logger logger;
  ::unsetenv(Bridge_config::S_LOG_SEV_ENV_VAR_NAME.c_str());
  ::unsetenv(Bridge_config::S_READ_WORKERS_ENV_VAR_NAME.c_str());

  {
    const auto config = Bridge_config::from_environment(&logger);
    EXPECT_EQ(config.m_log_sev, Sev::S_WARNING);
    EXPECT_EQ(config.m_n_read_workers, 4u);
  }
  {
    Scoped_env_var sev(Bridge_config::S_LOG_SEV_ENV_VAR_NAME, "INFO");
    Scoped_env_var n(Bridge_config::S_READ_WORKERS_ENV_VAR_NAME, "9");
    const auto config = Bridge_config::from_environment(&logger);
    EXPECT_EQ(config.m_log_sev, Sev::S_INFO);
    EXPECT_EQ(config.m_n_read_workers, 9u);
  }

  logger.clear_captured();
  for (const char* bad_n : { "0", "-1", "abc", "100000", "" })
  {
    Scoped_env_var sev(Bridge_config::S_LOG_SEV_ENV_VAR_NAME, "LOUDEST");
    Scoped_env_var n(Bridge_config::S_READ_WORKERS_ENV_VAR_NAME, bad_n);
    const auto config = Bridge_config::from_environment(&logger);
    EXPECT_EQ(config.m_log_sev, Sev::S_WARNING);
    EXPECT_EQ(config.m_n_read_workers, 4u) << "Value [" << bad_n << "].";
  }
  EXPECT_EQ(logger.count_captured("does not name a log severity"), 5u);
  EXPECT_EQ(logger.count_captured("keeping default [4]"), 5u);
}

TEST(Bridge_test, SyncRead)
{
  Test_logger logger;
  Temp_dir dir;
  Bridge bridge(&logger, Bridge_config());

  const auto content = test::pattern_content(12345);
  test::write_file(dir / "f", content);

  char* const buf = bridge.file_get_contents((dir / "f").c_str());
  ASSERT_NE(buf, nullptr);
  EXPECT_EQ(string(buf, content.size()), content);
  EXPECT_EQ(buf[content.size()], '\0');
  std::free(buf);

  EXPECT_EQ(bridge.file_get_contents((dir / "missing").c_str()), nullptr);
  EXPECT_EQ(bridge.file_get_contents(dir.path().c_str()), nullptr);
  EXPECT_EQ(bridge.file_get_contents(nullptr), nullptr);
  EXPECT_EQ(bridge.file_get_contents("bad\xC3"), nullptr);
}

TEST(Bridge_test, AsyncReadAnnouncedOnSideChannel)
{
  Test_logger logger;
  Temp_dir dir;
  Bridge_config config;
  config.m_n_read_workers = 2;
  Bridge bridge(&logger, config);

  EXPECT_EQ(bridge.link(dir.path().c_str()), 0);
  EXPECT_EQ(bridge.link("/somewhere/else"), 0); // Ignored.
  EXPECT_EQ(bridge.runtime_dir().sidechannel_path(), dir / "bridge.fifo");

  test::make_fifo(dir / "bridge.fifo");
  Fifo_reader reader(dir / "bridge.fifo");

  const auto content_a = test::pattern_content(500 * 1000, 1);
  const auto content_b = test::pattern_content(17, 2);
  test::write_file(dir / "a", content_a);
  test::write_file(dir / "b", content_b);

  char* const buf_a = bridge.file_get_contents_async((dir / "a").c_str(), 1);
  char* const buf_b = bridge.file_get_contents_async((dir / "b").c_str(), 2);
  ASSERT_NE(buf_a, nullptr);
  ASSERT_NE(buf_b, nullptr);
  EXPECT_EQ(bridge.file_get_contents_async((dir / "missing").c_str(), 3), nullptr);
  EXPECT_EQ(bridge.file_get_contents_async(nullptr, 4), nullptr);

  auto ids = reader.read_records(2, seconds(10));
  std::sort(ids.begin(), ids.end());
  ASSERT_EQ(ids, (vector<wire_request_id_t>{ 1, 2 }));

  // Having seen the record, the content is complete.
  EXPECT_EQ(string(buf_a, content_a.size()), content_a);
  EXPECT_EQ(string(buf_b, content_b.size()), content_b);
  EXPECT_EQ(buf_a[content_a.size()], '\0');

  // Nothing further (in particular, nothing for the rejected requests).
  EXPECT_TRUE(reader.read_records(1, boost::chrono::milliseconds(200)).empty());
  std::free(buf_a);
  std::free(buf_b);
}

TEST(Bridge_test, ProcessFile)
{
  Test_logger logger;
  Temp_dir dir;
  Bridge bridge(&logger, Bridge_config());

  const auto content = test::pattern_content(200 * 1000);
  test::write_file(dir / "f", content);

  int fds[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  util::Scoped_native_handle dest((Native_handle(fds[0])));
  util::Scoped_native_handle src((Native_handle(fds[1])));

  string received;
  boost::thread reader([&]()
  {
    char chunk[8192];
    ssize_t rc;
    while ((rc = ::read(src.get().m_native_handle, chunk, sizeof(chunk))) > 0)
    {
      received.append(chunk, size_t(rc));
    }
  });

  EXPECT_EQ(bridge.process_file(fds[0], (dir / "f").c_str()), 0);
  ::shutdown(fds[0], SHUT_WR);
  reader.join();
  EXPECT_EQ(received, content);

  EXPECT_EQ(bridge.process_file(-1, (dir / "f").c_str()), -1);
  EXPECT_EQ(bridge.process_file(fds[0], (dir / "missing").c_str()), -1);
  EXPECT_EQ(bridge.process_file(fds[0], nullptr), -1);
}

} // namespace ripple::bridge
