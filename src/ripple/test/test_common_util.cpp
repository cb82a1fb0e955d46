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
#include "ripple/test/test_common_util.hpp"
#include "ripple/bridge/completion_record.hpp"
#include "ripple/util/detail/util_fwd.hpp"
#include <flow/error/error.hpp>
#include <boost/chrono.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ripple::test
{

// Temp_dir.

Temp_dir::Temp_dir() :
  m_path(fs::temp_directory_path() / fs::unique_path("ripple-test-%%%%-%%%%-%%%%"))
{
  fs::create_directories(m_path);
}

Temp_dir::~Temp_dir()
{
  Error_code dummy;
  fs::remove_all(m_path, dummy);
}

const fs::path& Temp_dir::path() const
{
  return m_path;
}

fs::path Temp_dir::operator/(const std::string& name) const
{
  return m_path / name;
}

// Fifo_reader.

Fifo_reader::Fifo_reader(const fs::path& path)
{
  using util::Native_handle;
  using util::last_sys_error;

  const auto raw = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (raw == -1)
  {
    throw flow::error::Runtime_error(last_sys_error(), "Fifo_reader::Fifo_reader()");
  }
  m_fd = util::Scoped_native_handle(Native_handle(raw));
}

Fifo_reader::~Fifo_reader() = default;

std::vector<bridge::wire_request_id_t> Fifo_reader::read_records(size_t n, util::Fine_duration timeout)
{
  using bridge::Completion_record;
  using bridge::decode_completion_record;
  using boost::chrono::duration_cast;
  using boost::chrono::milliseconds;
  using flow::Fine_clock;

  std::vector<bridge::wire_request_id_t> ids;
  const auto deadline = Fine_clock::now() + timeout;

  while (true)
  {
    while ((ids.size() != n) && (m_pending.size() >= sizeof(Completion_record)))
    {
      Completion_record record;
      std::copy_n(m_pending.begin(), record.size(), record.begin());
      m_pending.erase(m_pending.begin(), m_pending.begin() + record.size());
      ids.push_back(decode_completion_record(record));
    }
    if (ids.size() == n)
    {
      return ids;
    }
    // else

    const auto now = Fine_clock::now();
    if (now >= deadline)
    {
      return ids;
    }
    // else

    /* With no writer attached, poll() reports POLLHUP at once, over and over; so cap each wait short
     * rather than relying on it to sleep. */
    const auto wait_ms = std::min<int64_t>(int64_t(duration_cast<milliseconds>(deadline - now).count()) + 1, 10);
    ::pollfd pfd{ m_fd.get().m_native_handle, POLLIN, 0 };
    const auto rc = ::poll(&pfd, 1, int(wait_ms));
    if ((rc == -1) && (errno != EINTR))
    {
      throw flow::error::Runtime_error(util::last_sys_error(), "Fifo_reader::read_records()");
    }
    // else

    uint8_t buf[256];
    const auto n_read = ::read(m_fd.get().m_native_handle, buf, sizeof(buf));
    if (n_read > 0)
    {
      m_pending.insert(m_pending.end(), buf, buf + n_read);
    }
    else if ((n_read == 0) || (rc != 0))
    {
      // EOF (no writer) or EAGAIN after a HUP: nothing to read right now.  Don't spin hot.
      ::usleep(1000);
    }
  } // while (true)
} // Fifo_reader::read_records()

size_t Fifo_reader::n_pending_bytes() const
{
  return m_pending.size();
}

// Free functions.

void write_file(const fs::path& path, const std::string& content)
{
  std::ofstream os(path.string(), std::ios::binary | std::ios::trunc);
  os.write(content.data(), content.size());
  os.close();
  if (!os)
  {
    throw std::runtime_error("write_file(): could not write [" + path.string() + "].");
  }
}

void make_fifo(const fs::path& path)
{
  if (::mkfifo(path.c_str(), 0600) == -1)
  {
    throw flow::error::Runtime_error(util::last_sys_error(), "make_fifo()");
  }
}

std::string pattern_content(size_t size, unsigned int seed)
{
  std::string content(size, '\0');
  uint32_t state = 2463534242u + seed; // xorshift32; never 0 for the seeds we use.
  for (auto& ch : content)
  {
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    ch = char(state & 0xFF);
  }
  return content;
}

} // namespace ripple::test
