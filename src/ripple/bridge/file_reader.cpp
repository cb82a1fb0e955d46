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
#include "ripple/bridge/file_reader.hpp"
#include "ripple/util/detail/util_fwd.hpp"
#include <flow/error/error.hpp>
#include <limits>

namespace ripple::bridge
{

namespace
{

/// Size of the first extension of the buffer, once it filled up at the open-time size; later ones double.
constexpr size_t S_READ_AHEAD_SZ = 4 * 1024;

} // Anonymous namespace

// Implementations.

Scoped_native_handle open_and_allocate(flow::log::Logger* logger_ptr, const fs::path& path, Raw_buffer* buf,
                                       Error_code* err_code)
{
  using util::open_for_reading;
  using boost::system::errc::is_a_directory;
  using std::numeric_limits;

  assert(buf && err_code);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_BRIDGE);

  uint64_t file_size;
  auto file = open_for_reading(logger_ptr, path, &file_size, err_code);
  if (*err_code)
  {
    if (*err_code == is_a_directory)
    {
      *err_code = error::Code::S_NOT_A_REGULAR_FILE;
    }
    return file;
  }
  // else

  if (file_size >= uint64_t(numeric_limits<size_t>::max()))
  {
    FLOW_LOG_WARNING("File [" << path << "] of size [" << file_size << "] cannot be held in memory here.");
    *err_code = error::Code::S_BUFFER_ALLOCATION_FAILED;
    file.reset();
    return file;
  }
  // else

  Raw_buffer new_buf(size_t(file_size), err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Could not allocate buffer of size [" << file_size << "] + 1 for file [" << path << "].");
    file.reset();
    return file;
  }
  // else

  *buf = std::move(new_buf);
  return file;
} // open_and_allocate()

void read_file(flow::log::Logger* logger_ptr, const fs::path& path, Raw_buffer* target, Error_code* err_code)
{
  using util::read_fully;
  using std::max;
  using std::numeric_limits;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { read_file(logger_ptr, path, target, actual_err_code); },
         err_code, "read_file()"))
  {
    return;
  }
  // else if (err_code): Do not throw; emit *err_code.

  assert(target);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_BRIDGE);

  Raw_buffer buf;
  const auto file = open_and_allocate(logger_ptr, path, &buf, err_code);
  if (*err_code)
  {
    FLOW_LOG_TRACE("read_file(): Could not open [" << path << "]: [" << *err_code << "] "
                   "[" << err_code->message() << "].");
    return;
  }
  // else

  auto n_read = read_fully(file.get(), buf.mutable_buffer(), err_code);
  if (*err_code)
  {
    FLOW_LOG_TRACE("read_file(): Reading [" << path << "] via [" << file << "] failed after [" << n_read << "] of "
                   "[" << buf.size() << "] bytes: [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  /* The size at open time is only a hint (/proc and sysfs files report 0; a file may grow meanwhile): as long as
   * the buffer filled up, grow it and keep going until end-of-file.  Growth starts small, then doubles. */
  size_t grow_by = S_READ_AHEAD_SZ;
  while (n_read == buf.size())
  {
    if (grow_by > numeric_limits<size_t>::max() - 1 - buf.size())
    {
      *err_code = error::Code::S_BUFFER_ALLOCATION_FAILED;
      FLOW_LOG_WARNING("read_file(): File [" << path << "] grew past what can be held in memory here.");
      return;
    }
    // else

    buf.resize(buf.size() + grow_by, err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("read_file(): Could not grow buffer for [" << path << "] to "
                       "[" << (n_read + grow_by) << "] + 1 bytes.");
      return;
    }
    // else

    const auto n_more = read_fully(file.get(), util::Blob_mutable(buf.data() + n_read, grow_by), err_code);
    n_read += n_more;
    if (*err_code)
    {
      FLOW_LOG_TRACE("read_file(): Reading [" << path << "] via [" << file << "] past its open-time size failed "
                     "after [" << n_read << "] bytes: [" << *err_code << "] [" << err_code->message() << "].");
      return;
    }
    // else

    grow_by = max(grow_by, n_read);
  } // while (n_read == buf.size())

  if (n_read != buf.size())
  {
    FLOW_LOG_TRACE("read_file(): File [" << path << "] yielded [" << n_read << "] bytes against a buffer of "
                   "[" << buf.size() << "]; trimming.");
    buf.resize(n_read, err_code); // Shrinking.  Should it fail anyway, keep the bigger block and terminate.
    if (*err_code)
    {
      buf.terminate_at(n_read);
      err_code->clear();
    }
  }

  FLOW_LOG_TRACE("read_file(): Read [" << path << "] into [" << buf << "].");
  *target = std::move(buf);
} // read_file()

} // namespace ripple::bridge
