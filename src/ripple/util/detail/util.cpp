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
#include "ripple/util/detail/util_fwd.hpp"
#include <flow/error/error.hpp>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace ripple::util
{

// Implementations.

bool is_transient_sys_error(const Error_code& sys_err_code)
{
  using boost::system::errc::operation_would_block;
  using boost::system::errc::resource_unavailable_try_again;
  using boost::system::errc::interrupted;

  // In Linux EAGAIN == EWOULDBLOCK; elsewhere they may differ, so check both.
  return (sys_err_code == resource_unavailable_try_again)
         || (sys_err_code == operation_would_block)
         || (sys_err_code == interrupted);
}

Error_code last_sys_error()
{
  using boost::system::system_category;
  // using ::errno; // It's a macro apparently.

  return Error_code(errno, system_category());
}

Scoped_native_handle open_for_reading(flow::log::Logger* logger_ptr, const fs::path& path, uint64_t* size,
                                      Error_code* err_code)
{
  using boost::system::errc::make_error_code;
  using boost::system::errc::is_a_directory;
  using ::open;
  using ::fstat;
  // using ::O_RDONLY; // A macro apparently.
  // using ::O_CLOEXEC; // A macro apparently.

  assert(size && err_code);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  Scoped_native_handle file;
  int raw;
  do
  {
    raw = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  }
  while ((raw == -1) && (errno == EINTR));

  if (raw == -1)
  {
    *err_code = last_sys_error();
    FLOW_LOG_TRACE("Could not open [" << path << "] for reading: [" << *err_code << "] "
                   "[" << err_code->message() << "].");
    return file;
  }
  // else
  file = Scoped_native_handle(Native_handle(raw));

  struct ::stat st;
  if (fstat(raw, &st) == -1)
  {
    *err_code = last_sys_error();
    FLOW_LOG_TRACE("Opened [" << path << "] as [" << file << "], but fstat() failed: [" << *err_code << "] "
                   "[" << err_code->message() << "].");
    file.reset();
    return file;
  }
  // else

  if (S_ISDIR(st.st_mode))
  {
    *err_code = make_error_code(is_a_directory);
    FLOW_LOG_TRACE("Opened [" << path << "] as [" << file << "], but it is a directory; not readable as a file.");
    file.reset();
    return file;
  }
  // else

  *size = uint64_t(st.st_size);
  err_code->clear();

  FLOW_LOG_TRACE("Opened [" << path << "] as [" << file << "]; size [" << *size << "].");
  return file;
} // open_for_reading()

size_t read_fully(Native_handle src, const Blob_mutable& target, Error_code* err_code)
{
  using ::read;

  assert(err_code);
  assert(!src.null());

  const auto buf = blob_data(target);
  const auto n_total = target.size();
  size_t n_done = 0;

  while (n_done != n_total)
  {
    const auto rc = read(src.m_native_handle, buf + n_done, n_total - n_done);
    if (rc > 0)
    {
      n_done += size_t(rc);
      continue;
    }
    // else
    if (rc == 0)
    {
      break; // EOF came first.  Not an error.
    }
    // else

    const auto sys_err_code = last_sys_error();
    if (is_transient_sys_error(sys_err_code))
    {
      continue; // Same call again; nothing was consumed.
    }
    // else

    *err_code = sys_err_code;
    return n_done;
  } // while (n_done != n_total)

  err_code->clear();
  return n_done;
} // read_fully()

size_t write_fully(Native_handle dest, const Blob_const& src, Error_code* err_code)
{
  using ::write;

  assert(err_code);
  assert(!dest.null());

  const auto buf = blob_data(src);
  const auto n_total = src.size();
  size_t n_done = 0;

  while (n_done != n_total)
  {
    const auto rc = write(dest.m_native_handle, buf + n_done, n_total - n_done);
    if (rc >= 0)
    {
      n_done += size_t(rc);
      continue;
    }
    // else

    const auto sys_err_code = last_sys_error();
    if (is_transient_sys_error(sys_err_code))
    {
      continue; // Spin; see our contract.
    }
    // else

    *err_code = sys_err_code;
    return n_done;
  } // while (n_done != n_total)

  err_code->clear();
  return n_done;
} // write_fully()

} // namespace ripple::util
