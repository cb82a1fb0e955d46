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
#include "ripple/bridge/sendfile_bulk_transfer.hpp"
#include "ripple/util/detail/util_fwd.hpp"
#include <flow/error/error.hpp>
#include <algorithm>
#ifdef FLOW_OS_LINUX
#  include <sys/sendfile.h>
#elif defined(FLOW_OS_MAC)
#  include <sys/types.h>
#  include <sys/socket.h>
#  include <sys/uio.h>
#else
#  error "Sendfile_bulk_transfer needs Linux or macOS sendfile(); build Buffered_bulk_transfer only elsewhere."
#endif

namespace ripple::bridge
{

// Static initializers.

const uint64_t Sendfile_bulk_transfer::S_MAX_CHUNK_SZ = 0x7ffff000;

// Implementations.

Sendfile_bulk_transfer::Sendfile_bulk_transfer(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_BRIDGE)
{
  // Nothing else.
}

uint64_t Sendfile_bulk_transfer::transfer(Native_handle dest, Native_handle src, uint64_t size,
                                          Error_code* err_code)
{
  using util::is_transient_sys_error;
  using util::last_sys_error;
  using std::min;
  using ::sendfile;

  assert(err_code);
  assert(!(dest.null() || src.null()));

  ::off_t offset = 0;
  uint64_t n_left = size;
  uint64_t n_spins = 0;

  while (n_left != 0)
  {
    const auto n_req = min(n_left, S_MAX_CHUNK_SZ);

#ifdef FLOW_OS_LINUX
    const auto rc = sendfile(dest.m_native_handle, src.m_native_handle, &offset, size_t(n_req));
    const uint64_t n_sent = (rc > 0) ? uint64_t(rc) : 0; // Kernel already advanced `offset` by n_sent.
    const auto sys_err_code = (rc == -1) ? last_sys_error() : Error_code();
#elif defined(FLOW_OS_MAC)
    ::off_t len = ::off_t(n_req);
    const auto rc = sendfile(src.m_native_handle, dest.m_native_handle, offset, &len, nullptr, 0);
    const uint64_t n_sent = (len > 0) ? uint64_t(len) : 0; // Meaningful even with EAGAIN/EINTR.
    const auto sys_err_code = (rc == -1) ? last_sys_error() : Error_code();
    offset += ::off_t(n_sent);
#endif
    n_left -= n_sent;

    if (sys_err_code)
    {
      if (is_transient_sys_error(sys_err_code))
      {
        ++n_spins;
        continue;
      }
      // else

      FLOW_LOG_WARNING("Sendfile_bulk_transfer [" << this << "]: sendfile() from [" << src << "] to [" << dest << "] "
                       "failed with [" << (size - n_left) << "] of [" << size << "] bytes sent.  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      *err_code = sys_err_code;
      return size - n_left;
    }
    // else

    if (n_sent == 0)
    {
      FLOW_LOG_WARNING("Sendfile_bulk_transfer [" << this << "]: sendfile() from [" << src << "] to [" << dest << "] "
                       "reported end-of-stream with [" << (size - n_left) << "] of [" << size << "] bytes sent.  "
                       "Stopping; this is not an error.");
      break;
    }
  } // while (n_left != 0)

  FLOW_LOG_TRACE("Sendfile_bulk_transfer [" << this << "]: Sent [" << (size - n_left) << "] bytes from [" << src << "] "
                 "to [" << dest << "]; retried transient errors [" << n_spins << "] times.");
  err_code->clear();
  return size - n_left;
} // Sendfile_bulk_transfer::transfer()

} // namespace ripple::bridge
