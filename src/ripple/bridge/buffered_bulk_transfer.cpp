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
#include "ripple/bridge/buffered_bulk_transfer.hpp"
#include "ripple/util/detail/util_fwd.hpp"
#include <flow/error/error.hpp>
#include <flow/util/blob.hpp>
#include <algorithm>
#include <unistd.h>

namespace ripple::bridge
{

// Static initializers.

const size_t Buffered_bulk_transfer::S_CHUNK_SZ = 64 * 1024;

// Implementations.

Buffered_bulk_transfer::Buffered_bulk_transfer(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_BRIDGE)
{
  // Nothing else.
}

uint64_t Buffered_bulk_transfer::transfer(Native_handle dest, Native_handle src, uint64_t size,
                                          Error_code* err_code)
{
  using util::Blob_const;
  using util::is_transient_sys_error;
  using util::last_sys_error;
  using util::write_fully;
  using flow::util::Blob;
  using std::min;
  using ::pread;

  assert(err_code);
  assert(!(dest.null() || src.null()));

  Blob chunk(get_logger(), size_t(min(size, uint64_t(S_CHUNK_SZ))));
  uint64_t n_done = 0;

  while (n_done != size) // Bytes appended since the file was measured are not ours to send.
  {
    const auto n_req = size_t(min(size - n_done, uint64_t(chunk.size())));
    const auto rc = pread(src.m_native_handle, chunk.begin(), n_req, ::off_t(n_done));
    if (rc == -1)
    {
      const auto sys_err_code = last_sys_error();
      if (is_transient_sys_error(sys_err_code))
      {
        continue;
      }
      // else

      FLOW_LOG_WARNING("Buffered_bulk_transfer [" << this << "]: Reading [" << src << "] failed with [" << n_done << "] "
                       "of [" << size << "] bytes copied to [" << dest << "].  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      *err_code = sys_err_code;
      return n_done;
    }
    // else

    if (rc == 0)
    {
      FLOW_LOG_WARNING("Buffered_bulk_transfer [" << this << "]: [" << src << "] hit end-of-file with [" << n_done << "] "
                       "of [" << size << "] bytes copied to [" << dest << "].  Stopping; this is not an error.");
      break;
    }
    // else

    Error_code sys_err_code;
    const auto n_written = write_fully(dest, Blob_const(chunk.const_begin(), size_t(rc)), &sys_err_code);
    n_done += n_written;
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Buffered_bulk_transfer [" << this << "]: Writing to [" << dest << "] failed with "
                       "[" << n_done << "] of [" << size << "] bytes copied from [" << src << "].  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      *err_code = sys_err_code;
      return n_done;
    }
  } // while (n_done != size)

  FLOW_LOG_TRACE("Buffered_bulk_transfer [" << this << "]: Copied [" << n_done << "] bytes from [" << src << "] "
                 "to [" << dest << "].");
  err_code->clear();
  return n_done;
} // Buffered_bulk_transfer::transfer()

} // namespace ripple::bridge
