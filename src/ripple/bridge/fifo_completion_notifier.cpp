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
#include "ripple/bridge/fifo_completion_notifier.hpp"
#include "ripple/bridge/completion_record.hpp"
#include "ripple/bridge/runtime_dir.hpp"
#include "ripple/util/detail/util_fwd.hpp"
#include "ripple/util/detail/sigpipe_blocker.hpp"
#include <flow/error/error.hpp>
#include <fcntl.h>
#include <unistd.h>

namespace ripple::bridge
{

// Implementations.

Fifo_completion_notifier::Fifo_completion_notifier(flow::log::Logger* logger_ptr, const Runtime_dir& runtime_dir) :
  flow::log::Log_context(logger_ptr, Log_component::S_BRIDGE),
  m_runtime_dir(runtime_dir)
{
  // Nothing else.
}

bool Fifo_completion_notifier::notify(wire_request_id_t request_id)
{
  using util::last_sys_error;
  using ::open;
  // using ::O_WRONLY; // A macro apparently.
  // using ::O_NONBLOCK; // A macro apparently.

  const auto path = m_runtime_dir.sidechannel_path();
  const auto record = encode_completion_record(request_id);

  int raw;
  do
  {
    raw = open(path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
  }
  while ((raw == -1) && (errno == EINTR));

  if (raw == -1)
  {
    const auto sys_err_code = last_sys_error();
    FLOW_LOG_WARNING("Fifo_completion_notifier [" << this << "]: Could not open side channel [" << path << "] to "
                     "announce completion of request [" << request_id << "].  Dropping notification.  (No reader "
                     "attached would show up as ENXIO.)  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return false;
  }
  // else
  const Scoped_native_handle pipe{Native_handle(raw)};

  /* A 4-byte write into a pipe is all-or-nothing.  Pipe full => EAGAIN => drop; util::write_fully() would spin on
   * that instead, waiting on the reader. */
  ssize_t rc;
  {
    /* We run on a worker thread the host never sees; so the reader closing between our open() and write() must
     * not kill the process through SIGPIPE, whatever disposition the host chose.  It is reported as EPIPE. */
    const util::Sigpipe_blocker no_sigpipe;
    do
    {
      rc = ::write(raw, record.data(), record.size());
    }
    while ((rc == -1) && (errno == EINTR));
  }

  if (rc == -1)
  {
    const auto sys_err_code = last_sys_error();
    FLOW_LOG_WARNING("Fifo_completion_notifier [" << this << "]: Could not write to side channel [" << path << "] "
                     "as [" << pipe << "] to announce completion of request [" << request_id << "].  "
                     "Dropping notification.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return false;
  }
  // else
  if (size_t(rc) != record.size())
  {
    FLOW_LOG_WARNING("Fifo_completion_notifier [" << this << "]: Wrote only [" << rc << "] of [" << record.size() << "] "
                     "bytes of the completion record of request [" << request_id << "] to side channel "
                     "[" << path << "].  The listener will likely misread the stream from here on.");
    return false;
  }
  // else

  FLOW_LOG_TRACE("Fifo_completion_notifier [" << this << "]: Announced completion of request [" << request_id << "] "
                 "via side channel [" << path << "].");
  return true;
} // Fifo_completion_notifier::notify()

} // namespace ripple::bridge
