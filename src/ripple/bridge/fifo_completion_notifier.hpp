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
#pragma once

#include "ripple/bridge/bridge_fwd.hpp"
#include <flow/log/log.hpp>

namespace ripple::bridge
{

// Types.

/**
 * Implements the Completion_sink concept by writing a completion record (see encode_completion_record()) into the
 * named pipe at Runtime_dir::sidechannel_path().
 *
 * Each notify() resolves the path anew, opens the pipe write-only and non-blocking, writes the 4 bytes, and closes
 * it.  Non-blocking open is what keeps a worker from hanging when nobody has the pipe open for reading: the open
 * then fails with `ENXIO`, and the record is dropped.  A write into a pipe with room for it is atomic (4 bytes
 * is far below `PIPE_BUF`), so concurrent notifications never interleave bytes.
 *
 * Every failure other than `EINTR` (retried) is logged at WARNING and swallowed.
 *
 * ### Thread safety ###
 * notify() is safe to call concurrently on the same `*this`.
 */
class Fifo_completion_notifier :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the notifier.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param runtime_dir
   *        Where to find the side channel.  Must outlive `*this`.
   */
  explicit Fifo_completion_notifier(flow::log::Logger* logger_ptr, const Runtime_dir& runtime_dir);

  // Methods.

  /**
   * Implements Completion_sink API per its concept doc header.
   *
   * @param request_id
   *        See concept.
   * @return See concept.
   */
  bool notify(wire_request_id_t request_id);

private:
  // Data.

  /// See ctor.
  const Runtime_dir& m_runtime_dir;
}; // class Fifo_completion_notifier

} // namespace ripple::bridge
