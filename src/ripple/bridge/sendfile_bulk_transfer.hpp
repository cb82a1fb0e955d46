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
 * Implements the Bulk_transfer concept with `sendfile()`, so that the bytes move between the descriptors inside
 * the kernel without being copied through user memory.  Linux and macOS only; their `sendfile()` signatures
 * differ, and the difference is confined to transfer().
 *
 * On Linux the kernel advances the offset it is given by the count it returns.  On macOS the count comes back in
 * an in/out argument, which is meaningful even when the call fails with `EAGAIN`/`EINTR` (a partial send); so
 * there those conditions still advance the offset by what was sent.
 */
class Sendfile_bulk_transfer :
  public flow::log::Log_context
{
public:
  // Constants.

  /// Most bytes requested of one `sendfile()` call.  Linux caps one call near 2 GiB anyway.
  static const uint64_t S_MAX_CHUNK_SZ;

  // Constructors/destructor.

  /**
   * Implements Bulk_transfer API.
   * @param logger_ptr
   *        See concept.
   */
  explicit Sendfile_bulk_transfer(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Implements Bulk_transfer API per its concept doc header.
   *
   * @param dest
   *        See concept.
   * @param src
   *        See concept.
   * @param size
   *        See concept.
   * @param err_code
   *        See concept.
   * @return See concept.
   */
  uint64_t transfer(Native_handle dest, Native_handle src, uint64_t size, Error_code* err_code);
}; // class Sendfile_bulk_transfer

} // namespace ripple::bridge
