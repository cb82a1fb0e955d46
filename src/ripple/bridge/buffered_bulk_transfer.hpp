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
 * Implements the Bulk_transfer concept portably: read a chunk of at most #S_CHUNK_SZ bytes from the file into a
 * user-space buffer, write all of it to the destination, repeat.  A chunk read of 0 bytes is end-of-stream; and
 * reading stops after `size` bytes regardless, just as `sendfile()` would.
 * The source is read by offset (`pread()`), so its file position is neither used nor changed.
 *
 * Each transfer() call allocates its own chunk buffer; so concurrent calls are fine.
 */
class Buffered_bulk_transfer :
  public flow::log::Log_context
{
public:
  // Constants.

  /// Size of the chunk buffer: 64 KiB.
  static const size_t S_CHUNK_SZ;

  // Constructors/destructor.

  /**
   * Implements Bulk_transfer API.
   * @param logger_ptr
   *        See concept.
   */
  explicit Buffered_bulk_transfer(flow::log::Logger* logger_ptr);

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
}; // class Buffered_bulk_transfer

} // namespace ripple::bridge
