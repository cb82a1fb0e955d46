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

#include "ripple/bridge/bridge_config.hpp"
#include "ripple/bridge/runtime_dir.hpp"
#include "ripple/bridge/fifo_completion_notifier.hpp"
#include "ripple/bridge/async_read_launcher.hpp"
#include "ripple/bridge/file_transfer_engine.hpp"
#include "ripple/bridge/sendfile_bulk_transfer.hpp"
#include "ripple/bridge/buffered_bulk_transfer.hpp"

namespace ripple::bridge
{

// Types.

/**
 * One complete assembly of the bridge components, exposing exactly the operations of the C entry points in
 * `ripple_bridge.h` with exactly their argument and result shapes: raw C strings in; an owned `char*` or null,
 * or 0 / -1, out.  Every error is logged and flattened into that shape here; nothing is thrown for an ordinary
 * failure.  (An exception can still escape on resource exhaustion, e.g., `std::bad_alloc`; the FFI layer
 * catches those.)
 *
 * Owns one each of: Runtime_dir; Fifo_completion_notifier (given the Runtime_dir); Fifo_async_read_launcher (given
 * the notifier); Default_file_transfer_engine.  Destruction waits for outstanding async reads; see
 * ~Async_read_launcher().
 *
 * A path argument "decodes" if it is non-null and valid UTF-8; otherwise the operation fails with
 * error::Code::S_INVALID_ARGUMENT, flattened like any other failure.
 *
 * ### Thread safety ###
 * All operations are safe to call concurrently on the same `*this`.
 */
class Bridge :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Builds and starts the components.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; also given to every component.
   * @param config
   *        Settings.
   */
  explicit Bridge(flow::log::Logger* logger_ptr, const Bridge_config& config);

  /// Waits for outstanding async reads to be released; then tears down.
  ~Bridge();

  // Methods.

  /**
   * Sets the runtime directory, unless already set.  See Runtime_dir::initialize().
   *
   * @param dir_or_null
   *        Directory; or null to mean the working directory.
   * @return 0, always.
   */
  int link(const char* dir_or_null);

  /**
   * Reads the whole file.  See read_file().
   *
   * @param path
   *        File to read.
   * @return Buffer of file size + 1 bytes, NUL-terminated, owned by the caller (free with `free()`); or null.
   */
  char* file_get_contents(const char* path);

  /**
   * Starts an asynchronous read.  See Async_read_launcher::async_read().  On null return no completion record
   * will ever be written for `request_id`.
   *
   * @param path
   *        File to read.
   * @param request_id
   *        Correlation token to appear (low 32 bits) in the completion record.
   * @return Buffer of file size + 1 bytes whose last byte is 0, owned by the caller but not to be read (nor freed)
   *         until the completion record arrives; or null.
   */
  char* file_get_contents_async(const char* path, request_id_t request_id);

  /**
   * Sends the whole file into a descriptor.  See File_transfer_engine::transfer_file().
   *
   * @param fd
   *        Writable descriptor; borrowed, never closed.
   * @param path
   *        File to send.
   * @return 0 on success (including early end-of-stream); -1 on failure.
   */
  int process_file(int fd, const char* path);

  /**
   * The runtime directory registry.
   * @return See above.
   */
  Runtime_dir& runtime_dir();

  /**
   * The async read launcher.
   * @return See above.
   */
  Fifo_async_read_launcher& launcher();

  /**
   * The config given to ctor.
   * @return See above.
   */
  const Bridge_config& config() const;

private:
  // Methods.

  /**
   * Decodes a raw path argument: non-null and valid UTF-8, or error.
   *
   * @param raw_path
   *        The argument.
   * @param err_code
   *        Must not be null.  Set to success or error::Code::S_INVALID_ARGUMENT.
   * @return The path; empty on error.
   */
  fs::path decode_path(const char* raw_path, Error_code* err_code) const;

  // Data.

  /// See config().
  const Bridge_config m_config;

  /// See runtime_dir().
  Runtime_dir m_runtime_dir;

  /// The completion sink; writes into the side channel located via #m_runtime_dir.
  Fifo_completion_notifier m_notifier;

  /// See launcher().  Declared after #m_notifier, so destroyed (having waited for its workers) before it.
  Fifo_async_read_launcher m_launcher;

  /// Performs process_file().
  Default_file_transfer_engine m_transfer_engine;
}; // class Bridge

} // namespace ripple::bridge
