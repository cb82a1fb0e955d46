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
#include <flow/util/util.hpp>
#include <optional>

namespace ripple::bridge
{

// Types.

/**
 * Registry of the runtime directory: the directory in which the side channel (the named pipe carrying completion
 * records) lives.  The path is set at most once (the first initialize() wins) and read any number of times,
 * most notably by Fifo_completion_notifier each time it is about to write a record.
 *
 * One `Runtime_dir` is meant to be shared by everything in one assembly (see Bridge), which receives it by
 * reference; nothing here is a process-wide singleton.  It must outlive its users.
 *
 * ### Resolution ###
 * initialize() decides what to store: the given path, if it is non-null and valid UTF-8; else the current working
 * directory; else (cwd unavailable) the literal #S_FALLBACK_DIR.  If initialize() was never called,
 * sidechannel_path() resolves the directory anew each time: the #S_ENV_VAR_NAME environment variable if set;
 * else the current working directory; else #S_FALLBACK_DIR.  No directory is ever created or validated; the
 * pipe itself is the host's to create.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently with each other on the same `*this`.
 */
class Runtime_dir :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constants.

  /// Name of the side-channel named pipe inside the runtime directory.
  static const std::string S_SIDECHANNEL_FILENAME;

  /// Environment variable consulted by sidechannel_path() when initialize() has not been called.
  static const std::string S_ENV_VAR_NAME;

  /// Directory used when nothing else can be determined.
  static const fs::path S_FALLBACK_DIR;

  // Constructors/destructor.

  /**
   * Constructs the registry in not-initialized state.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit Runtime_dir(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Stores the runtime directory, resolved as explained in the class doc header, unless one is already stored
   * (in which case this is a no-op).  Never fails.
   *
   * @param explicit_dir_or_null
   *        NUL-terminated directory path; or null.  Not touched after return.
   * @return `true` if this call stored the directory; `false` if an earlier call already had.
   */
  bool initialize(const char* explicit_dir_or_null);

  /**
   * Returns the full path of the side channel: `<dir>/` #S_SIDECHANNEL_FILENAME, with `<dir>` as explained in the
   * class doc header.
   *
   * @return See above.
   */
  fs::path sidechannel_path() const;

  /**
   * Returns `true` if and only if initialize() has stored a directory.
   * @return See above.
   */
  bool initialized() const;

  /**
   * Returns the stored directory, if initialize() has stored one; else `nullopt`.
   * @return See above.
   */
  std::optional<fs::path> stored_dir() const;

private:
  // Methods.

  /**
   * The directory to use absent any explicit choice: cwd, or #S_FALLBACK_DIR if that cannot be determined.
   * @return See above.
   */
  fs::path cwd_or_fallback() const;

  // Data.

  /// Protects #m_dir.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// The stored directory; `nullopt` until initialize().  Protected by #m_mutex.
  std::optional<fs::path> m_dir;
}; // class Runtime_dir

} // namespace ripple::bridge
