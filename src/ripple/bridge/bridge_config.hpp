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
 * Settings of one Bridge, as the default (FFI) assembly takes them from the environment; see from_environment().
 * Native users may as well fill one out directly.  The runtime directory is not here: Runtime_dir consults its
 * own environment variable, at resolution time.
 */
struct Bridge_config
{
  // Constants.

  /// Environment variable naming the log severity: a `flow::log::Sev` name minus `S_` (e.g., `INFO`) or its number.
  static const std::string S_LOG_SEV_ENV_VAR_NAME;

  /// Environment variable giving #m_n_read_workers.
  static const std::string S_READ_WORKERS_ENV_VAR_NAME;

  /// Default #m_log_sev.
  static const flow::log::Sev S_DEFAULT_LOG_SEV;

  /// Default #m_n_read_workers.
  static const size_t S_DEFAULT_N_READ_WORKERS;

  /// Largest allowed #m_n_read_workers.
  static const size_t S_MAX_N_READ_WORKERS;

  // Data.

  /// Most verbose severity the assembly's logger lets through.
  flow::log::Sev m_log_sev = S_DEFAULT_LOG_SEV;

  /// Size of the async-read worker pool; 1 through #S_MAX_N_READ_WORKERS.
  size_t m_n_read_workers = S_DEFAULT_N_READ_WORKERS;

  // Methods.

  /**
   * Builds the config from #S_LOG_SEV_ENV_VAR_NAME and #S_READ_WORKERS_ENV_VAR_NAME.  A variable that is unset
   * leaves the default; one that is set but invalid is logged (WARNING) and also leaves the default.  Never fails.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @return See above.
   */
  static Bridge_config from_environment(flow::log::Logger* logger_ptr);
}; // struct Bridge_config

// Free functions.

/**
 * Prints string representation of the given `Bridge_config` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Bridge_config& val);

} // namespace ripple::bridge
