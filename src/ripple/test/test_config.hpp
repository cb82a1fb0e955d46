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

#include <flow/log/log.hpp>

namespace ripple::test
{

/**
 * Settings shared by the unit tests, set once by the test `main()` from its command line.
 */
class Test_config
{
public:
  /// Command-line option setting #m_sev, followed by `=` and a `flow::log::Sev` name (e.g., `TRACE`).
  static const std::string S_LOG_SEV_OPTION;

  /**
   * Returns the singleton.
   *
   * @return See above.
   */
  static Test_config& get_singleton();

  /**
   * Applies the options among `argv` that concern us; leaves the rest (gtest's) alone.
   *
   * @param argc
   *        As given to `main()`.
   * @param argv
   *        As given to `main()`.
   * @return `false` if an option of ours had a bad value (it is then reported to standard error).
   */
  bool parse_args(int argc, char const * const * argv);

  /// Most verbose severity logged by Test_logger; default `WARNING`.
  flow::log::Sev m_sev;

private:
  /// Sets defaults.
  Test_config();
}; // class Test_config

} // namespace ripple::test
