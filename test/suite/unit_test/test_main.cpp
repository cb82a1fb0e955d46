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
#include "ripple/test/test_config.hpp"
#include <gtest/gtest.h>
#include <csignal>

/* Runs all unit tests.  Accepts the usual gtest options plus --minimum-log-severity=<SEV> (see Test_config). */
int main(int argc, char** argv)
{
  using ripple::test::Test_config;

  const int BAD_EXIT = 1;

  // A write into a socket whose peer is gone should fail with EPIPE, not kill the test process.
  std::signal(SIGPIPE, SIG_IGN);

  ::testing::InitGoogleTest(&argc, argv);
  if (!Test_config::get_singleton().parse_args(argc, argv))
  {
    return BAD_EXIT;
  }
  // else
  return RUN_ALL_TESTS();
}
