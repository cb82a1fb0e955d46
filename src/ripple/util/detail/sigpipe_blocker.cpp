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
#include "ripple/util/detail/sigpipe_blocker.hpp"
#include <pthread.h>
#include <cerrno>

namespace ripple::util
{

namespace
{

/// Returns a set holding only `SIGPIPE`.
::sigset_t sigpipe_set()
{
  ::sigset_t set;
  ::sigemptyset(&set);
  ::sigaddset(&set, SIGPIPE);
  return set;
}

/// Returns whether `SIGPIPE` is pending for the calling thread (or the process).
bool sigpipe_pending()
{
  ::sigset_t pending;
  ::sigemptyset(&pending);
  return (::sigpending(&pending) == 0) && (::sigismember(&pending, SIGPIPE) == 1);
}

} // Anonymous namespace

// Implementations.

Sigpipe_blocker::Sigpipe_blocker()
{
  const auto set = sigpipe_set();
  ::pthread_sigmask(SIG_BLOCK, &set, &m_prior_mask); // Cannot fail with valid arguments.
  m_was_pending = sigpipe_pending();
}

Sigpipe_blocker::~Sigpipe_blocker()
{
  const auto saved_errno = errno; // The guarded write()'s errno is the caller's to examine next.

  if ((!m_was_pending) && sigpipe_pending())
  {
    // It is pending, so sigwait() returns at once.
    const auto set = sigpipe_set();
    int sig_num;
    ::sigwait(&set, &sig_num);
  }

  ::pthread_sigmask(SIG_SETMASK, &m_prior_mask, nullptr);
  errno = saved_errno;
}

} // namespace ripple::util
