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

#include "ripple/util/util_fwd.hpp"
#include <boost/noncopyable.hpp>
#include <signal.h>

namespace ripple::util
{

// Types.

/**
 * While alive, keeps `SIGPIPE` from being delivered to the current thread because of writes made on it; a write to
 * a pipe or socket whose reader is gone then simply fails with `EPIPE`, whatever the process-wide disposition is.
 * Construct it right before the write(s), on the same thread, and let it die right after.
 *
 * Mechanics: the ctor blocks `SIGPIPE` in the thread's mask, noting whether one was already pending.  The dtor, if
 * a new one became pending meanwhile (our write raised it), consumes it with `sigwait()`; then restores the mask.
 * A `SIGPIPE` pending from before is left alone for its rightful handler.
 *
 * A process-directed `SIGPIPE` (e.g., from `kill()`) arriving in the window may be consumed too; that is
 * accepted.
 */
class Sigpipe_blocker :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Blocks `SIGPIPE` for this thread.
  Sigpipe_blocker();

  /// Consumes a `SIGPIPE` raised in our lifetime, if any; restores the signal mask as it was.
  ~Sigpipe_blocker();

private:
  // Data.

  /// The thread's signal mask before the ctor.
  ::sigset_t m_prior_mask;

  /// Whether `SIGPIPE` was already pending for this thread (or process) at ctor time.
  bool m_was_pending;
}; // class Sigpipe_blocker

} // namespace ripple::util
