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

// Not compiled: for documentation only.  Contains concept docs as of this writing.
#ifndef RIPPLE_DOXYGEN_ONLY
#  error "As of this writing this is a documentation-only "header" (the "source" is for humans and Doxygen only)."
#else // ifdef RIPPLE_DOXYGEN_ONLY

namespace ripple::bridge
{

// Types.

/**
 * A documentation-only *concept* defining the behavior of an object that announces, to whoever is listening,
 * that one asynchronous read has finished filling its buffer.  Async_read_launcher is parameterized on it;
 * Fifo_completion_notifier is the production model.
 *
 * ### Delivery guarantee ###
 * notify() is called exactly once per accepted request, after the buffer content became stable.  Delivery is
 * *at-most-once and best-effort*: notify() may fail to deliver (no listener, full pipe, missing pipe, ...), in
 * which case nothing is retried and nothing is reported to the launcher beyond the `bool` result, which the
 * launcher only logs.  A model must never retry on its own (the listener would see duplicates) and must never
 * block indefinitely on an absent listener.  notify() must not throw.
 *
 * The only fact a delivered notification conveys is "the buffer of this request is now stable."  In particular
 * it does not say whether the fill succeeded.
 *
 * ### Thread safety ###
 * notify() may be called concurrently from several worker threads on the same `*this`.
 */
class Completion_sink
{
public:
  // Methods.

  /**
   * Attempts to deliver one completion notification carrying the given request ID, without blocking on an absent
   * listener.
   *
   * @param request_id
   *        ID as it should appear to the listener.
   * @return `true` if delivered in full; `false` if dropped.
   */
  bool notify(wire_request_id_t request_id);
}; // class Completion_sink

} // namespace ripple::bridge

#endif // RIPPLE_DOXYGEN_ONLY
