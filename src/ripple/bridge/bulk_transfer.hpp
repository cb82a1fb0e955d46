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
 * A documentation-only *concept* defining a way to move the first `size` bytes of an open file into a
 * writable descriptor (socket, pipe, file), blocking as needed.  File_transfer_engine is parameterized on it.
 * Models: Sendfile_bulk_transfer (kernel-mediated, Linux and macOS) and Buffered_bulk_transfer (portable).
 * Default_bulk_transfer names the one to use on the current platform.
 *
 * ### Required behavior ###
 *   - Start at offset 0 of `src`; advance by exactly what each primitive call reports as moved.
 *   - `EAGAIN`/`EWOULDBLOCK`/`EINTR`: retry at once, with no backoff, without losing progress.  (A non-blocking
 *     `dest` is thus handled by spinning.)
 *   - Any other failure: stop; report the system error.
 *   - A call that moves 0 bytes without error means end-of-stream: stop; report success, even though fewer than
 *     `size` bytes were moved.  The returned count tells.
 *   - `size` is a hard cap: never move more than `size` bytes, even if the file grew since it was measured.  Both
 *     models honor this (the sendfile primitives take the count; the buffered loop caps each read), so the result
 *     does not depend on Default_bulk_transfer.  Files whose measured length is unreliable (0 for `/proc` and
 *     sysfs) are thus not suitable: File_transfer_engine sends nothing for them.
 *   - Never close `src` or `dest`.
 *
 * ### Thread safety ###
 * transfer() may be called concurrently on the same `*this`.
 */
class Bulk_transfer
{
public:
  // Constructors/destructor.

  /**
   * Constructs the strategy.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit Bulk_transfer(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Moves up to `size` bytes, and no more, from the start of `src` into `dest`, per concept doc header.
   *
   * @param dest
   *        Writable descriptor.  Borrowed.
   * @param src
   *        Readable regular file, positioned anywhere (position may or may not be used).  Borrowed.
   * @param size
   *        Number of bytes to move: the file's length as measured at open time.  Not 0.  A cap, not a hint.
   * @param err_code
   *        Must not be null.  Set to success or the system error that stopped the transfer.
   * @return Number of bytes moved, even on error.
   */
  uint64_t transfer(Native_handle dest, Native_handle src, uint64_t size, Error_code* err_code);
}; // class Bulk_transfer

} // namespace ripple::bridge

#endif // RIPPLE_DOXYGEN_ONLY
