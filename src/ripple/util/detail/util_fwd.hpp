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
#include <flow/common.hpp>

namespace ripple::util
{

// Free functions.

/**
 * Returns `true` if and only if the given system error is one of the transient conditions that our I/O loops
 * retry in place, immediately and without backoff: would-block (`EAGAIN`/`EWOULDBLOCK`) or interrupted (`EINTR`).
 *
 * @param sys_err_code
 *        An error from an I/O system call, as `Error_code(errno, system_category())`.
 * @return See above.
 */
bool is_transient_sys_error(const Error_code& sys_err_code);

/**
 * Opens the file at the given path read-only (close-on-exec) and reports its size as of now; fails if it
 * is a directory.  Other non-regular files are allowed (their reported size is whatever `fstat()` says,
 * typically 0 for pipes and devices).
 *
 * @param logger_ptr
 *        Logger to use for logging (TRACE only; the caller decides how loudly to report failure).
 * @param path
 *        Path to open.
 * @param size
 *        On success `*size` is set to the file's length in bytes.  Must not be null.
 * @param err_code
 *        Must not be null.  Set to success or: system error from `open()` or `fstat()`; or
 *        `boost::system::errc::is_a_directory`.
 * @return Owned handle (null() on error).
 */
Scoped_native_handle open_for_reading(flow::log::Logger* logger_ptr, const fs::path& path, uint64_t* size,
                                      Error_code* err_code);

/**
 * Reads from `src` until `target` is full or end-of-file, retrying transient errors (see is_transient_sys_error())
 * in place.  Blocks as needed.
 *
 * @param src
 *        Readable descriptor.  Not closed.
 * @param target
 *        Where to place the bytes.
 * @param err_code
 *        Must not be null.  Set to success (even if end-of-file came early) or the first non-transient system
 *        error encountered.
 * @return Number of bytes placed into `target`, even on error.  Less than `target.size()` without error
 *         means end-of-file was reached first.
 */
size_t read_fully(Native_handle src, const Blob_mutable& target, Error_code* err_code);

/**
 * Writes all of `src` into `dest`, retrying transient errors (see is_transient_sys_error()) in place; so if
 * `dest` is non-blocking this will spin until the bytes are accepted.
 *
 * @param dest
 *        Writable descriptor.  Not closed.
 * @param src
 *        Bytes to write.
 * @param err_code
 *        Must not be null.  Set to success or the first non-transient system error encountered.
 * @return Number of bytes written, even on error.
 */
size_t write_fully(Native_handle dest, const Blob_const& src, Error_code* err_code);

/**
 * Short-hand for `Error_code(errno, system_category())`.
 * @return See above.
 */
Error_code last_sys_error();

} // namespace ripple::util
