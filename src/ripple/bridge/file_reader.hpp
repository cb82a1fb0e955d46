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

#include "ripple/bridge/read_buffer.hpp"
#include <flow/log/log.hpp>

namespace ripple::bridge
{

// Free functions.

/**
 * Reads a whole file, synchronously, into a new Raw_buffer, until end-of-file.  The buffer starts out sized to
 * the file's length `L` at open time, plus the terminator; if all `L` bytes arrive it is grown (`realloc()`) and
 * reading continues, so files whose reported size is 0 or stale (`/proc`, sysfs, a file being appended to) are
 * read in full.  On success size() is exactly the number of bytes read, and the terminator follows them.
 *
 * On error `*target` is untouched.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param path
 *        File to read.
 * @param target
 *        Receives the buffer on success.  Must not be null.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system errors from `open()`/`fstat()`/`read()`; error::Code::S_NOT_A_REGULAR_FILE (a directory);
 *        error::Code::S_BUFFER_ALLOCATION_FAILED.
 */
void read_file(flow::log::Logger* logger_ptr, const fs::path& path, Raw_buffer* target, Error_code* err_code = 0);

/**
 * Opens the file for reading and allocates the Raw_buffer to hold it, without reading anything: the first half of
 * both read_file() and Async_read_launcher::async_read().
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param path
 *        File to open.
 * @param buf
 *        Receives the (unfilled) buffer, sized to the file.  Must not be null.
 * @param err_code
 *        Must not be null.  Set as for read_file(), excluding `read()` errors.
 * @return The open file (null() on error).
 */
Scoped_native_handle open_and_allocate(flow::log::Logger* logger_ptr, const fs::path& path, Raw_buffer* buf,
                                       Error_code* err_code);

} // namespace ripple::bridge
