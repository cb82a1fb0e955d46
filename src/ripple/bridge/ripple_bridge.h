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

/* C entry points of the bridge, for a host loading the shared library through its foreign-function interface.
 * Everything operates on one process-wide ripple::bridge::Bridge, created on first use and never destroyed.
 * No call throws, and no error detail is returned: failure is null or -1.  Logging goes to standard error;
 * its severity and the async worker count come from the environment (RIPPLE_LOG_SEV, RIPPLE_READ_WORKERS).
 *
 * Async protocol: ripple_file_get_contents_async() returns a buffer that must not be read (nor freed) until the
 * 4-byte big-endian record carrying the low 32 bits of its request ID has been read from the named pipe
 * <runtime dir>/bridge.fifo.  At most one record per accepted request; none if the call returned null.
 * Creating the pipe and keeping it open for reading are the host's job; records written while no reader is
 * attached are lost. */

#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

/**
 * Sets the runtime directory (where `bridge.fifo` lives), unless already set by an earlier call.  Null, or a path
 * that is not valid UTF-8, means the current working directory.  Without any call, the directory is
 * `$RIPPLE_RUNTIME_DIR` if set, else the current working directory.
 *
 * @param dir
 *        NUL-terminated directory path; or null.
 * @return 0, always.
 */
int ripple_link(const char* dir);

/**
 * Reads the whole file synchronously.
 *
 * @param path
 *        NUL-terminated UTF-8 path.
 * @return Buffer of file size + 1 bytes, NUL-terminated, owned by the caller (release with ripple_buffer_free()
 *         or `free()`); or null on any error.
 */
char* ripple_file_get_contents(const char* path);

/**
 * Starts an asynchronous whole-file read; see the protocol above.
 *
 * @param path
 *        NUL-terminated UTF-8 path.
 * @param request_id
 *        Correlation token; its low 32 bits appear in the completion record.
 * @return Buffer of file size + 1 bytes whose last byte is 0, owned by the caller; or null on any error, in which
 *         case no record will be written.
 */
char* ripple_file_get_contents_async(const char* path, uint64_t request_id);

/**
 * Sends the whole file into the given descriptor (zero-copy where the platform allows), blocking until done.
 * The descriptor is never closed.
 *
 * @param fd
 *        Writable descriptor, e.g., a connected socket.
 * @param path
 *        NUL-terminated UTF-8 path.
 * @return 0 on success (an empty file sends nothing); -1 on any error.
 */
int ripple_process_file(int fd, const char* path);

/**
 * Releases a buffer returned by ripple_file_get_contents() or ripple_file_get_contents_async().  Null is a no-op.
 *
 * @param buf
 *        The buffer.
 */
void ripple_buffer_free(char* buf);

#ifdef __cplusplus
} // extern "C"
#endif
