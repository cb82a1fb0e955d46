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

/**
 * Ripple-Bridge module providing the host-facing file facilities: the asynchronous read protocol (buffer handed
 * to the caller first, filled later, completion announced out-of-band over a named pipe) and file-to-descriptor
 * bulk transfer.  See namespace ::ripple doc header for an overview of how the pieces relate.  A synopsis:
 *
 * - Runtime_dir stores where the side channel (`<dir>/bridge.fifo`) lives.
 * - Fifo_completion_notifier writes one 4-byte big-endian record per completed request into it; it models the
 *   Completion_sink concept, whose only promise is at-most-once, best-effort delivery.
 * - Async_read_launcher allocates a Raw_buffer sized to the file, gives it to the caller at once, and fills it on
 *   a worker thread, tracking the handoff through a Read_ticket.  read_file() is the synchronous counterpart.
 * - File_transfer_engine streams a file to a caller's descriptor via a Bulk_transfer strategy:
 *   Sendfile_bulk_transfer where the kernel offers `sendfile()`, else Buffered_bulk_transfer.
 * - Bridge assembles all of the above; `ripple_bridge.h` exposes it through `extern "C"` entry points.
 */
namespace ripple::bridge
{

// Types.

// Find doc headers near the bodies of these compound types.

class Runtime_dir;
class Fifo_completion_notifier;
class Raw_buffer;
class Read_ticket;
template<typename Completion_sink>
class Async_read_launcher;
class Sendfile_bulk_transfer;
class Buffered_bulk_transfer;
template<typename Bulk_transfer>
class File_transfer_engine;
struct Bridge_config;
class Bridge;

/// Convenience alias for the commonly used type util::Native_handle.
using Native_handle = util::Native_handle;

/// Convenience alias for the commonly used type util::Scoped_native_handle.
using Scoped_native_handle = util::Scoped_native_handle;

/// Caller-supplied correlation token of one asynchronous read, as accepted at the entry points.
using request_id_t = uint64_t;

/**
 * The request ID as it appears in a completion record on the side channel.  It is narrower than #request_id_t;
 * see to_wire_request_id().
 */
using wire_request_id_t = uint32_t;

/**
 * The Bulk_transfer strategy for the current platform: the kernel-mediated one where it exists, else the
 * portable buffered copy.
 */
#if defined(FLOW_OS_LINUX) || defined(FLOW_OS_MAC)
using Default_bulk_transfer = Sendfile_bulk_transfer;
#else
using Default_bulk_transfer = Buffered_bulk_transfer;
#endif

/// The File_transfer_engine used by the default assembly.
using Default_file_transfer_engine = File_transfer_engine<Default_bulk_transfer>;

/// The Async_read_launcher used by the default assembly.
using Fifo_async_read_launcher = Async_read_launcher<Fifo_completion_notifier>;

// Free functions.

/**
 * Narrows a request ID to its wire form by keeping its low 32 bits.  If any of the dropped high bits are set,
 * logs a WARNING: the host will see a record that does not match what it submitted unless it, too, keeps
 * only the low bits.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param request_id
 *        ID as supplied by the caller.
 * @return See above.
 */
wire_request_id_t to_wire_request_id(flow::log::Logger* logger_ptr, request_id_t request_id);

/**
 * Prints string representation of the given `Raw_buffer` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Raw_buffer& val);

/**
 * Prints string representation of the given `Read_ticket` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Read_ticket& val);

/**
 * Prints string representation of the given `Runtime_dir` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Runtime_dir& val);

/**
 * Prints string representation of the given `Async_read_launcher` to the given `ostream`.
 *
 * @relatesalso Async_read_launcher
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Completion_sink>
std::ostream& operator<<(std::ostream& os, const Async_read_launcher<Completion_sink>& val);

/**
 * Prints string representation of the given `File_transfer_engine` to the given `ostream`.
 *
 * @relatesalso File_transfer_engine
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Bulk_transfer>
std::ostream& operator<<(std::ostream& os, const File_transfer_engine<Bulk_transfer>& val);

} // namespace ripple::bridge
