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

/* flow/util/util.hpp first: flow/common.hpp needs to #undef a couple things (FLOW_LOG_CFG_COMPONENT_*)
 * before we `#define` our own in ripple/detail/common.hpp. */
#include <flow/util/util.hpp>

#include "ripple/detail/common.hpp"
#include <boost/filesystem.hpp>

/* The API headers (templates, inline code) need C++17, and so do the `#include`ing translation units of the
 * user; fail early and clearly rather than deep inside some template. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any ripple/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Ripple-Bridge project: the native core that a scripting host loads through a C FFI
 * in order to (1) read files asynchronously, learning of completion over an out-of-band side channel (a named
 * pipe), and (2) stream files to descriptors with kernel-mediated (zero-copy) transfer.
 *
 * Modules overview
 * ----------------
 *   - ripple::util: basic building blocks.  util::Native_handle (a trivial FD wrapper), util::Scoped_native_handle
 *     (its owning counterpart), POSIX I/O helpers that retry transient errors, text validation.
 *   - ripple::bridge: the substance.  In bottom-up order:
 *     -# bridge::Runtime_dir: the runtime-directory registry, locating the side channel.
 *     -# bridge::Fifo_completion_notifier: best-effort completion records into the side channel; it implements
 *        the documentation-only concept bridge::Completion_sink.
 *     -# bridge::Raw_buffer, bridge::Read_ticket: the caller-owned `L + 1`-byte buffer and the three-state
 *        handoff token accompanying an asynchronous fill.
 *     -# bridge::Async_read_launcher: allocate, hand off, fill on a worker pool, notify.
 *     -# bridge::File_transfer_engine: file-to-descriptor transfer via a bridge::Bulk_transfer strategy
 *        (bridge::Sendfile_bulk_transfer, bridge::Buffered_bulk_transfer).
 *     -# bridge::Bridge: composition root that wires the above and flattens errors into the FFI sentinels;
 *        `ripple/bridge/ripple_bridge.h` declares the `extern "C"` entry points over a process-wide instance.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Ripple-Bridge requires Flow and Boost, not only internally but in its APIs: `flow::log` is the logging system;
 * `flow::Error_code` and related conventions are used for error reporting; `flow::async` supplies the worker
 * threads; boost.filesystem supplies paths.
 *
 * ### Error reporting ###
 * Inherited from Flow: a fallible API takes a trailing `Error_code* err_code = 0`.  If null, failure throws
 * `flow::error::Runtime_error`; otherwise `*err_code` is set to the error or cleared on success.  None of this
 * crosses the FFI boundary, where everything is flattened to null / -1.
 *
 * ### Logging ###
 * We use `flow::log`.  The user supplies a `flow::log::Logger*` to each long-lived object (null means log nowhere).
 * The FFI assembly supplies its own, writing to standard error.
 */
namespace ripple
{

// Types.  They're outside of `namespace ::ripple::util` for brevity due to their frequent use.

/**
 * @namespace ripple::fs
 * @brief Short-hand for `filesystem` namespace.  We use `boost::filesystem` like the rest of our stack.
 */
namespace fs = boost::filesystem;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef RIPPLE_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing the log components used by Ripple-Bridge internal
 * logging.  The individual members are generated by macro magic; find them in
 * `log_component_enum_declare.macros.hpp`.  The user specifies it when configuring their program's logging
 * via `flow::log::Config::init_component_to_union_idx_mapping()` and `flow::log::Config::init_component_names()`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.  See above.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in ripple::Log_component to its
 * string representation as used in log output and verbosity config; e.g., `S_BRIDGE` => `"BRIDGE"`.
 *
 * @see ripple::Log_component first.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_RIPPLE_LOG_COMPONENT_NAME_MAP;

#endif // RIPPLE_DOXYGEN_ONLY

} // namespace ripple
