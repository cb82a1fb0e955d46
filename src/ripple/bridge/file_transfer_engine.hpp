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

#include "ripple/bridge/bridge_fwd.hpp"
#include "ripple/bridge/error.hpp"
#include "ripple/util/detail/util_fwd.hpp"
#include <flow/error/error.hpp>
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>

namespace ripple::bridge
{

// Types.

/**
 * Streams a whole file into a caller-supplied descriptor (typically a connected socket): transfer_file() opens the
 * file, measures it, and hands both descriptors to the `Bulk_transfer` strategy, which does the actual moving
 * and the retrying of transient errors.  Synchronous: the calling thread blocks until done.
 *
 * The destination descriptor is borrowed in every case: it is never closed here, whether the transfer succeeds,
 * fails, or never starts.
 *
 * Thread safety: transfer_file() is safe to call concurrently on the same `*this`, as long as the
 * `Bulk_transfer` allows the same for its `transfer()` (the provided ones do).
 *
 * @tparam Bulk_transfer
 *         Type that models the Bulk_transfer concept.  Default_bulk_transfer is the usual choice.
 */
template<typename Bulk_transfer>
class File_transfer_engine :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Strategy = Bulk_transfer;

  // Constructors/destructor.

  /**
   * Constructs the engine along with its strategy object.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  Passed to the strategy as well.
   */
  explicit File_transfer_engine(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Transfers the whole file at `path` into `dest`.  A file that is empty at open time succeeds at once with nothing
   * written.  If the strategy hits end-of-stream early (the file shrank), that is still success, and the return
   * value is less than the file's size at open time.
   *
   * @param dest
   *        Writable descriptor.  Borrowed, never closed.
   * @param path
   *        File to send.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (`dest` is null); system errors from `open()`/`fstat()`;
   *        error::Code::S_NOT_A_REGULAR_FILE (a directory); system errors reported by the strategy.
   * @return Number of bytes transferred, even on error.
   */
  uint64_t transfer_file(Native_handle dest, const fs::path& path, Error_code* err_code = 0);

  /**
   * The strategy object.
   * @return See above.
   */
  Strategy& strategy();

private:
  // Data.

  /// See strategy().
  Strategy m_strategy;
}; // class File_transfer_engine

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Bulk_transfer>
File_transfer_engine<Bulk_transfer>::File_transfer_engine(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_BRIDGE),
  m_strategy(logger_ptr)
{
  // Nothing else.
}

template<typename Bulk_transfer>
uint64_t File_transfer_engine<Bulk_transfer>::transfer_file(Native_handle dest, const fs::path& path,
                                                            Error_code* err_code)
{
  using util::open_for_reading;
  using boost::system::errc::is_a_directory;

  uint64_t n_sent = 0;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> uint64_t { return transfer_file(dest, path, actual_err_code); },
         &n_sent, err_code, "File_transfer_engine::transfer_file()"))
  {
    return n_sent;
  }
  // else if (err_code): Do not throw; emit *err_code.

  if (dest.null())
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return 0;
  }
  // else

  uint64_t size;
  const auto file = open_for_reading(get_logger(), path, &size, err_code);
  if (*err_code)
  {
    if (*err_code == is_a_directory)
    {
      *err_code = error::Code::S_NOT_A_REGULAR_FILE;
    }
    FLOW_LOG_TRACE("File_transfer_engine [" << *this << "]: Could not open [" << path << "] to send to "
                   "[" << dest << "]: [" << *err_code << "] [" << err_code->message() << "].");
    return 0;
  }
  // else

  if (size == 0)
  {
    FLOW_LOG_TRACE("File_transfer_engine [" << *this << "]: [" << path << "] is empty; nothing to send to "
                   "[" << dest << "].");
    err_code->clear();
    return 0;
  }
  // else

  n_sent = m_strategy.transfer(dest, file.get(), size, err_code);
  if (*err_code)
  {
    return n_sent;
  }
  // else

  FLOW_LOG_TRACE("File_transfer_engine [" << *this << "]: Sent [" << n_sent << "] of [" << size << "] bytes of "
                 "[" << path << "] to [" << dest << "].");
  return n_sent;
  // `file` closes here; `dest` is untouched.
} // File_transfer_engine::transfer_file()

template<typename Bulk_transfer>
typename File_transfer_engine<Bulk_transfer>::Strategy& File_transfer_engine<Bulk_transfer>::strategy()
{
  return m_strategy;
}

template<typename Bulk_transfer>
std::ostream& operator<<(std::ostream& os, const File_transfer_engine<Bulk_transfer>& val)
{
  return os << '@' << &val;
}

} // namespace ripple::bridge
