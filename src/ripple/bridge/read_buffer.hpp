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
#include <boost/thread/condition_variable.hpp>
#include <boost/noncopyable.hpp>
#include <memory>

namespace ripple::bridge
{

// Types.

/**
 * An owned, `malloc()`-allocated buffer sized to hold one file's content plus a terminating zero byte:
 * capacity() is always size() + 1, and the last byte is 0 from allocation onward.  It is what the read
 * operations hand to the caller; once release()d, the memory belongs to the caller, who frees it with
 * `free()` (or `ripple_buffer_free()` across the FFI).
 *
 * Move-only.  Exactly one Raw_buffer (or, after release(), the caller) owns a given allocation.  Code that needs
 * to write into the memory without owning it (the async fill) takes mutable_buffer() instead.
 */
class Raw_buffer
{
public:
  // Constructors/destructor.

  /// Constructs a buffer that owns nothing: `null() == true`, `size() == 0`, `capacity() == 0`.
  Raw_buffer();

  /**
   * Allocates `size + 1` bytes and zeroes the last of them.  The first `size` bytes are uninitialized.
   *
   * @param size
   *        The future size().  0 is fine: then the buffer is the single terminator byte.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_BUFFER_ALLOCATION_FAILED (`*this` is then null()).
   */
  explicit Raw_buffer(size_t size, Error_code* err_code = 0);

  /**
   * Move constructor.  `src` becomes null().
   * @param src
   *        Source object.
   */
  Raw_buffer(Raw_buffer&& src);

  /// Frees the memory, if still owned.
  ~Raw_buffer();

  // Methods.

  /**
   * Move assignment.  Frees the memory currently owned, if any; `src` becomes null().
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Raw_buffer& operator=(Raw_buffer&& src);

  /// Disallowed.
  Raw_buffer(const Raw_buffer&) = delete;
  /// Disallowed.
  Raw_buffer& operator=(const Raw_buffer&) = delete;

  /**
   * Pointer to the first byte; null if null().
   * @return See above.
   */
  char* data() const;

  /**
   * Number of content bytes, not counting the terminator.
   * @return See above.
   */
  size_t size() const;

  /**
   * Number of allocated bytes: `size() + 1`, or 0 if null().
   * @return See above.
   */
  size_t capacity() const;

  /**
   * `true` if and only if no memory is owned.
   * @return See above.
   */
  bool null() const;

  /**
   * The content bytes `[0, size())` as a non-owning mutable view.  It stays valid after release() as long as the
   * new owner has not freed the memory.
   *
   * @return See above.
   */
  util::Blob_mutable mutable_buffer() const;

  /**
   * Changes size() to `new_size`, reallocating as needed (the memory may move, so earlier data() and
   * mutable_buffer() results become invalid).  The first `min(size(), new_size)` bytes are preserved; the
   * terminator is written at `data()[new_size]`.  On a null() buffer this allocates, as the size ctor would.
   *
   * @param new_size
   *        The new size().
   * @param err_code
   *        Must not be null.  Set to success or error::Code::S_BUFFER_ALLOCATION_FAILED (`*this` is then unchanged).
   */
  void resize(size_t new_size, Error_code* err_code);

  /**
   * Writes the zero terminator at `data()[n]`, where `n <= size()`.  Used after a read came up short, so
   * that the content reads as NUL-terminated text of length `n`.
   *
   * @param n
   *        Position; must not exceed size().
   */
  void terminate_at(size_t n);

  /**
   * Gives up ownership: the returned pointer (null if null()) must be freed by the caller with `free()`.
   * `*this` becomes null().
   *
   * @return See above.
   */
  char* release();

private:
  // Data.

  /// Owned memory; or null.
  char* m_data;

  /// See size().  Meaningless if #m_data is null.
  size_t m_size;
}; // class Raw_buffer

/**
 * Tracks one accepted asynchronous read from acceptance to the completion signal, and lets native code wait for
 * the latter.  The buffer memory itself is owned by the caller from acceptance onward; the ticket only describes
 * what may be done with it:
 *
 *   - State::S_PRODUCING: a worker is filling the buffer.  Its content `[0, size)` must not be read.
 *   - State::S_READY: the fill attempt is over (fill_result() tells how it went).  The content is stable.
 *   - State::S_RELEASED: the completion signal has been attempted.  No native code references the memory any
 *     longer; the caller may free it.
 *
 * Transitions go strictly in that order, each exactly once, driven by Async_read_launcher.
 *
 * ### Thread safety ###
 * All public methods are safe to call concurrently with each other and with the launcher's transitions.
 */
class Read_ticket :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to `*this`; shared by the launcher's worker and the requester.
  using Ptr = std::shared_ptr<Read_ticket>;

  /// The three states; see class doc header.
  enum class State
  {
    /// Worker is filling the buffer.
    S_PRODUCING,
    /// Fill attempt finished; content stable.
    S_READY,
    /// Completion signal attempted; no native reference to the memory remains.
    S_RELEASED
  }; // enum class State

  // Constructors/destructor.

  /**
   * Constructs a ticket in State::S_PRODUCING.
   *
   * @param request_id
   *        The caller's ID for the request.
   * @param size
   *        Number of content bytes the buffer is sized for.
   */
  explicit Read_ticket(request_id_t request_id, size_t size);

  // Methods.

  /**
   * The caller's ID for the request.
   * @return See above.
   */
  request_id_t request_id() const;

  /**
   * Number of content bytes the buffer is sized for (the file's size at open time).
   * @return See above.
   */
  size_t size() const;

  /**
   * Current state.
   * @return See above.
   */
  State state() const;

  /**
   * Outcome of the fill: success, error::Code::S_FILE_SHORT_READ, or the system error that stopped it.
   * Meaningful only once state() is no longer State::S_PRODUCING; until then it is success.
   *
   * @return See above.
   */
  Error_code fill_result() const;

  /**
   * Number of bytes the fill placed into the buffer.  Meaningful as for fill_result().
   * @return See above.
   */
  size_t n_filled() const;

  /// Blocks until state() is State::S_RELEASED.
  void wait_released() const;

  /**
   * Like wait_released() but gives up after the given time.
   *
   * @param timeout
   *        How long to wait at most.
   * @return `true` if State::S_RELEASED was reached; `false` if timed out.
   */
  bool timed_wait_released(util::Fine_duration timeout) const;

  /**
   * S_PRODUCING => S_READY, recording the fill outcome.
   *
   * @param fill_result
   *        See fill_result().
   * @param n_filled
   *        See n_filled().
   */
  void mark_ready(const Error_code& fill_result, size_t n_filled);

  /// S_READY => S_RELEASED; wakes up waiters.
  void mark_released();

private:
  // Data.

  /// See request_id().
  const request_id_t m_request_id;

  /// See size().
  const size_t m_size;

  /// Protects the following mutable members.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// Signaled on entry to State::S_RELEASED.
  mutable boost::condition_variable m_released_cond;

  /// See state().
  State m_state;

  /// See fill_result().
  Error_code m_fill_result;

  /// See n_filled().
  size_t m_n_filled;
}; // class Read_ticket

// Free functions: in *_fwd.hpp.

/**
 * Prints string representation of the given Read_ticket::State to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Read_ticket::State val);

} // namespace ripple::bridge
