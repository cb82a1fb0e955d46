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

#include <ostream>
#include <flow/common.hpp>

namespace ripple::util
{

#ifndef FLOW_OS_LINUX
#  ifndef FLOW_OS_MAC
static_assert(false, "Ripple-Bridge works with POSIX file descriptors; build in Linux or macOS.");
#  endif
#endif
// From this point on (in #including .cpp files as well) POSIX is assumed.

// Types.

/**
 * A monolayer-thin wrapper around a native handle, a/k/a descriptor a/k/a FD.  It does not own the descriptor:
 * copying it copies the integer; destroying it does nothing.  Hence it is the right type for a *borrowed*
 * descriptor, such as the destination handed to bridge::File_transfer_engine::transfer_file().
 *
 * It is either null() or stores a native handle.  In the former case `m_native_handle == S_NULL_HANDLE`.
 *
 * @see Scoped_native_handle for the owning counterpart.
 */
struct Native_handle
{
  // Types.

  /// The native handle type.  Much logic relies on this type being light-weight (fast to copy).
  using handle_t = int;

  // Constants.

  /// The value for #m_native_handle such that `null() == true`.  No valid handle ever equals this.
  static const handle_t S_NULL_HANDLE;

  // Data.

  /// The native handle (possibly equal to #S_NULL_HANDLE), the exact payload of this Native_handle.
  handle_t m_native_handle;

  // Constructors/destructor.

  /**
   * Constructs with given payload; also subsumes no-args construction to mean constructing an object with
   * `null() == true`.
   *
   * @param native_handle
   *        Payload.
   */
  Native_handle(handle_t native_handle = S_NULL_HANDLE);

  /**
   * Constructs object equal to `src`, while making `src == null()`.  This is not about performance but about
   * not propagating more copies of the underlying handle than needed.
   *
   * @param src
   *        Source object which will be made `null() == true`.
   */
  Native_handle(Native_handle&& src);

  /**
   * Copy constructor.
   * @param src
   *        Source object.
   */
  Native_handle(const Native_handle& src);

  // Methods.

  /**
   * Move assignment; acts similarly to move ctor; but no-op if `*this == src`.
   * @param src
   *        Source object which will be made `null() == true`, unless `*this == src`.
   * @return `*this`.
   */
  Native_handle& operator=(Native_handle&& src);

  /**
   * Copy assignment; acts similarly to copy ctor.
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Native_handle& operator=(const Native_handle& src);

  /**
   * Returns `true` if and only if #m_native_handle equals #S_NULL_HANDLE.
   * @return See above.
   */
  bool null() const;
}; // struct Native_handle

/**
 * Owning counterpart of Native_handle: a move-only holder of an open descriptor that `::close()`s it on destruction
 * (or on reset()).  Used for descriptors we open ourselves (source files, the side channel) so that every exit
 * path, including an early error return on some worker thread, releases them.
 *
 * Errors from `::close()` are ignored: by then there is nothing useful to do with them, and in Linux the
 * descriptor is released regardless.
 */
class Scoped_native_handle
{
public:
  // Constructors/destructor.

  /// Constructs a holder that holds nothing (`null() == true`).
  Scoped_native_handle();

  /**
   * Takes ownership of the given handle.  It may be null(), in which case `*this` holds nothing.
   * @param hndl
   *        Handle to own.
   */
  explicit Scoped_native_handle(Native_handle hndl);

  /**
   * Move-constructs from `src`, making `src.null() == true`.
   * @param src
   *        Source object.
   */
  Scoped_native_handle(Scoped_native_handle&& src);

  /// Closes the owned handle, if any.
  ~Scoped_native_handle();

  // Methods.

  /**
   * Closes the currently owned handle, if any; then takes ownership of `src`'s; `src` becomes null().
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Scoped_native_handle& operator=(Scoped_native_handle&& src);

  /// Disallowed.
  Scoped_native_handle(const Scoped_native_handle&) = delete;
  /// Disallowed.
  Scoped_native_handle& operator=(const Scoped_native_handle&) = delete;

  /**
   * The held handle, not owned by the returned copy.  `get().null()` if nothing is held.
   * @return See above.
   */
  Native_handle get() const;

  /**
   * Same as `get().null()`.
   * @return See above.
   */
  bool null() const;

  /**
   * Closes the held handle, if any; `*this` becomes null().
   */
  void reset();

  /**
   * Gives up ownership without closing: the returned handle is now the caller's responsibility.
   * @return The formerly held handle (possibly null()).
   */
  Native_handle release();

private:
  // Data.

  /// The owned handle, or null().
  Native_handle m_hndl;
}; // class Scoped_native_handle

// Free functions.

/**
 * Returns `true` if and only if the two Native_handle objects are the same underlying handle.
 *
 * @relatesalso Native_handle
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(Native_handle val1, Native_handle val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Native_handle
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator!=(Native_handle val1, Native_handle val2);

/**
 * Prints string representation of the given Native_handle to the given `ostream`.
 *
 * @relatesalso Native_handle
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Native_handle& val);

/**
 * Prints string representation of the given Scoped_native_handle to the given `ostream`.
 *
 * @relatesalso Scoped_native_handle
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Scoped_native_handle& val);

} // namespace ripple::util
