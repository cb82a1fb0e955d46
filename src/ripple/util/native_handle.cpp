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
#include "ripple/util/native_handle.hpp"
#include <unistd.h>

namespace ripple::util
{

// Static initializers.

// Reminder: We've assured via static_assert that this is being built in POSIX.
const Native_handle::handle_t Native_handle::S_NULL_HANDLE = -1;

// Native_handle implementations.

Native_handle::Native_handle(handle_t native_handle) :
  m_native_handle(native_handle)
{
  // Nope.
}

Native_handle::Native_handle(Native_handle&& src) :
  m_native_handle(S_NULL_HANDLE)
{
  // It's why we exist: prevent duplication of src.m_native_handle.
  operator=(std::move(src));
}

Native_handle::Native_handle(const Native_handle&) = default;

Native_handle& Native_handle::operator=(Native_handle&& src)
{
  using std::swap;

  if (*this != src)
  {
    m_native_handle = S_NULL_HANDLE;
    swap(m_native_handle, src.m_native_handle); // No-op if `&src == this`.
  }
  return *this;
}

Native_handle& Native_handle::operator=(const Native_handle&) = default;

bool Native_handle::null() const
{
  return m_native_handle == S_NULL_HANDLE;
}

// Scoped_native_handle implementations.

Scoped_native_handle::Scoped_native_handle() = default;

Scoped_native_handle::Scoped_native_handle(Native_handle hndl) :
  m_hndl(hndl)
{
  // Cool.
}

Scoped_native_handle::Scoped_native_handle(Scoped_native_handle&& src) :
  m_hndl(std::move(src.m_hndl)) // Nullifies src.m_hndl.
{
  // Cool.
}

Scoped_native_handle::~Scoped_native_handle()
{
  reset();
}

Scoped_native_handle& Scoped_native_handle::operator=(Scoped_native_handle&& src)
{
  if (&src != this)
  {
    reset();
    m_hndl = std::move(src.m_hndl);
  }
  return *this;
}

Native_handle Scoped_native_handle::get() const
{
  return m_hndl;
}

bool Scoped_native_handle::null() const
{
  return m_hndl.null();
}

void Scoped_native_handle::reset()
{
  if (!m_hndl.null())
  {
    // Disregard any error: in Linux the FD is released even on EINTR, and there is no retrying close().
    ::close(m_hndl.m_native_handle);
    m_hndl = Native_handle();
  }
}

Native_handle Scoped_native_handle::release()
{
  return std::move(m_hndl); // Nullifies m_hndl.
}

// Free function implementations.

std::ostream& operator<<(std::ostream& os, const Native_handle& val)
{
  os << "native_hndl[";
  if (val.null())
  {
    os << "NONE";
  }
  else
  {
    os << val.m_native_handle;
  }
  return os << ']';
}

std::ostream& operator<<(std::ostream& os, const Scoped_native_handle& val)
{
  return os << "owned:" << val.get();
}

bool operator==(Native_handle val1, Native_handle val2)
{
  return val1.m_native_handle == val2.m_native_handle;
}

bool operator!=(Native_handle val1, Native_handle val2)
{
  return !operator==(val1, val2);
}

} // namespace ripple::util
