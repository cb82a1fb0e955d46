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
#include "ripple/bridge/read_buffer.hpp"
#include <flow/error/error.hpp>
#include <cstdlib>

namespace ripple::bridge
{

// Raw_buffer implementations.

Raw_buffer::Raw_buffer() :
  m_data(0),
  m_size(0)
{
  // That's it.
}

Raw_buffer::Raw_buffer(size_t size, Error_code* err_code) :
  Raw_buffer()
{
  using std::malloc;

  // size + 1 wraps to 0 for SIZE_MAX, and malloc(0) may "succeed."
  const auto capacity = size + 1;
  void* data = (capacity == 0) ? nullptr : malloc(capacity);

  if (!data)
  {
    const Error_code alloc_err_code(error::Code::S_BUFFER_ALLOCATION_FAILED);
    if (err_code)
    {
      *err_code = alloc_err_code;
      return;
    }
    // else
    throw flow::error::Runtime_error(alloc_err_code, "Raw_buffer::Raw_buffer()");
  }
  // else

  m_data = static_cast<char*>(data);
  m_size = size;
  m_data[m_size] = '\0';

  if (err_code)
  {
    err_code->clear();
  }
} // Raw_buffer::Raw_buffer()

Raw_buffer::Raw_buffer(Raw_buffer&& src) :
  Raw_buffer()
{
  operator=(std::move(src));
}

Raw_buffer::~Raw_buffer()
{
  std::free(m_data); // OK if null.
}

Raw_buffer& Raw_buffer::operator=(Raw_buffer&& src)
{
  if (&src != this)
  {
    std::free(m_data);
    m_data = src.m_data;
    m_size = src.m_size;
    src.m_data = 0;
    src.m_size = 0;
  }
  return *this;
}

char* Raw_buffer::data() const
{
  return m_data;
}

size_t Raw_buffer::size() const
{
  return m_size;
}

size_t Raw_buffer::capacity() const
{
  return null() ? 0 : (m_size + 1);
}

bool Raw_buffer::null() const
{
  return !m_data;
}

util::Blob_mutable Raw_buffer::mutable_buffer() const
{
  return util::Blob_mutable(m_data, m_size);
}

void Raw_buffer::resize(size_t new_size, Error_code* err_code)
{
  using std::realloc;

  assert(err_code);

  const auto new_capacity = new_size + 1;
  void* data = (new_capacity == 0) ? nullptr : realloc(m_data, new_capacity); // realloc(null) == malloc().
  if (!data)
  {
    *err_code = error::Code::S_BUFFER_ALLOCATION_FAILED;
    return;
  }
  // else

  m_data = static_cast<char*>(data);
  m_size = new_size;
  m_data[m_size] = '\0';
  err_code->clear();
}

void Raw_buffer::terminate_at(size_t n)
{
  assert((!null()) && (n <= m_size));
  m_data[n] = '\0';
}

char* Raw_buffer::release()
{
  const auto data = m_data;
  m_data = 0;
  m_size = 0;
  return data;
}

std::ostream& operator<<(std::ostream& os, const Raw_buffer& val)
{
  if (val.null())
  {
    return os << "raw_buf[null]";
  }
  // else
  return os << "raw_buf[" << static_cast<const void*>(val.data()) << '+' << val.size() << "+1]";
}

// Read_ticket implementations.

Read_ticket::Read_ticket(request_id_t request_id, size_t size) :
  m_request_id(request_id),
  m_size(size),
  m_state(State::S_PRODUCING),
  m_n_filled(0)
{
  // Nothing else.
}

request_id_t Read_ticket::request_id() const
{
  return m_request_id;
}

size_t Read_ticket::size() const
{
  return m_size;
}

Read_ticket::State Read_ticket::state() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_state;
}

Error_code Read_ticket::fill_result() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_fill_result;
}

size_t Read_ticket::n_filled() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_n_filled;
}

void Read_ticket::mark_ready(const Error_code& fill_result, size_t n_filled)
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  assert(m_state == State::S_PRODUCING);
  m_fill_result = fill_result;
  m_n_filled = n_filled;
  m_state = State::S_READY;
}

void Read_ticket::mark_released()
{
  {
    flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
    assert(m_state == State::S_READY);
    m_state = State::S_RELEASED;
  }
  m_released_cond.notify_all();
}

void Read_ticket::wait_released() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_released_cond.wait(lock, [&]() -> bool { return m_state == State::S_RELEASED; });
}

bool Read_ticket::timed_wait_released(util::Fine_duration timeout) const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_released_cond.wait_for(lock, timeout, [&]() -> bool { return m_state == State::S_RELEASED; });
}

std::ostream& operator<<(std::ostream& os, Read_ticket::State val)
{
  switch (val)
  {
  case Read_ticket::State::S_PRODUCING:
    return os << "PRODUCING";
  case Read_ticket::State::S_READY:
    return os << "READY";
  case Read_ticket::State::S_RELEASED:
    return os << "RELEASED";
  }
  assert(false);
  return os;
}

std::ostream& operator<<(std::ostream& os, const Read_ticket& val)
{
  return os << "read_ticket[id=" << val.request_id() << " sz=" << val.size() << ' ' << val.state() << ']';
}

} // namespace ripple::bridge
