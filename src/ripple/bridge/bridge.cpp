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
#include "ripple/bridge/bridge.hpp"
#include "ripple/bridge/file_reader.hpp"
#include <cstring>

namespace ripple::bridge
{

// Implementations.

Bridge::Bridge(flow::log::Logger* logger_ptr, const Bridge_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_BRIDGE),
  m_config(config),
  m_runtime_dir(logger_ptr),
  m_notifier(logger_ptr, m_runtime_dir),
  m_launcher(logger_ptr, "ripple_rd", &m_notifier, m_config.m_n_read_workers),
  m_transfer_engine(logger_ptr)
{
  FLOW_LOG_INFO("Bridge [" << this << "]: Started with config [" << m_config << "].");
}

Bridge::~Bridge()
{
  FLOW_LOG_INFO("Bridge [" << this << "]: Shutting down.");
}

int Bridge::link(const char* dir_or_null)
{
  m_runtime_dir.initialize(dir_or_null);
  return 0;
}

char* Bridge::file_get_contents(const char* raw_path)
{
  Error_code err_code;
  const auto path = decode_path(raw_path, &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Bridge [" << this << "]: file_get_contents(): Bad path argument.  Returning null.");
    return nullptr;
  }
  // else

  Raw_buffer buf;
  read_file(get_logger(), path, &buf, &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Bridge [" << this << "]: file_get_contents([" << path << "]) failed: [" << err_code << "] "
                     "[" << err_code.message() << "].  Returning null.");
    return nullptr;
  }
  // else
  return buf.release();
}

char* Bridge::file_get_contents_async(const char* raw_path, request_id_t request_id)
{
  Error_code err_code;
  const auto path = decode_path(raw_path, &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Bridge [" << this << "]: file_get_contents_async(request [" << request_id << "]): Bad path "
                     "argument.  Returning null; no completion will follow.");
    return nullptr;
  }
  // else

  Raw_buffer buf;
  // The ticket is of no use to an FFI caller; the launcher keeps its own reference until release.
  m_launcher.async_read(path, request_id, &buf, &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Bridge [" << this << "]: file_get_contents_async([" << path << "], request "
                     "[" << request_id << "]) failed: [" << err_code << "] [" << err_code.message() << "].  "
                     "Returning null; no completion will follow.");
    return nullptr;
  }
  // else
  return buf.release();
}

int Bridge::process_file(int fd, const char* raw_path)
{
  Error_code err_code;
  const auto path = decode_path(raw_path, &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Bridge [" << this << "]: process_file(fd [" << fd << "]): Bad path argument.  Returning -1.");
    return -1;
  }
  // else

  if (fd < 0)
  {
    FLOW_LOG_WARNING("Bridge [" << this << "]: process_file(fd [" << fd << "], [" << path << "]): Bad descriptor.  "
                     "Returning -1.");
    return -1;
  }
  // else

  m_transfer_engine.transfer_file(Native_handle(fd), path, &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Bridge [" << this << "]: process_file(fd [" << fd << "], [" << path << "]) failed: "
                     "[" << err_code << "] [" << err_code.message() << "].  Returning -1.");
    return -1;
  }
  // else
  return 0;
}

fs::path Bridge::decode_path(const char* raw_path, Error_code* err_code) const
{
  using util::String_view;
  using util::is_valid_utf8;

  assert(err_code);

  if ((!raw_path) || (!is_valid_utf8(String_view(raw_path, std::strlen(raw_path)))))
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return fs::path();
  }
  // else

  err_code->clear();
  return fs::path(raw_path);
}

Runtime_dir& Bridge::runtime_dir()
{
  return m_runtime_dir;
}

Fifo_async_read_launcher& Bridge::launcher()
{
  return m_launcher;
}

const Bridge_config& Bridge::config() const
{
  return m_config;
}

} // namespace ripple::bridge
