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
#include "ripple/bridge/runtime_dir.hpp"
#include <flow/error/error.hpp>
#include <cstdlib>
#include <cstring>

namespace ripple::bridge
{

// Static initializers.

const std::string Runtime_dir::S_SIDECHANNEL_FILENAME = "bridge.fifo";
const std::string Runtime_dir::S_ENV_VAR_NAME = "RIPPLE_RUNTIME_DIR";
const fs::path Runtime_dir::S_FALLBACK_DIR = "../file";

// Implementations.

Runtime_dir::Runtime_dir(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_BRIDGE)
{
  // Nothing else.
}

bool Runtime_dir::initialize(const char* explicit_dir_or_null)
{
  using util::String_view;
  using util::is_valid_utf8;
  using flow::util::Lock_guard;

  // Resolved outside the lock.  A losing racer's result is dropped; the first to take the lock wins.
  fs::path dir;
  if (explicit_dir_or_null
      && is_valid_utf8(String_view(explicit_dir_or_null, std::strlen(explicit_dir_or_null))))
  {
    dir = explicit_dir_or_null;
  }
  else
  {
    if (explicit_dir_or_null)
    {
      FLOW_LOG_WARNING("Runtime_dir [" << *this << "]: Given directory path is not valid UTF-8 text; "
                       "falling back to working directory.");
    }
    dir = cwd_or_fallback();
  }

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  if (m_dir)
  {
    FLOW_LOG_INFO("Runtime_dir [" << *this << "]: Asked to initialize with [" << dir << "], but "
                  "runtime directory already set to [" << *m_dir << "].  Ignoring.");
    return false;
  }
  // else

  m_dir = std::move(dir);
  FLOW_LOG_INFO("Runtime_dir [" << *this << "]: Runtime directory set to [" << *m_dir << "]; side channel "
                "at [" << (*m_dir / S_SIDECHANNEL_FILENAME) << "].");
  return true;
} // Runtime_dir::initialize()

fs::path Runtime_dir::sidechannel_path() const
{
  using flow::util::Lock_guard;
  using std::getenv;

  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    if (m_dir)
    {
      return *m_dir / S_SIDECHANNEL_FILENAME;
    }
  }
  // else

  const auto env_dir = getenv(S_ENV_VAR_NAME.c_str());
  if (env_dir)
  {
    return fs::path(env_dir) / S_SIDECHANNEL_FILENAME;
  }
  // else
  return cwd_or_fallback() / S_SIDECHANNEL_FILENAME;
} // Runtime_dir::sidechannel_path()

bool Runtime_dir::initialized() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return bool(m_dir);
}

std::optional<fs::path> Runtime_dir::stored_dir() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_dir;
}

fs::path Runtime_dir::cwd_or_fallback() const
{
  Error_code sys_err_code;
  auto cwd = fs::current_path(sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Runtime_dir [" << *this << "]: Could not determine working directory; using "
                     "fallback [" << S_FALLBACK_DIR << "].  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return S_FALLBACK_DIR;
  }
  // else
  return cwd;
}

std::ostream& operator<<(std::ostream& os, const Runtime_dir& val)
{
  return os << '@' << &val;
}

} // namespace ripple::bridge
