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
#include "ripple/bridge/bridge_config.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <sstream>

namespace ripple::bridge
{

// Static initializers.

const std::string Bridge_config::S_LOG_SEV_ENV_VAR_NAME = "RIPPLE_LOG_SEV";
const std::string Bridge_config::S_READ_WORKERS_ENV_VAR_NAME = "RIPPLE_READ_WORKERS";
const flow::log::Sev Bridge_config::S_DEFAULT_LOG_SEV = flow::log::Sev::S_WARNING;
const size_t Bridge_config::S_DEFAULT_N_READ_WORKERS = 4;
const size_t Bridge_config::S_MAX_N_READ_WORKERS = 256;

// Implementations.

Bridge_config Bridge_config::from_environment(flow::log::Logger* logger_ptr)
{
  using flow::log::Sev;
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using boost::algorithm::iequals;
  using std::getenv;
  using std::istringstream;

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_BRIDGE);

  Bridge_config config;

  const auto sev_str = getenv(S_LOG_SEV_ENV_VAR_NAME.c_str());
  if (sev_str)
  {
    istringstream is(sev_str);
    Sev sev = Sev::S_END_SENTINEL;
    is >> sev;
    // An unknown name parses as S_NONE; tell that apart from an explicit NONE (or 0).
    const bool explicit_none = iequals(sev_str, "NONE") || iequals(sev_str, "0");
    if ((sev == Sev::S_END_SENTINEL) || ((sev == Sev::S_NONE) && (!explicit_none)))
    {
      FLOW_LOG_WARNING("Environment variable [" << S_LOG_SEV_ENV_VAR_NAME << "] = [" << sev_str << "] does not "
                       "name a log severity; keeping default [" << config.m_log_sev << "].");
    }
    else
    {
      config.m_log_sev = sev;
    }
  }

  const auto n_workers_str = getenv(S_READ_WORKERS_ENV_VAR_NAME.c_str());
  if (n_workers_str)
  {
    // Signed: lexical_cast<size_t>("-1") would happily wrap around.
    int64_t n_workers = 0;
    try
    {
      n_workers = lexical_cast<int64_t>(n_workers_str);
    }
    catch (const bad_lexical_cast&)
    {
      n_workers = 0; // Rejected just below.
    }

    if ((n_workers < 1) || (uint64_t(n_workers) > S_MAX_N_READ_WORKERS))
    {
      FLOW_LOG_WARNING("Environment variable [" << S_READ_WORKERS_ENV_VAR_NAME << "] = [" << n_workers_str << "] "
                       "is not an integer in [1, " << S_MAX_N_READ_WORKERS << "]; keeping default "
                       "[" << config.m_n_read_workers << "].");
    }
    else
    {
      config.m_n_read_workers = size_t(n_workers);
    }
  }

  FLOW_LOG_INFO("Bridge config from environment: [" << config << "].");
  return config;
} // Bridge_config::from_environment()

std::ostream& operator<<(std::ostream& os, const Bridge_config& val)
{
  return os << "log_sev=" << val.m_log_sev << " n_read_workers=" << val.m_n_read_workers;
}

} // namespace ripple::bridge
