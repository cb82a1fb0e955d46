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

#include <flow/log/simple_ostream_logger.hpp>
#include <ripple/common.hpp>
#include "ripple/test/test_config.hpp"
#include <string>
#include <vector>

namespace ripple::test
{

/**
 * Logger used for testing purposes: console output filtered per Test_config, plus an in-memory capture of every
 * message at or above a separate severity, so a test can check that something was (or was not) reported.
 */
class Test_logger :
  public flow::log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity Lowest severity that will pass through console logging filter.
   * @param capture_severity Lowest severity that will be captured; see captured().
   */
  Test_logger(const flow::log::Sev& min_severity = Test_config::get_singleton().m_sev,
              const flow::log::Sev& capture_severity = flow::log::Sev::S_WARNING) :
    m_config(min_severity),
    m_logger(&m_config),
    m_capture_sev(capture_severity)
  {
    // Yes, it is formally (and practically) fine to do this after the Logger took the m_config ptr already.
    m_config.init_component_to_union_idx_mapping<Log_component>
      (100, flow::log::Config::standard_component_payload_enum_sparse_length<Log_component>());
    m_config.init_component_names<Log_component>(ripple::S_RIPPLE_LOG_COMPONENT_NAME_MAP, false, "ripple-");
    m_config.init_component_to_union_idx_mapping<flow::Flow_log_component>
      (200, flow::log::Config::standard_component_payload_enum_sparse_length<flow::Flow_log_component>());
    m_config.init_component_names<flow::Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
    // Now the logging may commence.
  }

  /// Passes if either the console filter or the capture threshold wants the message.
  bool should_log(flow::log::Sev sev, const flow::log::Component& component) const override
  {
    return (sev <= m_capture_sev) || m_logger.should_log(sev, component);
  }

  /// Forwards to console Logger.
  bool logs_asynchronously() const override
  {
    return m_logger.logs_asynchronously();
  }

  void do_log(flow::log::Msg_metadata* metadata, flow::util::String_view msg) override
  {
    if (metadata->m_msg_sev <= m_capture_sev)
    {
      flow::util::Lock_guard<decltype(m_captured_mutex)> lock(m_captured_mutex);
      m_captured.emplace_back(msg);
    }
    if (m_logger.should_log(metadata->m_msg_sev, metadata->m_msg_component))
    {
      m_logger.do_log(metadata, msg);
    }
  }

  /**
   * Messages captured so far, oldest first.
   *
   * @return See above.
   */
  std::vector<std::string> captured() const
  {
    flow::util::Lock_guard<decltype(m_captured_mutex)> lock(m_captured_mutex);
    return m_captured;
  }

  /**
   * How many captured messages contain the given text.
   *
   * @param needle Text to look for.
   * @return See above.
   */
  size_t count_captured(const std::string& needle) const
  {
    size_t count = 0;
    for (const auto& msg : captured())
    {
      if (msg.find(needle) != std::string::npos)
      {
        ++count;
      }
    }
    return count;
  }

  /// Forgets the captured messages.
  void clear_captured()
  {
    flow::util::Lock_guard<decltype(m_captured_mutex)> lock(m_captured_mutex);
    m_captured.clear();
  }

private:
  /// Logging configuration.
  flow::log::Config m_config;

  /// The real logger.
  flow::log::Simple_ostream_logger m_logger;

  /// See ctor.
  const flow::log::Sev m_capture_sev;

  /// Protects #m_captured.
  mutable flow::util::Mutex_non_recursive m_captured_mutex;

  /// See captured().
  std::vector<std::string> m_captured;
}; // class Test_logger

} // namespace ripple::test
