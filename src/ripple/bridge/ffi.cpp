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
#include "ripple/bridge/ripple_bridge.h"
#include "ripple/bridge/bridge.hpp"
#include <flow/log/simple_ostream_logger.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

namespace ripple::bridge
{

// Types.

namespace
{

/**
 * What the C entry points operate on: a logger to standard error and a Bridge configured from the environment.
 * Exactly one is created, on first use, and it is never destroyed, so that in-flight async reads keep their
 * workers (and their notifications) through process exit.
 */
class Default_assembly :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Sets up logging at default severity, reads the config (logging problems), applies its severity, builds the Bridge.
  Default_assembly();

  // Methods.

  /**
   * The Bridge.
   * @return See above.
   */
  Bridge& bridge();

  /**
   * The logger.
   * @return See above.
   */
  flow::log::Logger* logger();

  /**
   * The one instance.  Throws on failure to construct it (retried at the next call).
   * @return See above.
   */
  static Default_assembly& get_singleton();

private:
  // Methods.

  /**
   * Helper for ctor: reads the config and applies its log severity.
   * @return The config.
   */
  Bridge_config load_config();

  // Data.

  /// Logging configuration.
  flow::log::Config m_log_config;

  /// Logger to standard error.
  flow::log::Simple_ostream_logger m_logger;

  /// See load_config().
  const Bridge_config m_config;

  /// See bridge().
  Bridge m_bridge;
}; // class Default_assembly

/**
 * Runs the given entry-point body, turning any escaping exception into the given sentinel (logged, if the
 * assembly got far enough to have a logger).
 *
 * @tparam Ret
 *         Return type of the entry point.
 * @tparam Func
 *         Callable: `Ret F(Bridge&)`.
 * @param context
 *         Entry point name, for logging.
 * @param sentinel
 *         What to return on exception.
 * @param func
 *         The body.
 * @return What `func` returned; or `sentinel`.
 */
template<typename Ret, typename Func>
Ret exec_entry_point(const char* context, Ret sentinel, const Func& func);

} // namespace (anon)

// Implementations.

namespace
{

Default_assembly::Default_assembly() :
  m_log_config(Bridge_config::S_DEFAULT_LOG_SEV),
  m_logger(&m_log_config, std::cerr, std::cerr),
  m_config(load_config()),
  m_bridge(&m_logger, m_config)
{
  // That's it.
}

Bridge_config Default_assembly::load_config()
{
  using flow::log::Config;
  using flow::Flow_log_component;

  // Formally fine to do this after the Logger took the m_log_config ptr; nothing has been logged yet.
  m_log_config.init_component_to_union_idx_mapping<Log_component>
    (1000, Config::standard_component_payload_enum_sparse_length<Log_component>());
  m_log_config.init_component_names<Log_component>(S_RIPPLE_LOG_COMPONENT_NAME_MAP, false, "ripple-");
  m_log_config.init_component_to_union_idx_mapping<Flow_log_component>
    (2000, Config::standard_component_payload_enum_sparse_length<Flow_log_component>());
  m_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");

  const auto config = Bridge_config::from_environment(&m_logger);
  m_log_config.configure_default_verbosity(config.m_log_sev, true);
  return config;
}

Bridge& Default_assembly::bridge()
{
  return m_bridge;
}

flow::log::Logger* Default_assembly::logger()
{
  return &m_logger;
}

Default_assembly& Default_assembly::get_singleton() // Static.
{
  // Intentionally leaked: see class doc header.  Static-local init is thread-safe and, on exception, retried.
  static Default_assembly* const S_ASSEMBLY = new Default_assembly;
  return *S_ASSEMBLY;
}

template<typename Ret, typename Func>
Ret exec_entry_point(const char* context, Ret sentinel, const Func& func)
{
  Default_assembly* assembly = nullptr;
  try
  {
    assembly = &(Default_assembly::get_singleton());
    return func(assembly->bridge());
  }
  catch (const std::exception& exc)
  {
    if (assembly)
    {
      FLOW_LOG_SET_CONTEXT(assembly->logger(), Log_component::S_BRIDGE);
      FLOW_LOG_WARNING("[" << context << "]: Caught exception: [" << exc.what() << "].  Returning failure.");
    }
    else
    {
      // No logger to use (it is what failed to come up).
      std::cerr << "ripple: [" << context << "]: Could not set up: [" << exc.what() << "].\n";
    }
    return sentinel;
  }
} // exec_entry_point()

} // namespace (anon)

} // namespace ripple::bridge

// C entry points.

int ripple_link(const char* dir)
{
  using ripple::bridge::Bridge;
  return ripple::bridge::exec_entry_point("ripple_link", 0,
                                          [&](Bridge& bridge) -> int { return bridge.link(dir); });
}

char* ripple_file_get_contents(const char* path)
{
  using ripple::bridge::Bridge;
  return ripple::bridge::exec_entry_point<char*>("ripple_file_get_contents", nullptr,
                                                 [&](Bridge& bridge) -> char* { return bridge.file_get_contents(path); });
}

char* ripple_file_get_contents_async(const char* path, uint64_t request_id)
{
  using ripple::bridge::Bridge;
  return ripple::bridge::exec_entry_point<char*>("ripple_file_get_contents_async", nullptr,
                                                 [&](Bridge& bridge) -> char*
                                                   { return bridge.file_get_contents_async(path, request_id); });
}

int ripple_process_file(int fd, const char* path)
{
  using ripple::bridge::Bridge;
  return ripple::bridge::exec_entry_point("ripple_process_file", -1,
                                          [&](Bridge& bridge) -> int { return bridge.process_file(fd, path); });
}

void ripple_buffer_free(char* buf)
{
  std::free(buf); // OK if null.
}
