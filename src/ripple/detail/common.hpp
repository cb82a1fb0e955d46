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

#include <flow/log/log.hpp>
#include <boost/unordered_map.hpp>
#include <string>

namespace ripple
{

// Types.

/// @cond
// -^- Doxygen, please ignore the following.  See ripple::Log_component doc header in common.hpp instead.

#define FLOW_LOG_CFG_COMPONENT_DEFINE(ARG_name_root, ARG_enum_val) \
  S_##ARG_name_root = ARG_enum_val,

enum class Log_component
{
#include "ripple/detail/macros/log_component_enum_declare.macros.hpp"
  /// Sentinel: not a real component; used to size per-component tables via `flow::log::Config`.
  S_END_SENTINEL
}; // enum class Log_component

#undef FLOW_LOG_CFG_COMPONENT_DEFINE

// -v- Doxygen, please stop ignoring.
/// @endcond

// Constants.

/// @cond
extern const boost::unordered_multimap<Log_component, std::string> S_RIPPLE_LOG_COMPONENT_NAME_MAP;
/// @endcond

} // namespace ripple
