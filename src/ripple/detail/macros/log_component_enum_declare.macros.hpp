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

/// @cond
// -^- Doxygen, please ignore the following.  This is wacky macro magic and not a regular `#pragma once` header.

/* This is modeled off the similarly-named file in Flow.  See that for docs.
 * Each line is expanded once into the ripple::Log_component `enum` (detail/common.hpp) and once into
 * ripple::S_RIPPLE_LOG_COMPONENT_NAME_MAP (common.cpp).  Append only; do not renumber. */

// Rarely used component corresponding to log call sites outside namespace `ripple::X`, for all X in ::ripple.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// Logging from namespace ripple::util.
FLOW_LOG_CFG_COMPONENT_DEFINE(UTIL, 1)
// Logging from namespace ripple::bridge (registry, notifier, launcher, transfer engine, FFI assembly).
FLOW_LOG_CFG_COMPONENT_DEFINE(BRIDGE, 2)

// -v- Doxygen, please stop ignoring.
/// @endcond
