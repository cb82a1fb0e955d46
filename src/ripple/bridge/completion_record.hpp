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

#include "ripple/bridge/bridge_fwd.hpp"
#include <array>

namespace ripple::bridge
{

// Types.

/**
 * The exact bytes of one completion record on the side channel: the wire request ID, big-endian, and nothing
 * else.  Records are concatenated on the pipe with no framing; a reader takes them 4 bytes at a time.
 */
using Completion_record = std::array<uint8_t, sizeof(wire_request_id_t)>;

// Free functions.

/**
 * Encodes a completion record for the given ID.
 *
 * @param request_id
 *        The ID.
 * @return See above.
 */
Completion_record encode_completion_record(wire_request_id_t request_id);

/**
 * Decodes a completion record, as read off the side channel, into the ID it carries.
 *
 * @param record
 *        The record.
 * @return See above.
 */
wire_request_id_t decode_completion_record(const Completion_record& record);

} // namespace ripple::bridge
