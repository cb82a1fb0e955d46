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
#include "ripple/bridge/completion_record.hpp"
#include <flow/log/log.hpp>
#include <boost/endian/conversion.hpp>

namespace ripple::bridge
{

// Implementations.

Completion_record encode_completion_record(wire_request_id_t request_id)
{
  Completion_record record;
  boost::endian::store_big_u32(record.data(), request_id);
  return record;
}

wire_request_id_t decode_completion_record(const Completion_record& record)
{
  return boost::endian::load_big_u32(record.data());
}

wire_request_id_t to_wire_request_id(flow::log::Logger* logger_ptr, request_id_t request_id)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_BRIDGE);

  const auto wire_id = wire_request_id_t(request_id);
  if (request_id_t(wire_id) != request_id)
  {
    FLOW_LOG_WARNING("Request ID [" << request_id << "] does not fit the [" << (sizeof(wire_request_id_t) * 8) << "]-bit "
                     "completion record; the record will carry [" << wire_id << "] instead.  The listener can only "
                     "match it if it compares the low bits.");
  }
  return wire_id;
}

} // namespace ripple::bridge
