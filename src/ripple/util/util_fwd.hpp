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

#include "ripple/util/native_handle.hpp"
#include "ripple/common.hpp"
#include <flow/log/log.hpp>
#include <boost/asio/buffer.hpp>

/**
 * Ripple-Bridge module containing miscellaneous general-use facilities used by ripple::bridge and/or not fitting
 * into it.  Notably: util::Native_handle (a borrowed FD) and util::Scoped_native_handle (an owned one); and the
 * short-hands below.  Internal-use POSIX I/O helpers live in util/detail/.
 */
namespace ripple::util
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Native_handle;
class Scoped_native_handle;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 * To work with these (create them, access them, etc.), use the boost.asio buffer APIs.
 */
using Blob_const = boost::asio::const_buffer;

/**
 * Short-hand for an mutable blob somewhere in memory, stored as exactly a `void*` and a `size_t`.
 * @see ripple::util::Blob_const; usability notes in that doc header apply similarly here.
 */
using Blob_mutable = boost::asio::mutable_buffer;

// Free functions.

/**
 * Returns `true` if and only if the given byte sequence is well-formed UTF-8: no truncated or over-long sequences,
 * no surrogate code points, nothing above U+10FFFF.  This is what it means, at the FFI boundary, for a raw C
 * string to "decode as valid text."  The empty sequence is valid.
 *
 * @param bytes
 *        The bytes to check; need not be NUL-terminated; embedded NULs are treated as U+0000 (valid).
 * @return See above.
 */
bool is_valid_utf8(String_view bytes);

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

/**
 * Syntactic-sugary helper that returns pointer to first byte in a mutable buffer, as `uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
uint8_t* blob_data(const Blob_mutable& blob);

} // namespace ripple::util
