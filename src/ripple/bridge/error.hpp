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

#include "ripple/common.hpp"

/**
 * Namespace containing the ripple::bridge module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Note that most errors
 * ripple::bridge reports are system errors (`open()` failing with `ENOENT`, `sendfile()` with `EPIPE`, ...) and
 * would not draw from this set but rather from `boost::system::errc`/`system_category()`.
 *
 * None of these ever cross the FFI boundary (see ripple_bridge.h), where every failure is flattened into a
 * sentinel.  They exist for native (C++) users of the bridge components, for logging, and for tests.
 */
namespace ripple::bridge::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by ripple::bridge functions/methods *outside of*
 * system-triggered errors.  These values are convertible to #Error_code and thus extend the set of errors that
 * #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message() (identical to
 * the `///` comment below, or as close as possible) and its symbol to Category::code_symbol() (the identifier
 * minus `S_`).  Add new values at the end, ahead of Code::S_END_SENTINEL; never delete one, deprecate it instead.
 */
enum class Code
{
  /// User called an API with 1 or more arguments against its documented contract.
  S_INVALID_ARGUMENT = S_CODE_LOWEST_INT_VALUE,

  /// Path names a directory or other object that cannot be read or transferred as a file.
  S_NOT_A_REGULAR_FILE,

  /// File yielded fewer bytes than its size at open time; the remainder of the target buffer is unspecified.
  S_FILE_SHORT_READ,

  /// Could not allocate a buffer large enough to hold the file plus terminator.
  S_BUFFER_ALLOCATION_FAILED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a bridge::error::Code from a standard input stream: either the `int` value or the case-insensitive
 * symbol minus `S_` (e.g., "file_short_read").  No match => Code::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a bridge::error::Code to a standard output stream, e.g., Code::S_FILE_SHORT_READ => `"FILE_SHORT_READ"`.
 * The output is compatible with the reverse `istream>>` operator.  To print an #Error_code storing a Code, keep
 * doing the standard thing (print the #Error_code and its `.message()`).
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace ripple::bridge::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to make `enum` `Code` convertible to `Error_code`.  This is the
 * official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::ripple::bridge::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
