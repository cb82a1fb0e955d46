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
#include <string>
#include <vector>

namespace ripple::test
{

/**
 * A fresh, uniquely named directory under the system temporary directory, removed (with contents) on destruction.
 */
class Temp_dir :
  private boost::noncopyable
{
public:
  /// Creates the directory.  Throws on failure.
  Temp_dir();

  /// Removes the directory and everything in it; errors ignored.
  ~Temp_dir();

  /**
   * The directory.
   *
   * @return See above.
   */
  const fs::path& path() const;

  /**
   * Path of an entry inside the directory (not created).
   *
   * @param name Entry name.
   * @return See above.
   */
  fs::path operator/(const std::string& name) const;

private:
  /// See path().
  fs::path m_path;
}; // class Temp_dir

/**
 * Reads completion records from a named pipe.  The read end is opened at construction, non-blocking, so that
 * writers (which open non-blocking themselves) find a reader attached from then on.
 */
class Fifo_reader :
  private boost::noncopyable
{
public:
  /**
   * Opens the read end of an existing FIFO.  Throws on failure.
   *
   * @param path The FIFO.
   */
  explicit Fifo_reader(const fs::path& path);

  /// Closes the read end.
  ~Fifo_reader();

  /**
   * Waits for (at most) `n` records, giving up after the timeout, and returns those decoded so far.
   *
   * @param n How many records to wait for.
   * @param timeout How long to wait at most, overall.
   * @return The IDs, in order of arrival.  Fewer than `n` means time ran out.
   */
  std::vector<bridge::wire_request_id_t> read_records(size_t n, util::Fine_duration timeout);

  /**
   * Number of bytes that arrived but do not (yet) form a whole record.
   *
   * @return See above.
   */
  size_t n_pending_bytes() const;

private:
  /// The read end.
  util::Scoped_native_handle m_fd;

  /// Bytes read but not yet decoded.
  std::vector<uint8_t> m_pending;
}; // class Fifo_reader

/**
 * Creates (or replaces) a file with the given content.  Throws on failure.
 *
 * @param path File.
 * @param content Bytes.
 */
void write_file(const fs::path& path, const std::string& content);

/**
 * Creates a FIFO (named pipe).  Throws on failure.
 *
 * @param path Where.
 */
void make_fifo(const fs::path& path);

/**
 * Deterministic pseudo-random bytes, including NULs and high bytes, suitable as file content.
 *
 * @param size How many.
 * @param seed Varies the sequence.
 * @return See above.
 */
std::string pattern_content(size_t size, unsigned int seed = 0);

} // namespace ripple::test
