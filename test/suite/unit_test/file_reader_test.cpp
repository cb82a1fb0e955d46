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
#include "ripple/bridge/file_reader.hpp"
#include "ripple/test/test_common_util.hpp"
#include "ripple/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace ripple::bridge
{

namespace
{

using test::Temp_dir;
using test::Test_logger;
using std::string;

} // Anonymous namespace

TEST(Raw_buffer_test, ShapeAndOwnership)
{
  Raw_buffer buf(10);
  ASSERT_FALSE(buf.null());
  EXPECT_EQ(buf.size(), 10u);
  EXPECT_EQ(buf.capacity(), 11u);
  EXPECT_EQ(buf.data()[10], '\0');
  EXPECT_EQ(buf.mutable_buffer().size(), 10u);

  Raw_buffer moved(std::move(buf));
  EXPECT_TRUE(buf.null());
  EXPECT_EQ(buf.capacity(), 0u);
  EXPECT_EQ(moved.size(), 10u);

  moved.terminate_at(3);
  EXPECT_EQ(moved.data()[3], '\0');

  char* const raw = moved.release();
  EXPECT_TRUE(moved.null());
  ASSERT_NE(raw, nullptr);
  std::free(raw);

  Raw_buffer empty(0);
  ASSERT_FALSE(empty.null());
  EXPECT_EQ(empty.capacity(), 1u);
  EXPECT_EQ(empty.data()[0], '\0');
}

TEST(Raw_buffer_test, Resize)
{
  Raw_buffer buf(4);
  std::memcpy(buf.data(), "abcd", 4);

  Error_code err_code;
  buf.resize(4 * 1000 * 1000, &err_code);
  ASSERT_FALSE(err_code) << err_code.message();
  EXPECT_EQ(buf.size(), 4u * 1000u * 1000u);
  EXPECT_EQ(buf.capacity(), buf.size() + 1);
  EXPECT_EQ(string(buf.data(), 4), "abcd");
  EXPECT_EQ(buf.data()[buf.size()], '\0');

  buf.resize(2, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(string(buf.data()), "ab");

  Raw_buffer null_buf;
  null_buf.resize(3, &err_code);
  ASSERT_FALSE(err_code);
  ASSERT_FALSE(null_buf.null());
  EXPECT_EQ(null_buf.data()[3], '\0');

  // The terminator slot would not fit: refused, and the buffer is left alone.
  null_buf.resize(std::numeric_limits<size_t>::max(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_BUFFER_ALLOCATION_FAILED);
  EXPECT_EQ(null_buf.size(), 3u);
}

TEST(Read_file_test, WholeFileWithTerminator)
{
  Test_logger logger;
  Temp_dir dir;
  const auto content = test::pattern_content(100 * 1000 + 7);
  test::write_file(dir / "f", content);

  Raw_buffer buf;
  Error_code err_code;
  read_file(&logger, dir / "f", &buf, &err_code);
  ASSERT_FALSE(err_code) << err_code.message();
  ASSERT_EQ(buf.size(), content.size());
  EXPECT_EQ(buf.capacity(), content.size() + 1);
  EXPECT_EQ(string(buf.data(), buf.size()), content);
  EXPECT_EQ(buf.data()[content.size()], '\0');
}

TEST(Read_file_test, EmptyFile)
{
  Test_logger logger;
  Temp_dir dir;
  test::write_file(dir / "empty", "");

  Raw_buffer buf;
  read_file(&logger, dir / "empty", &buf); // Throws on error.
  ASSERT_FALSE(buf.null());
  EXPECT_EQ(buf.size(), 0u);
  EXPECT_EQ(buf.data()[0], '\0');
}

TEST(Read_file_test, ReportedSizeZeroReadsToEof)
{
  // fstat() says 0 bytes for /proc files; the content is still there.
  Test_logger logger;
  const fs::path path("/proc/self/status");
  ASSERT_EQ(fs::file_size(path), 0u);

  Raw_buffer buf;
  Error_code err_code;
  read_file(&logger, path, &buf, &err_code);
  ASSERT_FALSE(err_code) << err_code.message();
  ASSERT_GT(buf.size(), 0u);
  EXPECT_EQ(buf.capacity(), buf.size() + 1);
  EXPECT_EQ(buf.data()[buf.size()], '\0');
  EXPECT_EQ(std::strlen(buf.data()), buf.size());
  EXPECT_EQ(string(buf.data()).find("Name:"), 0u);
}

TEST(Read_file_test, LongerThanReportedSizeReadsToEof)
{
  // /proc/self/maps also reports 0 and is commonly well past the first read-ahead step; exercises doubling.
  Test_logger logger;
  Raw_buffer buf;
  read_file(&logger, "/proc/self/maps", &buf); // Throws on error.
  ASSERT_GT(buf.size(), 0u);
  EXPECT_EQ(std::strlen(buf.data()), buf.size());
  EXPECT_EQ(buf.data()[buf.size() - 1], '\n');
}

TEST(Read_file_test, Errors)
{
  Test_logger logger;
  Temp_dir dir;

  Raw_buffer buf;
  Error_code err_code;
  read_file(&logger, dir / "missing", &buf, &err_code);
  EXPECT_EQ(err_code, boost::system::errc::no_such_file_or_directory);
  EXPECT_TRUE(buf.null());

  read_file(&logger, dir.path(), &buf, &err_code);
  EXPECT_EQ(err_code, error::Code::S_NOT_A_REGULAR_FILE);
  EXPECT_TRUE(buf.null());

  EXPECT_THROW(read_file(&logger, dir / "missing", &buf), flow::error::Runtime_error);
}

} // namespace ripple::bridge
