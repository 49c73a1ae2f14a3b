/* Pylon
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

#include "pylon/error.hpp"
#include "pylon/url.hpp"
#include <gtest/gtest.h>
#include <boost/system/errc.hpp>
#include <set>
#include <sstream>

namespace pylon::test
{

TEST(Error, CategoryAndMessages)
{
  const Error_code err_code = error::Code::S_NO_ACTIVE_HANDSHAKE;
  EXPECT_STREQ(err_code.category().name(), "pylon");
  EXPECT_EQ(err_code.message(), "There is currently no active handshake.");
  EXPECT_EQ(Error_code(error::Code::S_NO_ACTIVE_TRANSFER_REQUEST).message(),
            "There is currently no active transfer request.");

  // Every code has a distinct, non-empty message.
  std::set<std::string> messages;
  for (int val = error::S_CODE_LOWEST_INT_VALUE; val != int(error::Code::S_END_SENTINEL); ++val)
  {
    const auto message = Error_code(error::Code(val)).message();
    EXPECT_FALSE(message.empty());
    EXPECT_TRUE(messages.insert(message).second) << message;
  }
}

TEST(Error, KindOf)
{
  using error::Code;
  using error::Kind;
  using error::kind_of;

  EXPECT_EQ(kind_of(Code::S_HANDSHAKE_ALREADY_PENDING), Kind::S_VALIDATION);
  EXPECT_EQ(kind_of(Code::S_NO_ACTIVE_HANDSHAKE), Kind::S_VALIDATION);
  EXPECT_EQ(kind_of(Code::S_INVALID_FILE_NAME), Kind::S_VALIDATION);
  EXPECT_EQ(kind_of(Code::S_URL_PARSE_FAILED), Kind::S_CONFIGURATION);
  EXPECT_EQ(kind_of(Code::S_MISSING_APP_ID), Kind::S_CONFIGURATION);
  EXPECT_EQ(kind_of(Code::S_PEER_ABSENT), Kind::S_PROTOCOL);
  EXPECT_EQ(kind_of(Code::S_CODE_ALREADY_USED), Kind::S_PROTOCOL);
  EXPECT_EQ(kind_of(Code::S_AUTHENTICATION_MISMATCH), Kind::S_PROTOCOL);
  EXPECT_EQ(kind_of(Code::S_TRANSFER_CANCELED), Kind::S_TRANSFER);
  EXPECT_EQ(kind_of(Code::S_TRANSFER_REJECTED), Kind::S_TRANSFER);
  EXPECT_EQ(kind_of(Code::S_CHANNEL_CLOSED), Kind::S_TRANSPORT);
  EXPECT_EQ(kind_of(Code::S_RENDEZVOUS_UNREACHABLE), Kind::S_TRANSPORT);

  // Anything from outside Pylon (filesystem, OS) is opaque.
  const auto fs_err_code = boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory);
  EXPECT_EQ(kind_of(fs_err_code), Kind::S_GENERIC);

  std::ostringstream os;
  os << Kind::S_PROTOCOL << ' ' << Kind::S_GENERIC;
  EXPECT_EQ(os.str(), "protocol generic");
}

TEST(Error, CodeStreaming)
{
  std::ostringstream os;
  os << error::Code::S_CODE_ALREADY_USED;
  EXPECT_EQ(os.str(), "CODE_ALREADY_USED");

  std::istringstream is("transfer_canceled");
  error::Code code;
  is >> code;
  EXPECT_EQ(code, error::Code::S_TRANSFER_CANCELED);

  std::istringstream bad_is("NOT_A_CODE");
  bad_is >> code;
  EXPECT_EQ(code, error::Code::S_END_SENTINEL);
}

TEST(Error, NullErrCodeThrows)
{
  try
  {
    parse_url("not a url");
    FAIL() << "Expected exception.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_URL_PARSE_FAILED);
  }

  Error_code err_code;
  parse_url("not a url", &err_code);
  EXPECT_EQ(err_code, error::Code::S_URL_PARSE_FAILED);
}

} // namespace pylon::test
