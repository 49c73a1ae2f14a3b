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

#include "pylon/url.hpp"
#include "pylon/error.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace pylon::test
{

TEST(Url, ParsesEndpoints)
{
  Error_code err_code;

  auto url = parse_url("ws://relay.magic-wormhole.io:4000/v1", &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(url.m_scheme, "ws");
  EXPECT_EQ(url.m_host, "relay.magic-wormhole.io");
  ASSERT_TRUE(url.m_port);
  EXPECT_EQ(*url.m_port, 4000);
  EXPECT_EQ(url.m_path, "/v1");

  url = parse_url("TCP://Transit.Example.COM:4001", &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(url.m_scheme, "tcp");
  EXPECT_EQ(url.m_host, "transit.example.com");
  EXPECT_EQ(url.m_path, "");

  url = parse_url("wss://[::1]/", &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(url.m_host, "::1");
  EXPECT_FALSE(url.m_port);

  std::ostringstream os;
  os << url;
  EXPECT_EQ(os.str(), "wss://[::1]/");
}

TEST(Url, RejectsGarbage)
{
  for (const auto text : { "", "not a url", "relay.magic-wormhole.io:4000", "ws://", "ws://host:0",
                           "ws://host:70000", "ws://host:port", "ws://host/path?query", "://host" })
  {
    Error_code err_code;
    parse_url(text, &err_code);
    EXPECT_EQ(err_code, error::Code::S_URL_PARSE_FAILED) << "For [" << text << "].";
  }
}

} // namespace pylon::test
