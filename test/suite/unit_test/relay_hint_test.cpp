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

#include "pylon/transit/relay_hint.hpp"
#include "pylon/error.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace pylon::test
{

using transit::Relay_hint;

TEST(Relay_hint, FromUrls)
{
  Error_code err_code;
  const auto hint = Relay_hint::from_urls(std::string("main"),
                                          { "tcp://transit.magic-wormhole.io:4001", "ws://relay.example.com/r",
                                            "wss://relay.example.com" },
                                          &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(hint.m_name, "main");
  ASSERT_EQ(hint.m_endpoints.size(), 3u);
  EXPECT_EQ(*hint.m_endpoints[0].m_port, 4001);
  EXPECT_EQ(*hint.m_endpoints[1].m_port, Relay_hint::S_DEFAULT_WS_PORT);
  EXPECT_EQ(*hint.m_endpoints[2].m_port, Relay_hint::S_DEFAULT_WSS_PORT);

  std::ostringstream os;
  os << hint;
  EXPECT_EQ(os.str(), "relay[main] endpoints[tcp://transit.magic-wormhole.io:4001 ws://relay.example.com:80/r "
                      "wss://relay.example.com:443]");

  const auto unnamed = Relay_hint::from_urls(std::nullopt, { "tcp://10.0.0.1:4001" }, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_TRUE(unnamed.m_name.empty());
  EXPECT_FALSE(unnamed == hint);
}

TEST(Relay_hint, Rejects)
{
  Error_code err_code;

  Relay_hint::from_urls(std::nullopt, {}, &err_code);
  EXPECT_EQ(err_code, error::Code::S_RELAY_HINT_PARSE_FAILED);

  Relay_hint::from_urls(std::nullopt, { "tcp://transit.example.com" }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_RELAY_HINT_PARSE_FAILED);

  Relay_hint::from_urls(std::nullopt, { "http://transit.example.com:4001" }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_RELAY_HINT_PARSE_FAILED);

  Relay_hint::from_urls(std::nullopt, { "tcp://transit.example.com:4001", "not a url" }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_URL_PARSE_FAILED);

  EXPECT_THROW(Relay_hint::from_urls(std::nullopt, { "garbage" }), flow::error::Runtime_error);
}

} // namespace pylon::test
