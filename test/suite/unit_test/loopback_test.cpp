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

#include "test_common.hpp"
#include "pylon/detail/loopback_pipe.hpp"
#include "pylon/transit/loopback_connector.hpp"
#include "pylon/wormhole/loopback_rendezvous.hpp"
#include "pylon/error.hpp"
#include <boost/make_shared.hpp>
#include <boost/thread/thread.hpp>
#include <gtest/gtest.h>

namespace pylon::test
{

using transit::Abilities;
using transit::Loopback_connector;
using transit::Relay_hint;
using transit::Relay_hints;
using transit::Role;
using transit::Transit_info;
using transit::Transit_ptr;
using wormhole::App_config;
using wormhole::Code;
using wormhole::Loopback_rendezvous;

namespace
{

App_config test_app(const std::string& id = "pylon.example/test")
{
  return App_config{ id, parse_url("ws://rendezvous.example.com:4000/v1") };
}

} // namespace (anon)

TEST(Loopback_pipe, OrderCloseCancel)
{
  detail::Loopback_pipe pipe;
  Error_code err_code;
  Blob msg;

  pipe.send(0, Blob{ 1 }, &err_code);
  ASSERT_FALSE(err_code);
  pipe.send(0, Blob{ 2, 3 }, &err_code);
  ASSERT_FALSE(err_code);

  pipe.receive(1, &msg, Cancel_future(), &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(msg, Blob{ 1 });

  // Queued messages survive the sender closing; then the receiver sees the close.
  pipe.close(0);
  pipe.receive(1, &msg, Cancel_future(), &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(msg, (Blob{ 2, 3 }));
  pipe.receive(1, &msg, Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CHANNEL_CLOSED);
  pipe.send(1, Blob{ 4 }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_CHANNEL_CLOSED);

  detail::Loopback_pipe idle_pipe;
  Canceler canceler;
  boost::thread canceling_thread([&]()
  {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(50));
    canceler.cancel();
  });
  idle_pipe.receive(0, &msg, canceler.signal(), &err_code);
  canceling_thread.join();
  EXPECT_EQ(err_code, error::Code::S_TRANSFER_CANCELED);
}

TEST(Loopback_connector, PairsLeaderAndFollower)
{
  Test_logging logging;
  Loopback_connector connector(logging.logger());
  const Relay_hints no_hints;

  Transit_ptr follower;
  Error_code follower_err_code;
  boost::thread follower_thread([&]()
  {
    follower = connector.connect(Role::S_FOLLOWER, "key-1", Abilities::S_ALL_ABILITIES, Abilities::S_ALL_ABILITIES,
                                 no_hints, no_hints, Cancel_future(), &follower_err_code);
  });

  Error_code err_code;
  auto leader = connector.connect(Role::S_LEADER, "key-1", Abilities::S_ALL_ABILITIES, Abilities::S_ALL_ABILITIES,
                                  no_hints, no_hints, Cancel_future(), &err_code);
  follower_thread.join();
  ASSERT_FALSE(err_code);
  ASSERT_FALSE(follower_err_code);
  ASSERT_TRUE(leader && follower);

  EXPECT_EQ(leader->info().m_conn_type, Transit_info::Conn_type::S_DIRECT);
  EXPECT_EQ(leader->info().m_peer_addr, "loopback");

  leader->send_record(Blob{ 9, 8, 7 }, &err_code);
  ASSERT_FALSE(err_code);
  Blob record;
  follower->receive_record(&record, Cancel_future(), &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(record, (Blob{ 9, 8, 7 }));

  // Dropping one end is visible at the other.
  leader.reset();
  follower->receive_record(&record, Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CHANNEL_CLOSED);
}

TEST(Loopback_connector, RelayOnly)
{
  Test_logging logging;
  Loopback_connector connector(logging.logger());
  const Relay_hints leader_hints{ Relay_hint::from_urls(std::nullopt, { "tcp://relay.example.com:4001" }) };
  const Relay_hints follower_hints{ Relay_hint::from_urls(std::nullopt, { "tcp://other.example.com:4001" }) };

  Transit_ptr follower;
  Error_code follower_err_code;
  boost::thread follower_thread([&]()
  {
    follower = connector.connect(Role::S_FOLLOWER, "key-2", Abilities::S_ALL_ABILITIES, Abilities::S_FORCE_RELAY,
                                 follower_hints, leader_hints, Cancel_future(), &follower_err_code);
  });

  Error_code err_code;
  const auto leader = connector.connect(Role::S_LEADER, "key-2", Abilities::S_FORCE_RELAY,
                                        Abilities::S_ALL_ABILITIES, leader_hints, follower_hints,
                                        Cancel_future(), &err_code);
  follower_thread.join();
  ASSERT_FALSE(err_code);
  ASSERT_FALSE(follower_err_code);

  // Both ends agree on the relay: the leader's.
  EXPECT_EQ(leader->info().m_conn_type, Transit_info::Conn_type::S_RELAY);
  EXPECT_EQ(leader->info().m_peer_addr, "tcp://relay.example.com:4001");
  EXPECT_EQ(follower->info().m_conn_type, Transit_info::Conn_type::S_RELAY);
  EXPECT_EQ(follower->info().m_peer_addr, "tcp://relay.example.com:4001");
}

TEST(Loopback_connector, Failures)
{
  Test_logging logging;
  Loopback_connector connector(logging.logger());
  const Relay_hints no_hints;
  Error_code err_code;

  // Nothing in common: fails at once, without waiting for the peer.
  auto transit = connector.connect(Role::S_LEADER, "key-3", Abilities::S_FORCE_DIRECT, Abilities::S_FORCE_RELAY,
                                   no_hints, no_hints, Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_TRANSIT_NO_COMMON_ABILITY);
  EXPECT_FALSE(transit);

  // Relay in common but nobody offered a relay.
  transit = connector.connect(Role::S_LEADER, "key-3", Abilities::S_FORCE_RELAY, Abilities::S_FORCE_RELAY,
                              no_hints, no_hints, Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_TRANSIT_NO_COMMON_ABILITY);

  // Same role twice; then the waiting one is canceled.
  Canceler canceler;
  Error_code waiter_err_code;
  boost::thread waiter_thread([&]()
  {
    connector.connect(Role::S_LEADER, "key-4", Abilities::S_ALL_ABILITIES, Abilities::S_ALL_ABILITIES,
                      no_hints, no_hints, canceler.signal(), &waiter_err_code);
  });

  boost::this_thread::sleep_for(boost::chrono::milliseconds(100));
  Canceler already_canceled;
  already_canceled.cancel();
  transit = connector.connect(Role::S_LEADER, "key-4", Abilities::S_ALL_ABILITIES, Abilities::S_ALL_ABILITIES,
                              no_hints, no_hints, already_canceled.signal(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  canceler.cancel();
  waiter_thread.join();
  EXPECT_EQ(waiter_err_code, error::Code::S_TRANSFER_CANCELED);
}

TEST(Loopback_connector, PeerGaveUp)
{
  Test_logging logging;
  Loopback_connector connector(logging.logger());
  const Relay_hints no_hints;
  Error_code err_code;

  // Leader stops waiting; the follower arriving afterwards must not wait for it.
  Canceler canceled;
  canceled.cancel();
  auto transit = connector.connect(Role::S_LEADER, "key-5", Abilities::S_ALL_ABILITIES, Abilities::S_ALL_ABILITIES,
                                   no_hints, no_hints, canceled.signal(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_TRANSFER_CANCELED);
  transit = connector.connect(Role::S_FOLLOWER, "key-5", Abilities::S_ALL_ABILITIES, Abilities::S_ALL_ABILITIES,
                              no_hints, no_hints, Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CHANNEL_CLOSED);
  EXPECT_FALSE(transit);

  // Abandoned before the follower arrives.
  connector.abandon("key-6");
  transit = connector.connect(Role::S_FOLLOWER, "key-6", Abilities::S_ALL_ABILITIES, Abilities::S_ALL_ABILITIES,
                              no_hints, no_hints, Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CHANNEL_CLOSED);

  // Abandoned while the follower waits (or just before; either way it fails).
  Error_code follower_err_code;
  boost::thread follower_thread([&]()
  {
    connector.connect(Role::S_FOLLOWER, "key-7", Abilities::S_ALL_ABILITIES, Abilities::S_ALL_ABILITIES,
                      no_hints, no_hints, Cancel_future(), &follower_err_code);
  });
  boost::this_thread::sleep_for(boost::chrono::milliseconds(50));
  connector.abandon("key-7");
  follower_thread.join();
  EXPECT_EQ(follower_err_code, error::Code::S_CHANNEL_CLOSED);
}

TEST(Loopback_rendezvous, HandshakeAndMailbox)
{
  Test_logging logging;
  Loopback_rendezvous rendezvous(logging.logger());
  Error_code err_code;

  Code code;
  auto handshake = rendezvous.connect_without_code(test_app(), 2, &code, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(code.word_count(), 2u);
  EXPECT_FALSE(handshake.is_ready());

  const auto receiver = rendezvous.connect_with_code(test_app(), Code::parse(code.str()), Cancel_future(), &err_code);
  ASSERT_FALSE(err_code);
  ASSERT_TRUE(handshake.is_ready());
  const auto sender = handshake.get();
  EXPECT_EQ(sender->transit_key(), receiver->transit_key());
  EXPECT_EQ(sender->transit_key().size(), 64u);

  sender->send(Blob{ 42 }, &err_code);
  ASSERT_FALSE(err_code);
  Blob msg;
  receiver->receive(&msg, Cancel_future(), &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(msg, Blob{ 42 });

  // Single use.
  rendezvous.connect_with_code(test_app(), Code::parse(code.str()), Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CODE_ALREADY_USED);

  // Nameplates are not reused.
  Code code2;
  rendezvous.connect_without_code(test_app(), 2, &code2, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_NE(code2.nameplate(), code.nameplate());
}

TEST(Loopback_rendezvous, Failures)
{
  Test_logging logging;
  Loopback_rendezvous rendezvous(logging.logger());
  Error_code err_code;

  rendezvous.connect_with_code(test_app(), Code::parse("999-aardvark-adroitness"), Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_PEER_ABSENT);

  rendezvous.connect_with_code(test_app(), Code(), Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_MALFORMED_CODE);

  // Other applications cannot see our nameplates.
  Code code;
  auto handshake = rendezvous.connect_without_code(test_app(), 2, &code, &err_code);
  ASSERT_FALSE(err_code);
  rendezvous.connect_with_code(test_app("other.example/app"), code, Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_PEER_ABSENT);

  // Wrong password: both sides fail, and the code is used up.
  const auto wrong_code = Code::parse(code.nameplate() + "-zulu-yucatan-zulu");
  rendezvous.connect_with_code(test_app(), wrong_code, Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_AUTHENTICATION_MISMATCH);
  ASSERT_TRUE(handshake.is_ready());
  try
  {
    handshake.get();
    FAIL() << "Expected exception.";
  }
  catch (const boost::system::system_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_AUTHENTICATION_MISMATCH);
  }
  rendezvous.connect_with_code(test_app(), code, Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CODE_ALREADY_USED);

  rendezvous.set_reachable(false);
  rendezvous.connect_without_code(test_app(), 2, &code, &err_code);
  EXPECT_EQ(err_code, error::Code::S_RENDEZVOUS_UNREACHABLE);
  rendezvous.connect_with_code(test_app(), code, Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_RENDEZVOUS_UNREACHABLE);
}

TEST(Loopback_rendezvous, ReleasedCode)
{
  Test_logging logging;
  Loopback_rendezvous rendezvous(logging.logger());
  Error_code err_code;

  Code code;
  auto handshake = rendezvous.connect_without_code(test_app(), 2, &code, &err_code);
  ASSERT_FALSE(err_code);

  // Only the exact code releases it.
  rendezvous.release_code(test_app(), Code::parse(code.nameplate() + "-zulu"));
  EXPECT_FALSE(handshake.is_ready());

  rendezvous.release_code(test_app(), code);
  ASSERT_TRUE(handshake.is_ready());
  try
  {
    handshake.get();
    FAIL() << "Expected exception.";
  }
  catch (const boost::system::system_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_TRANSFER_CANCELED);
  }
  rendezvous.connect_with_code(test_app(), code, Cancel_future(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CODE_ALREADY_USED);

  // Releasing a redeemed code changes nothing.
  Code code2;
  auto handshake2 = rendezvous.connect_without_code(test_app(), 2, &code2, &err_code);
  const auto receiver = rendezvous.connect_with_code(test_app(), code2, Cancel_future(), &err_code);
  ASSERT_FALSE(err_code);
  rendezvous.release_code(test_app(), code2);
  ASSERT_TRUE(handshake2.is_ready());
  EXPECT_TRUE(handshake2.get());
}

TEST(Loopback_rendezvous, DestructionFailsPendingHandshakes)
{
  Test_logging logging;
  wormhole::Handshake handshake;
  {
    Loopback_rendezvous rendezvous(logging.logger());
    Code code;
    Error_code err_code;
    handshake = rendezvous.connect_without_code(test_app(), 3, &code, &err_code);
    ASSERT_FALSE(err_code);
  }
  ASSERT_TRUE(handshake.is_ready());
  EXPECT_TRUE(handshake.has_exception());
}

} // namespace pylon::test
