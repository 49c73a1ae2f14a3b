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

/// @file
#pragma once

#include "pylon/transit/abilities.hpp"
#include "pylon/transit/relay_hint.hpp"

namespace pylon::transit
{

// Types.

/// How a data channel was established.  Passed to the #Transit_handler.
struct Transit_info
{
  // Types.

  /// Connection type.
  enum class Conn_type
  {
    /// Peers are connected directly.
    S_DIRECT,
    /// Peers are connected via a relay server.
    S_RELAY
  }; // enum class Conn_type

  // Data.

  /// Connection type.
  Conn_type m_conn_type;

  /// Description of the remote address: peer address if direct; relay endpoint if relayed.
  std::string m_peer_addr;
}; // struct Transit_info

/**
 * An established, encrypted data channel to the peer carrying discrete *records*.  Records are delivered in order
 * and intact (each send_record() corresponds to exactly one receive_record() on the other side).
 *
 * The channel is torn down when the object is destroyed; the opposing side's subsequent operations then fail with
 * error::Code::S_CHANNEL_CLOSED.
 *
 * Not thread-safe; but send_record() and receive_record() may be invoked concurrently with each other.
 */
class Transit
{
public:
  // Constructors/destructor.

  /// Tears down the channel.
  virtual ~Transit();

  // Methods.

  /**
   * Sends one record.  Non-blocking or nearly so.
   *
   * @param record
   *        The record.
   * @param err_code
   *        Must not be null.  Set to error::Code::S_CHANNEL_CLOSED or other transport error; or cleared.
   */
  virtual void send_record(const Blob& record, Error_code* err_code) = 0;

  /**
   * Blocks until a record arrives, the channel is closed, or `cancel` fires.
   *
   * @param record
   *        On success, set to the record.
   * @param cancel
   *        Cancellation signal.
   * @param err_code
   *        Must not be null.  Set to error::Code::S_CHANNEL_CLOSED, error::Code::S_TRANSFER_CANCELED, or other
   *        transport error; or cleared.
   */
  virtual void receive_record(Blob* record, const Cancel_future& cancel, Error_code* err_code) = 0;

  /**
   * How the channel was established.
   *
   * @return See above.
   */
  virtual const Transit_info& info() const = 0;
}; // class Transit

/**
 * Establishes a Transit between the two peers of a completed wormhole handshake.  Both peers invoke connect()
 * with the same `transit_key` (which the handshake derived) and opposite roles; each gets its end of the channel.
 *
 * An implementation must be safe to invoke concurrently (by the two peers, and by unrelated transfers).
 */
class Connector
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Connector();

  // Methods.

  /**
   * Blocks until the data channel is established, or it fails, or `cancel` fires.  If `cancel` fires first, the
   * key is abandoned as by abandon().
   *
   * @param role
   *        Our role.
   * @param transit_key
   *        Secret shared by the two peers; identifies and keys this data channel.
   * @param our_abilities
   *        What we support.
   * @param their_abilities
   *        What the peer announced it supports.
   * @param our_hints
   *        Relays we offered.
   * @param their_hints
   *        Relays the peer offered.
   * @param cancel
   *        Cancellation signal.
   * @param err_code
   *        Must not be null.  Set to error::Code::S_TRANSIT_NO_COMMON_ABILITY, error::Code::S_TRANSFER_CANCELED,
   *        error::Code::S_CHANNEL_CLOSED (peer abandoned the key), or other transport error; or cleared.
   * @return The established channel; null on error.
   */
  virtual Transit_ptr connect(Role role, const std::string& transit_key,
                              const Abilities& our_abilities, const Abilities& their_abilities,
                              const Relay_hints& our_hints, const Relay_hints& their_hints,
                              const Cancel_future& cancel, Error_code* err_code) = 0;

  /**
   * Declares that we will not connect() under `transit_key` after all, having possibly led the peer to believe we
   * would.  The peer's connect() under that key, whether already waiting or invoked later, fails with
   * error::Code::S_CHANNEL_CLOSED instead of waiting for us.
   *
   * @param transit_key
   *        See connect().
   */
  virtual void abandon(const std::string& transit_key) = 0;
}; // class Connector

// Free functions.

/**
 * Decides how two peers with the given abilities and relay hints can connect: directly if both can; else via a
 * relay if both can relay and at least one relay hint is available; else not at all.
 *
 * @param our_abilities
 *        Ours.
 * @param their_abilities
 *        Theirs.
 * @param our_hints
 *        Ours.
 * @param their_hints
 *        Theirs.
 * @param conn_type
 *        On success, set to the chosen type.
 * @return `false` if and only if there is no common way to connect.
 */
bool choose_conn_type(const Abilities& our_abilities, const Abilities& their_abilities,
                      const Relay_hints& our_hints, const Relay_hints& their_hints,
                      Transit_info::Conn_type* conn_type);

} // namespace pylon::transit
