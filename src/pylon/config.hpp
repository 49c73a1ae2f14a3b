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
#include "pylon/transit/transit.hpp"
#include "pylon/wormhole/wormhole.hpp"

namespace pylon
{

// Types.

/**
 * The session's identity and configuration: fixed for the lifetime of a Pylon.  Normally filled out by
 * Pylon_builder, which supplies every default; see the members' doc headers.
 *
 * URLs are kept as given and are parsed only when an operation needs them, so a malformed one fails that operation
 * (before anything is sent anywhere), not construction.
 */
struct Config
{
  // Constants.

  /// Default #m_relay_url: the public transit relay.
  static const std::string S_DEFAULT_RELAY_URL;

  /// Default #m_rendezvous_url: the public rendezvous server.
  static const std::string S_DEFAULT_RENDEZVOUS_URL;

  // Data.

  /// Application id; required.  Peers must use the same one to find each other.
  std::string m_id;

  /// Relay offered to the peer as a relay hint.  Default #S_DEFAULT_RELAY_URL.
  std::string m_relay_url;

  /// Rendezvous server.  Default #S_DEFAULT_RENDEZVOUS_URL.
  std::string m_rendezvous_url;

  /// Transit abilities we announce.  Default transit::Abilities::S_ALL_ABILITIES.
  transit::Abilities m_abilities;

  /// Whether receiving may overwrite an existing destination file.  Default `true`.
  bool m_allow_overwrite;

  /// The rendezvous service.  Default wormhole::Loopback_rendezvous::default_instance().
  wormhole::Rendezvous_ptr m_rendezvous;

  /// Establishes data channels.  Default transit::Loopback_connector::default_instance().
  transit::Connector_ptr m_transit_connector;

  /// Invoked once per transfer when the data channel is up; may be empty.  Default empty.
  transit::Transit_handler m_transit_handler;
}; // struct Config

// Free functions.

/**
 * Prints string representation of the given `Config` to the given `ostream`.
 *
 * @relatesalso Config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Config& val);

} // namespace pylon
