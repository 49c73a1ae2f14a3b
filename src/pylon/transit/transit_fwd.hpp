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

#include "pylon/common.hpp"
#include <boost/move/unique_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <ostream>
#include <vector>

/**
 * Pylon module concerned with the *data channel* between two peers that have completed the wormhole handshake:
 * which ways of connecting each side supports (Abilities), where a relay may be found (Relay_hint), and the
 * abstract Connector/Transit pair that actually carries the file's bytes as a sequence of records.
 *
 * The networked implementation of Connector (direct TCP, relay server) is not part of Pylon; Loopback_connector
 * pairs up two peers within one process.
 */
namespace pylon::transit
{

// Types.

// Find doc headers near the bodies of these compound types.

class Abilities;
struct Relay_hint;
struct Transit_info;
class Transit;
class Connector;
class Loopback_connector;

/// Which side of the transfer a peer is on; decides who initiates the data channel.
enum class Role
{
  /// The file sender.
  S_LEADER,
  /// The file receiver.
  S_FOLLOWER
}; // enum class Role

/// Ordered list of relay hints, most preferred first.
using Relay_hints = std::vector<Relay_hint>;

/// Short-hand for ref-counted pointer to a Connector.
using Connector_ptr = boost::shared_ptr<Connector>;

/// Short-hand for unique pointer to an established Transit.
using Transit_ptr = boost::movelib::unique_ptr<Transit>;

/**
 * Callback invoked once per transfer, right after the data channel has been established, describing how it
 * was established.  Empty function is allowed.
 */
using Transit_handler = Function<void (const Transit_info& info)>;

// Free functions.

/**
 * Prints string representation of the given `Abilities` to the given `ostream`.
 *
 * @relatesalso Abilities
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Abilities& val);

/**
 * Prints string representation of the given `Relay_hint` to the given `ostream`.
 *
 * @relatesalso Relay_hint
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Relay_hint& val);

/**
 * Prints string representation of the given `Transit_info` to the given `ostream`.
 *
 * @relatesalso Transit_info
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Transit_info& val);

/**
 * Prints string representation of the given `Role` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Role val);

} // namespace pylon::transit
