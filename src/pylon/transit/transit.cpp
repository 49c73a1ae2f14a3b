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
#include "pylon/transit/transit.hpp"

namespace pylon::transit
{

// Implementations.

Transit::~Transit() = default;

Connector::~Connector() = default;

bool choose_conn_type(const Abilities& our_abilities, const Abilities& their_abilities,
                      const Relay_hints& our_hints, const Relay_hints& their_hints,
                      Transit_info::Conn_type* conn_type)
{
  const auto common = our_abilities.intersection(their_abilities);
  if (common.can_direct())
  {
    *conn_type = Transit_info::Conn_type::S_DIRECT;
    return true;
  }
  // else

  // Either side's relay will do: both sides connect to it.
  if (common.can_relay() && ((!our_hints.empty()) || (!their_hints.empty())))
  {
    *conn_type = Transit_info::Conn_type::S_RELAY;
    return true;
  }
  // else

  return false;
}

std::ostream& operator<<(std::ostream& os, const Transit_info& val)
{
  return os << ((val.m_conn_type == Transit_info::Conn_type::S_DIRECT) ? "direct" : "relay")
            << '[' << val.m_peer_addr << ']';
}

std::ostream& operator<<(std::ostream& os, Role val)
{
  return os << ((val == Role::S_LEADER) ? "leader" : "follower");
}

} // namespace pylon::transit
