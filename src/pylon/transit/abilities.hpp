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

#include "pylon/transit/transit_fwd.hpp"
#include <bitset>
#include <initializer_list>

namespace pylon::transit
{

// Types.

/**
 * Set of transit abilities, i.e., modes of establishing the data channel that a peer supports.  The two peers
 * exchange their sets, and the data channel uses a mode both support (direct preferred over relay).
 *
 * Value type; cheap to copy.
 */
class Abilities
{
public:
  // Types.

  /// One transit ability.  The wire names are given in each member's doc header.
  enum class Ability
  {
    /// "direct-tcp-v1": direct TCP connection between peers.
    S_DIRECT_TCP_V1 = 0,
    /// "relay-v1": connection via a relay server.
    S_RELAY_V1,
    /// "relay-v2": connection via a relay server, newer protocol.
    S_RELAY_V2,
    /// SENTINEL: Not an ability.
    S_END_SENTINEL
  }; // enum class Ability

  // Constants.

  /// Every known ability.  This is the default in Pylon's config.
  static const Abilities S_ALL_ABILITIES;

  /// Only direct connections.
  static const Abilities S_FORCE_DIRECT;

  /// Only relayed connections.
  static const Abilities S_FORCE_RELAY;

  // Constructors/destructor.

  /// Constructs empty set.
  Abilities();

  /**
   * Constructs set containing the given abilities.
   *
   * @param abilities
   *        The abilities.
   */
  Abilities(std::initializer_list<Ability> abilities);

  // Methods.

  /**
   * Returns `true` if and only if the given ability is in the set.
   *
   * @param ability
   *        Ability.
   * @return See above.
   */
  bool has(Ability ability) const;

  /**
   * Adds or removes the given ability.
   *
   * @param ability
   *        Ability.
   * @param present
   *        `true` to add; `false` to remove.
   */
  void set(Ability ability, bool present = true);

  /// Returns `true` if the set allows a direct connection.
  bool can_direct() const;

  /// Returns `true` if the set allows a relayed connection (either relay protocol).
  bool can_relay() const;

  /// Returns `true` if the set is empty.
  bool empty() const;

  /**
   * Returns the abilities present in both `*this` and `other`.
   *
   * @param other
   *        The other set, typically the peer's.
   * @return See above.
   */
  Abilities intersection(const Abilities& other) const;

  /**
   * Returns `true` if and only if `*this` and `other` contain the same abilities.
   *
   * @param other
   *        Object to compare.
   * @return See above.
   */
  bool operator==(const Abilities& other) const;

  /**
   * Returns the wire name of the given ability, e.g., "relay-v1".
   *
   * @param ability
   *        Ability.
   * @return See above.
   */
  static flow::util::String_view name(Ability ability);

private:
  // Data.

  /// Bit `i` is set if and only if `Ability(i)` is in the set.
  std::bitset<static_cast<size_t>(Ability::S_END_SENTINEL)> m_bits;
}; // class Abilities

} // namespace pylon::transit
