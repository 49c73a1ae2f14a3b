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
#include "pylon/transit/abilities.hpp"

namespace pylon::transit
{

// Static initializations.

const Abilities Abilities::S_ALL_ABILITIES
  = { Ability::S_DIRECT_TCP_V1, Ability::S_RELAY_V1, Ability::S_RELAY_V2 };
const Abilities Abilities::S_FORCE_DIRECT = { Ability::S_DIRECT_TCP_V1 };
const Abilities Abilities::S_FORCE_RELAY = { Ability::S_RELAY_V1, Ability::S_RELAY_V2 };

// Implementations.

Abilities::Abilities() = default;

Abilities::Abilities(std::initializer_list<Ability> abilities)
{
  for (const auto ability : abilities)
  {
    set(ability);
  }
}

bool Abilities::has(Ability ability) const
{
  return m_bits.test(static_cast<size_t>(ability));
}

void Abilities::set(Ability ability, bool present)
{
  assert((ability != Ability::S_END_SENTINEL) && "SENTINEL: Not an ability.");
  m_bits.set(static_cast<size_t>(ability), present);
}

bool Abilities::can_direct() const
{
  return has(Ability::S_DIRECT_TCP_V1);
}

bool Abilities::can_relay() const
{
  return has(Ability::S_RELAY_V1) || has(Ability::S_RELAY_V2);
}

bool Abilities::empty() const
{
  return m_bits.none();
}

Abilities Abilities::intersection(const Abilities& other) const
{
  Abilities result;
  result.m_bits = m_bits & other.m_bits;
  return result;
}

bool Abilities::operator==(const Abilities& other) const
{
  return m_bits == other.m_bits;
}

flow::util::String_view Abilities::name(Ability ability) // Static.
{
  switch (ability)
  {
  case Ability::S_DIRECT_TCP_V1:
    return "direct-tcp-v1";
  case Ability::S_RELAY_V1:
    return "relay-v1";
  case Ability::S_RELAY_V2:
    return "relay-v2";
  case Ability::S_END_SENTINEL:
    break;
  }
  assert(false && "SENTINEL: Not an ability.");
  return "";
}

std::ostream& operator<<(std::ostream& os, const Abilities& val)
{
  using Ability = Abilities::Ability;

  os << '{';
  bool first = true;
  for (size_t idx = 0; idx != static_cast<size_t>(Ability::S_END_SENTINEL); ++idx)
  {
    const auto ability = Ability(idx);
    if (val.has(ability))
    {
      os << (first ? "" : ",") << Abilities::name(ability);
      first = false;
    }
  }
  return os << '}';
}

} // namespace pylon::transit
