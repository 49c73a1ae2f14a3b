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

#include "pylon/transit/abilities.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace pylon::test
{

using transit::Abilities;
using Ability = Abilities::Ability;

TEST(Abilities, PresetsAndQueries)
{
  EXPECT_TRUE(Abilities().empty());
  EXPECT_FALSE(Abilities().can_direct());
  EXPECT_FALSE(Abilities().can_relay());

  const auto& all = Abilities::S_ALL_ABILITIES;
  EXPECT_TRUE(all.has(Ability::S_DIRECT_TCP_V1));
  EXPECT_TRUE(all.has(Ability::S_RELAY_V1));
  EXPECT_TRUE(all.has(Ability::S_RELAY_V2));

  EXPECT_TRUE(Abilities::S_FORCE_DIRECT.can_direct());
  EXPECT_FALSE(Abilities::S_FORCE_DIRECT.can_relay());
  EXPECT_FALSE(Abilities::S_FORCE_RELAY.can_direct());
  EXPECT_TRUE(Abilities::S_FORCE_RELAY.can_relay());

  // Either relay protocol will do.
  EXPECT_TRUE(Abilities{ Ability::S_RELAY_V2 }.can_relay());
}

TEST(Abilities, Intersection)
{
  EXPECT_EQ(Abilities::S_ALL_ABILITIES.intersection(Abilities::S_FORCE_RELAY), Abilities::S_FORCE_RELAY);
  EXPECT_TRUE(Abilities::S_FORCE_DIRECT.intersection(Abilities::S_FORCE_RELAY).empty());

  Abilities abilities{ Ability::S_DIRECT_TCP_V1, Ability::S_RELAY_V1 };
  abilities.set(Ability::S_DIRECT_TCP_V1, false);
  EXPECT_EQ(abilities.intersection(Abilities{ Ability::S_RELAY_V1, Ability::S_RELAY_V2 }),
            Abilities{ Ability::S_RELAY_V1 });
}

TEST(Abilities, Names)
{
  EXPECT_EQ(Abilities::name(Ability::S_DIRECT_TCP_V1), "direct-tcp-v1");
  EXPECT_EQ(Abilities::name(Ability::S_RELAY_V1), "relay-v1");
  EXPECT_EQ(Abilities::name(Ability::S_RELAY_V2), "relay-v2");

  std::ostringstream os;
  os << Abilities::S_FORCE_RELAY;
  EXPECT_EQ(os.str(), "{relay-v1,relay-v2}");
}

} // namespace pylon::test
