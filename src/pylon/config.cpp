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
#include "pylon/config.hpp"

namespace pylon
{

// Static initializations.

const std::string Config::S_DEFAULT_RELAY_URL = "tcp://transit.magic-wormhole.io:4001";
const std::string Config::S_DEFAULT_RENDEZVOUS_URL = "ws://relay.magic-wormhole.io:4000/v1";

// Implementations.

std::ostream& operator<<(std::ostream& os, const Config& val)
{
  return os << "id[" << val.m_id << "] relay_url[" << val.m_relay_url << "] "
               "rendezvous_url[" << val.m_rendezvous_url << "] abilities" << val.m_abilities
            << " allow_overwrite[" << val.m_allow_overwrite << ']';
}

} // namespace pylon
