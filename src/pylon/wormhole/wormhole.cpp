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
#include "pylon/wormhole/wormhole.hpp"

namespace pylon::wormhole
{

// Implementations.

Wormhole::~Wormhole() = default;

Rendezvous::~Rendezvous() = default;

std::ostream& operator<<(std::ostream& os, const App_config& val)
{
  return os << "app[" << val.m_id << "]@[" << val.m_rendezvous_url << ']';
}

} // namespace pylon::wormhole
