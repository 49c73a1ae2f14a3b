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
#include "pylon/common.hpp"

namespace pylon
{

// Static initializations.

const boost::unordered_multimap<Log_component, std::string> S_PYLON_LOG_COMPONENT_NAME_MAP
  = {
      { Log_component::S_UNCAT, "UNCAT" },
      { Log_component::S_SESSION, "SESSION" },
      { Log_component::S_WORMHOLE, "WORMHOLE" },
      { Log_component::S_TRANSIT, "TRANSIT" },
      { Log_component::S_TRANSFER, "TRANSFER" }
    };

const boost::chrono::milliseconds S_CANCEL_POLL_PERIOD(20);

// Implementations.

void config_log_components(flow::log::Config* config)
{
  // Offset keeps us clear of flow's own component enum (which starts at 0).
  config->init_component_to_union_idx_mapping<Log_component>
    (2000, static_cast<size_t>(Log_component::S_END_SENTINEL));
  config->init_component_names<Log_component>(S_PYLON_LOG_COMPONENT_NAME_MAP, false, "pylon-");
}

bool cancel_requested(const Cancel_future& cancel)
{
  return cancel.valid() && cancel.is_ready();
}

} // namespace pylon
