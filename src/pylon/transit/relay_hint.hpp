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
#include "pylon/url.hpp"
#include <optional>

namespace pylon::transit
{

// Types.

/**
 * A candidate relay server, offered to the peer for establishing the data channel when a direct path is
 * unavailable.  One relay may be reachable at several endpoints (e.g., plain TCP and WebSocket); all are listed.
 *
 * This is a data store; build one with from_urls(), which validates the endpoints.
 */
struct Relay_hint
{
  // Constants.

  /// Default port assumed for a `ws://` endpoint lacking one.
  static const uint16_t S_DEFAULT_WS_PORT;

  /// Default port assumed for a `wss://` endpoint lacking one.
  static const uint16_t S_DEFAULT_WSS_PORT;

  // Data.

  /// Human-readable relay name; empty if none.
  std::string m_name;

  /// The endpoints, each with explicit port.  Not empty.
  std::vector<Url> m_endpoints;

  // Methods.

  /**
   * Builds a hint from endpoint URL strings.  Supported schemes: `tcp` (port required), `ws`, `wss` (port
   * defaults to 80, 443 respectively).
   *
   * @param name
   *        Relay name, if any.
   * @param urls
   *        Endpoint URLs.  Must not be empty.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_URL_PARSE_FAILED (a string is not a URL),
   *        error::Code::S_RELAY_HINT_PARSE_FAILED (unsupported scheme; `tcp` without port; no URLs at all).
   * @return The hint; meaningless on error.
   */
  static Relay_hint from_urls(const std::optional<std::string>& name, const std::vector<std::string>& urls,
                              Error_code* err_code = 0);
}; // struct Relay_hint

// Free functions.

/**
 * Returns `true` if and only if the two hints are equal member-wise.
 *
 * @relatesalso Relay_hint
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Relay_hint& val1, const Relay_hint& val2);

} // namespace pylon::transit
