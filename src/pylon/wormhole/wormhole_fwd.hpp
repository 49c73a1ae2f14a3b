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
#include <boost/shared_ptr.hpp>
#include <boost/thread/future.hpp>
#include <ostream>

/**
 * Pylon module concerned with the *handshake*: allocating and parsing wormhole codes (Code), and the abstract
 * Rendezvous service that, given a code on each side, produces an authenticated, encrypted peer mailbox
 * (Wormhole).  The code-keyed key agreement (PAKE) happens inside the Rendezvous implementation.
 *
 * The networked implementation of Rendezvous (WebSocket mailbox server plus SPAKE2) is not part of Pylon;
 * Loopback_rendezvous brokers handshakes between peers within one process.
 */
namespace pylon::wormhole
{

// Types.

// Find doc headers near the bodies of these compound types.

struct App_config;
class Code;
class Wormhole;
class Rendezvous;
class Loopback_rendezvous;

/// Short-hand for ref-counted pointer to an established Wormhole.
using Wormhole_ptr = boost::shared_ptr<Wormhole>;

/// Short-hand for ref-counted pointer to a Rendezvous.
using Rendezvous_ptr = boost::shared_ptr<Rendezvous>;

/**
 * Handshake ticket: the result of allocating a code, fulfilled with the established Wormhole once the peer
 * redeems the code, or failed if the handshake fails.  On failure, `get()` throws `flow::error::Runtime_error`
 * whose `code()` is the reason.
 */
using Handshake = boost::shared_future<Wormhole_ptr>;

// Free functions.

/**
 * Prints string representation of the given `Code` to the given `ostream`.  Note: this prints the secret
 * code in full; only TRACE-level log messages should do so.
 *
 * @relatesalso Code
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Code& val);

/**
 * Prints string representation of the given `App_config` to the given `ostream`.
 *
 * @relatesalso App_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const App_config& val);

} // namespace pylon::wormhole
