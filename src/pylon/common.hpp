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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/log/config.hpp>
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/filesystem.hpp>
#include <boost/thread/future.hpp>
#include <boost/chrono.hpp>
#include <boost/unordered_map.hpp>
#include <cstdint>
#include <string>
#include <vector>

/**
 * Pylon: establishes an authenticated peer channel from a short human-exchanged *wormhole code* and transfers one
 * file over it.  See Pylon class doc header for the main entry point; see pylon::wormhole, pylon::transit and
 * pylon::transfer for the layers it is built on.
 */
namespace pylon
{

// Types.

/// Short-hand for filesystem namespace; we use boost.filesystem throughout.
namespace fs = boost::filesystem;

/// Short-hand for the boost.system-style error code used by every Pylon API.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic function object.
using flow::Function;

/// Short-hand for a completion handler taking an #Error_code.
using Task_err = flow::async::Task_asio_err;

/// A message or record as opaque bytes.
using Blob = std::vector<uint8_t>;

/**
 * Cooperative cancellation signal.  Cancellation is requested once the future becomes ready (typically the caller
 * holds the matching `boost::promise<void>` and invokes `set_value()`).  An invalid (default-cted) future never
 * becomes ready and thus means "not cancelable."
 */
using Cancel_future = boost::shared_future<void>;

/**
 * Progress callback: `(bytes_transferred, bytes_total)`.  Invoked synchronously on the transferring thread at
 * every record boundary.  Empty function is allowed and means no progress reporting.
 */
using Progress_func = Function<void (uint64_t bytes_transferred, uint64_t bytes_total)>;

/// The `flow::log` components of Pylon.  Pass one of these to `Log_context` or `FLOW_LOG_SET_CONTEXT()`.
enum class Log_component
{
  /// Uncategorized.
  S_UNCAT = 0,
  /// Pylon session state machine.
  S_SESSION,
  /// Rendezvous and code handling (pylon::wormhole).
  S_WORMHOLE,
  /// Data channel (pylon::transit).
  S_TRANSIT,
  /// File-transfer protocol (pylon::transfer).
  S_TRANSFER,
  /// SENTINEL: Not a component.
  S_END_SENTINEL
}; // enum class Log_component

// Constants.

/// Human-readable names of #Log_component members; see config_log_components().
extern const boost::unordered_multimap<Log_component, std::string> S_PYLON_LOG_COMPONENT_NAME_MAP;

/// How often blocking waits re-check a #Cancel_future when they cannot simply wait on it.
extern const boost::chrono::milliseconds S_CANCEL_POLL_PERIOD;

// Free functions.

/**
 * Registers #Log_component with the given `flow::log::Config`, so that per-component verbosity can be configured
 * and components are printed by name (prefixed `pylon-`).  Call once per `Config`, before logging begins.
 *
 * @param config
 *        The config to modify.
 */
void config_log_components(flow::log::Config* config);

/**
 * Returns `true` if and only if cancellation has been requested via the given signal.
 *
 * @param cancel
 *        Signal; possibly invalid (never canceled).
 * @return See above.
 */
bool cancel_requested(const Cancel_future& cancel);

/**
 * Blocks until `*future` is ready or `cancel` is, whichever comes first.  If both are ready, `*future` wins.
 *
 * @tparam Future
 *         `boost::shared_future<T>` or similar boost.thread future type.
 * @param future
 *        The future to await.
 * @param cancel
 *        Cancellation signal; possibly invalid (then this is just `future->wait()`).
 * @return `true` if `*future` is ready; `false` if canceled first.
 */
template<typename Future>
bool wait_unless_canceled(Future* future, Cancel_future cancel);

// Template implementations.

template<typename Future>
bool wait_unless_canceled(Future* future, Cancel_future cancel)
{
  if (!cancel.valid())
  {
    future->wait();
    return true;
  }
  // else

  return boost::wait_for_any(*future, cancel) == 0;
}

} // namespace pylon
