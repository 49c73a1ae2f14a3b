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

#include "pylon/transit/transit.hpp"
#include "pylon/detail/loopback_pipe.hpp"
#include <boost/thread/mutex.hpp>
#include <boost/thread/future.hpp>
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>
#include <boost/noncopyable.hpp>

namespace pylon::transit
{

// Types.

/**
 * Connector that pairs up the two peers of a transfer within the same process.  The first of the two connect()
 * calls bearing a given `transit_key` registers itself and waits; the second completes the pairing, and both
 * get their end of one in-memory record pipe.  A side that gives up before pairing (canceled connect(), or
 * abandon()) leaves its key marked abandoned, and the peer's connect() under it fails rather than waiting forever.
 *
 * The connection type reported in Transit_info follows the same negotiation a networked connector would do
 * (see choose_conn_type()), so that Abilities and Relay_hint settings are observable in-process: a pairing that
 * could only go through a relay is reported as relayed, via the first relay endpoint on offer.
 *
 * ### Thread safety ###
 * connect() may be invoked concurrently from any number of threads.
 */
class Loopback_connector :
  public Connector,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs connector with nobody waiting.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null is allowed.
   */
  explicit Loopback_connector(flow::log::Logger* logger_ptr);

  /// Fails any connect() still waiting for its peer with error::Code::S_CHANNEL_CLOSED.
  ~Loopback_connector() override;

  // Methods.

  /**
   * Process-wide connector used by default by every Pylon not configured with its own.  Does not log.
   *
   * @return See above.
   */
  static Connector_ptr default_instance();

  /**
   * Implements Connector API.  In addition to the errors documented there: error::Code::S_INVALID_ARGUMENT if the
   * peer already waiting under `transit_key` has the same `role` as ours.
   *
   * @param role
   *        See Connector.
   * @param transit_key
   *        See Connector.
   * @param our_abilities
   *        See Connector.
   * @param their_abilities
   *        See Connector.
   * @param our_hints
   *        See Connector.
   * @param their_hints
   *        See Connector.
   * @param cancel
   *        See Connector.
   * @param err_code
   *        See Connector.
   * @return See Connector.
   */
  Transit_ptr connect(Role role, const std::string& transit_key,
                      const Abilities& our_abilities, const Abilities& their_abilities,
                      const Relay_hints& our_hints, const Relay_hints& their_hints,
                      const Cancel_future& cancel, Error_code* err_code) override;

  /**
   * Implements Connector API.
   *
   * @param transit_key
   *        See Connector.
   */
  void abandon(const std::string& transit_key) override;

private:
  // Types.

  class Loopback_transit;

  /// A connect() waiting for its peer.
  struct Waiter
  {
    /// Role of the waiting side.
    Role m_role;

    /// Fulfilled by the peer's connect() with the pipe; or failed by the peer's abandon() or our destructor.
    boost::promise<detail::Loopback_pipe_ptr> m_pipe_promise;
  };

  /// Short-hand for ref-counted Waiter.
  using Waiter_ptr = boost::shared_ptr<Waiter>;

  // Data.

  /// Protects #m_waiters and #m_abandoned.
  mutable boost::mutex m_mutex;

  /// Waiting connect()s, by transit key.  At most one per key.
  boost::unordered_map<std::string, Waiter_ptr> m_waiters;

  /// Keys given up by one side whose peer has not yet shown up; the peer's connect() consumes the entry.
  boost::unordered_set<std::string> m_abandoned;
}; // class Loopback_connector

} // namespace pylon::transit
