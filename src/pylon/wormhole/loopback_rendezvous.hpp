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

#include "pylon/wormhole/wormhole.hpp"
#include "pylon/detail/loopback_pipe.hpp"
#include <boost/thread/mutex.hpp>
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>
#include <boost/noncopyable.hpp>

namespace pylon::wormhole
{

// Types.

/**
 * Rendezvous that brokers handshakes between peers within the same process, following the rules of the real
 * rendezvous server:
 *   - Nameplates are allocated per application (App_config id and rendezvous URL) and are never reused by
 *     a given Loopback_rendezvous.
 *   - A code is good for one handshake.  Redeeming it again fails with error::Code::S_CODE_ALREADY_USED;
 *     redeeming a nameplate nobody allocated fails with error::Code::S_PEER_ABSENT.
 *   - If the password part does not match the allocated code, both sides fail with
 *     error::Code::S_AUTHENTICATION_MISMATCH, and the code is used up.
 *   - A code released by its allocator (release_code()) is used up as well.
 *
 * On success the two sides get the two ends of one in-memory mailbox and an equal, random transit key.
 *
 * For testing, set_reachable() can make the service act unreachable.
 *
 * ### Thread safety ###
 * All methods may be invoked concurrently.
 */
class Loopback_rendezvous :
  public Rendezvous,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs service with no codes allocated.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null is allowed.
   */
  explicit Loopback_rendezvous(flow::log::Logger* logger_ptr);

  /// Fails any handshake still awaiting its peer with error::Code::S_CHANNEL_CLOSED.
  ~Loopback_rendezvous() override;

  // Methods.

  /**
   * Process-wide service used by default by every Pylon not configured with its own.  Does not log.
   *
   * @return See above.
   */
  static Rendezvous_ptr default_instance();

  /**
   * Sets whether the service is reachable.  While it is not, connect_without_code() and connect_with_code() fail
   * with error::Code::S_RENDEZVOUS_UNREACHABLE.  Initially reachable.
   *
   * @param reachable
   *        See above.
   */
  void set_reachable(bool reachable);

  /**
   * Implements Rendezvous API.
   *
   * @param app
   *        See Rendezvous.
   * @param code_length
   *        See Rendezvous.
   * @param code
   *        See Rendezvous.
   * @param err_code
   *        See Rendezvous.
   * @return See Rendezvous.
   */
  Handshake connect_without_code(const App_config& app, size_t code_length, Code* code,
                                 Error_code* err_code) override;

  /**
   * Implements Rendezvous API.  Does not block: the peer that allocated the code is already known (or not).
   *
   * @param app
   *        See Rendezvous.
   * @param code
   *        See Rendezvous.
   * @param cancel
   *        See Rendezvous.
   * @param err_code
   *        See Rendezvous.
   * @return See Rendezvous.
   */
  Wormhole_ptr connect_with_code(const App_config& app, const Code& code, const Cancel_future& cancel,
                                 Error_code* err_code) override;

  /**
   * Implements Rendezvous API.
   *
   * @param app
   *        See Rendezvous.
   * @param code
   *        See Rendezvous.
   */
  void release_code(const App_config& app, const Code& code) override;

private:
  // Types.

  class Loopback_wormhole;

  /// An allocated code awaiting redemption.
  struct Allocation
  {
    /// The code.
    Code m_code;

    /// Fulfilled upon successful redemption; failed upon failed redemption, release, or our destruction.
    boost::promise<Wormhole_ptr> m_wormhole_promise;
  };

  /// Short-hand for ref-counted Allocation.
  using Allocation_ptr = boost::shared_ptr<Allocation>;

  // Methods.

  /**
   * Key identifying a nameplate within an application.
   *
   * @param app
   *        Application.
   * @param nameplate
   *        Nameplate.
   * @return See above.
   */
  static std::string nameplate_key(const App_config& app, const std::string& nameplate);

  /**
   * Makes a random transit key.
   *
   * @return See above.
   */
  static std::string make_transit_key();

  // Data.

  /// Protects the following members.
  mutable boost::mutex m_mutex;

  /// See set_reachable().
  bool m_reachable;

  /// Next nameplate to allocate.
  unsigned int m_next_nameplate;

  /// Codes allocated and not yet redeemed, by nameplate_key().
  boost::unordered_map<std::string, Allocation_ptr> m_allocations;

  /// nameplate_key()s of codes that have been redeemed (successfully or not) or released.
  boost::unordered_set<std::string> m_used;
}; // class Loopback_rendezvous

} // namespace pylon::wormhole
