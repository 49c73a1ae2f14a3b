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
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <array>
#include <deque>

namespace pylon::detail
{

// Types.

/**
 * Internal, in-process, bidirectional message pipe with two sides, 0 and 1.  What one side sends, the other
 * receives, in order.  Backs both wormhole::Loopback_rendezvous (mailbox messages) and transit::Loopback_connector
 * (records).
 *
 * Once a side is closed, sends from either side fail; receives on the open side drain what was already queued and
 * then fail.  All methods are thread-safe.
 */
class Loopback_pipe :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Constructs pipe with both sides open.
  Loopback_pipe();

  // Methods.

  /**
   * Queues a message for the side opposite `from_side`.
   *
   * @param from_side
   *        0 or 1.
   * @param msg
   *        The message.
   * @param err_code
   *        Must not be null.  error::Code::S_CHANNEL_CLOSED if either side is closed; else cleared.
   */
  void send(size_t from_side, const Blob& msg, Error_code* err_code);

  /**
   * Blocks until a message for `to_side` is available, either side is closed (and nothing is queued), or `cancel`
   * fires.
   *
   * @param to_side
   *        0 or 1.
   * @param msg
   *        On success, set to the message.
   * @param cancel
   *        Cancellation signal.
   * @param err_code
   *        Must not be null.  error::Code::S_CHANNEL_CLOSED, error::Code::S_TRANSFER_CANCELED; or cleared.
   */
  void receive(size_t to_side, Blob* msg, const Cancel_future& cancel, Error_code* err_code);

  /**
   * Closes the given side; idempotent.
   *
   * @param side
   *        0 or 1.
   */
  void close(size_t side);

private:
  // Data.

  /// Protects the other members.
  mutable boost::mutex m_mutex;

  /// Signaled when a message is queued or a side closes.
  boost::condition_variable m_state_changed;

  /// `m_inboxes[i]` holds messages destined to side `i`.
  std::array<std::deque<Blob>, 2> m_inboxes;

  /// `m_closed[i]` is `true` once side `i` is closed.
  std::array<bool, 2> m_closed;
}; // class Loopback_pipe

/// Short-hand for ref-counted pointer to Loopback_pipe; each side's owner holds one.
using Loopback_pipe_ptr = boost::shared_ptr<Loopback_pipe>;

} // namespace pylon::detail
