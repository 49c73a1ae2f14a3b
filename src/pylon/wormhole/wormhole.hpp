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

#include "pylon/wormhole/code.hpp"
#include "pylon/url.hpp"

namespace pylon::wormhole
{

// Types.

/**
 * Identity of the application on the rendezvous server.  Only peers with equal App_config can find each other:
 * the server keeps a separate nameplate namespace per application id.
 */
struct App_config
{
  // Data.

  /// Application id, e.g., "lothar.com/wormhole/text-or-file-xfer".
  std::string m_id;

  /// The rendezvous server.
  Url m_rendezvous_url;
}; // struct App_config

/**
 * An established, authenticated and encrypted mailbox between the two peers of a completed handshake: it carries
 * discrete messages, in order, and derives the secret that keys the data channel (transit_key()).
 *
 * The mailbox is closed when the object is destroyed; the opposing side's subsequent operations then fail with
 * error::Code::S_CHANNEL_CLOSED (once any already-delivered messages are consumed).
 *
 * send() and receive() may be invoked concurrently with each other; otherwise not thread-safe.
 */
class Wormhole
{
public:
  // Constructors/destructor.

  /// Closes the mailbox.
  virtual ~Wormhole();

  // Methods.

  /**
   * Sends one message to the peer.  Non-blocking or nearly so.
   *
   * @param msg
   *        The message.
   * @param err_code
   *        Must not be null.  Set to error::Code::S_CHANNEL_CLOSED or other transport error; or cleared.
   */
  virtual void send(const Blob& msg, Error_code* err_code) = 0;

  /**
   * Blocks until a message arrives from the peer, the mailbox is closed, or `cancel` fires.
   *
   * @param msg
   *        On success, set to the message.
   * @param cancel
   *        Cancellation signal.
   * @param err_code
   *        Must not be null.  Set to error::Code::S_CHANNEL_CLOSED, error::Code::S_TRANSFER_CANCELED, or other
   *        transport error; or cleared.
   */
  virtual void receive(Blob* msg, const Cancel_future& cancel, Error_code* err_code) = 0;

  /**
   * Secret, equal on both sides, derived from the handshake for keying the data channel.
   *
   * @return See above.
   */
  virtual const std::string& transit_key() const = 0;
}; // class Wormhole

/**
 * The rendezvous service: allocates codes and brings together the two peers using a code, performing the code-keyed
 * key agreement.  One peer calls connect_without_code() and communicates the resulting code out-of-band; the other
 * calls connect_with_code() with that code.  Each code may be used for one handshake only, whether it succeeds or
 * fails.
 *
 * An implementation must be safe to invoke concurrently.
 */
class Rendezvous
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Rendezvous();

  // Methods.

  /**
   * Allocates a fresh code of `code_length` words and returns immediately, without waiting for the peer.
   *
   * @param app
   *        Application identity.
   * @param code_length
   *        Number of words in the code; at least 1.
   * @param code
   *        On success, set to the allocated code.
   * @param err_code
   *        Must not be null.  Set to error::Code::S_RENDEZVOUS_UNREACHABLE or other transport error; or cleared.
   * @return On success, the ticket that becomes ready when the peer redeems the code (see #Handshake);
   *         invalid future on error.
   */
  virtual Handshake connect_without_code(const App_config& app, size_t code_length, Code* code,
                                         Error_code* err_code) = 0;

  /**
   * Redeems a code obtained from the peer; blocks until the handshake completes, fails, or `cancel` fires.
   *
   * @param app
   *        Application identity.
   * @param code
   *        The code.
   * @param cancel
   *        Cancellation signal.
   * @param err_code
   *        Must not be null.  Set to error::Code::S_MALFORMED_CODE, error::Code::S_PEER_ABSENT,
   *        error::Code::S_CODE_ALREADY_USED, error::Code::S_AUTHENTICATION_MISMATCH,
   *        error::Code::S_TRANSFER_CANCELED, error::Code::S_RENDEZVOUS_UNREACHABLE or other transport error;
   *        or cleared.
   * @return The established mailbox; null on error.
   */
  virtual Wormhole_ptr connect_with_code(const App_config& app, const Code& code, const Cancel_future& cancel,
                                         Error_code* err_code) = 0;

  /**
   * Gives up a code allocated by connect_without_code() whose handshake has not completed.  The code is used up:
   * redeeming it afterwards fails with error::Code::S_CODE_ALREADY_USED, and its #Handshake (if anyone still holds
   * it) fails with error::Code::S_TRANSFER_CANCELED.  No-op if the handshake has already completed or failed.
   *
   * @param app
   *        Application identity given to connect_without_code().
   * @param code
   *        The code it allocated.
   */
  virtual void release_code(const App_config& app, const Code& code) = 0;
}; // class Rendezvous

} // namespace pylon::wormhole
