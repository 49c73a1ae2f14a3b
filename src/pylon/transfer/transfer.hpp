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

#include "pylon/transfer/peer_message.hpp"
#include "pylon/transit/transit.hpp"
#include "pylon/wormhole/wormhole.hpp"
#include <istream>
#include <optional>
#include <ostream>

namespace pylon::transfer
{

// Types.

/// What a peer brings to the data-channel negotiation.
struct Transit_setup
{
  // Data.

  /// Establishes the data channel.
  transit::Connector_ptr m_connector;

  /// Our abilities.
  transit::Abilities m_abilities;

  /// Our relays.
  transit::Relay_hints m_relay_hints;

  /// Invoked once the data channel is established; may be empty.
  transit::Transit_handler m_on_transit;
}; // struct Transit_setup

/**
 * An incoming file offer, obtained from request_file(), that can be accepted (the file is then received) or
 * rejected.  Either may be done at most once; the object is useless afterwards and should be destroyed.
 * Destroying it without doing either closes the Wormhole, which the sender observes as error::Code::S_CHANNEL_CLOSED.
 *
 * Movable, not copyable.
 */
class Receive_request :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the request.  Used by request_file().
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param wormhole
   *        The mailbox, past the offer.
   * @param setup
   *        Our side of the data-channel negotiation.
   * @param their_transit
   *        Their side of it.
   * @param offer
   *        The offer.
   */
  explicit Receive_request(flow::log::Logger* logger_ptr, wormhole::Wormhole_ptr wormhole, Transit_setup setup,
                           Peer_transit their_transit, Offer offer);

  /// Move-constructs.
  Receive_request(Receive_request&&) = default;

  /// Move-assigns.
  Receive_request& operator=(Receive_request&&) = default;

  // Methods.

  /**
   * The file on offer.
   *
   * @return See above.
   */
  const Offer& offer() const;

  /**
   * Accepts the offer and receives the file into the given stream, blocking until done, failed, or canceled.
   * `on_progress(received, total)` is invoked with `(0, total)` once the data channel is up and then after every
   * record.  On error the stream may contain a prefix of the file.
   *
   * @param file
   *        Where to write the bytes.
   * @param on_progress
   *        Progress callback; may be empty.
   * @param cancel
   *        Cancellation signal, checked at every record boundary.
   * @param err_code
   *        Must not be null.  error::Code::S_TRANSFER_CANCELED, error::Code::S_TRANSFER_SIZE_MISMATCH,
   *        error::Code::S_TRANSIT_NO_COMMON_ABILITY, error::Code::S_CHANNEL_CLOSED, a write failure; or cleared.
   */
  void accept(std::ostream* file, const Progress_func& on_progress, const Cancel_future& cancel,
              Error_code* err_code);

  /**
   * Rejects the offer; the sender's send_file() fails with error::Code::S_TRANSFER_REJECTED.
   *
   * @param err_code
   *        Must not be null.  error::Code::S_CHANNEL_CLOSED if the sender is gone; or cleared.
   */
  void reject(Error_code* err_code);

private:
  // Data.

  /// The mailbox.
  wormhole::Wormhole_ptr m_wormhole;

  /// Ours.
  Transit_setup m_setup;

  /// Theirs.
  Peer_transit m_their_transit;

  /// See offer().
  Offer m_offer;
}; // class Receive_request

// Constants.

/// Size of the file-data records on the data channel (the last one may be shorter).
constexpr size_t S_RECORD_SIZE = 4096;

/// Text of the `error` message by which the receiver rejects an offer.
extern const std::string S_REJECTION_REASON;

// Free functions.

/**
 * Runs the sending side of the protocol over an established Wormhole: exchanges transit parameters, offers the file,
 * awaits the answer, connects the data channel as the leader, and sends the file's bytes followed by awaiting the
 * receiver's acknowledgment.  `on_progress(sent, total)` is invoked with `(0, total)` once the data channel is up
 * and then after every record.
 *
 * @param logger_ptr
 *        Logger to use for logging.
 * @param wormhole
 *        The mailbox.
 * @param setup
 *        Our side of the data-channel negotiation.
 * @param file
 *        Source of exactly `offer.m_file_size` bytes.
 * @param offer
 *        What to announce to the receiver.
 * @param on_progress
 *        Progress callback; may be empty.
 * @param cancel
 *        Cancellation signal, checked at every wait and record boundary.
 * @param err_code
 *        Must not be null.  error::Code::S_TRANSFER_REJECTED, error::Code::S_TRANSFER_PEER_ERROR,
 *        error::Code::S_TRANSFER_CANCELED, error::Code::S_TRANSFER_SIZE_MISMATCH (file shorter than announced),
 *        error::Code::S_TRANSFER_CHECKSUM_MISMATCH, error::Code::S_UNEXPECTED_PEER_MESSAGE,
 *        error::Code::S_MALFORMED_PEER_MESSAGE, error::Code::S_TRANSIT_NO_COMMON_ABILITY,
 *        error::Code::S_CHANNEL_CLOSED or other transport error; or cleared.
 */
void send_file(flow::log::Logger* logger_ptr, wormhole::Wormhole* wormhole, const Transit_setup& setup,
               std::istream* file, const Offer& offer, const Progress_func& on_progress,
               const Cancel_future& cancel, Error_code* err_code);

/**
 * Runs the receiving side of the protocol up to the offer: exchanges transit parameters and awaits the offer.
 * If the sender gives up (sends an `error`) instead, returns no request but does not fail.
 *
 * @param logger_ptr
 *        Logger to use for logging (and by the returned request).
 * @param wormhole
 *        The mailbox.  Kept by the returned request.
 * @param setup
 *        Our side of the data-channel negotiation.  Kept by the returned request.
 * @param cancel
 *        Cancellation signal.
 * @param err_code
 *        Must not be null.  error::Code::S_TRANSFER_CANCELED, error::Code::S_UNEXPECTED_PEER_MESSAGE,
 *        error::Code::S_MALFORMED_PEER_MESSAGE, error::Code::S_CHANNEL_CLOSED or other transport error; or cleared.
 * @return The request; or none if error or if the sender gave up.
 */
std::optional<Receive_request> request_file(flow::log::Logger* logger_ptr, wormhole::Wormhole_ptr wormhole,
                                            const Transit_setup& setup, const Cancel_future& cancel,
                                            Error_code* err_code);

/**
 * Sends one message over the mailbox.
 *
 * @param wormhole
 *        The mailbox.
 * @param msg
 *        The message.
 * @param err_code
 *        Must not be null.  See Wormhole::send().
 */
void send_peer_message(wormhole::Wormhole* wormhole, const Peer_message& msg, Error_code* err_code);

/**
 * Receives and decodes one message from the mailbox.
 *
 * @param wormhole
 *        The mailbox.
 * @param cancel
 *        Cancellation signal.
 * @param err_code
 *        Must not be null.  See Wormhole::receive() and decode_peer_message().
 * @return The message; meaningless on error.
 */
Peer_message receive_peer_message(wormhole::Wormhole* wormhole, const Cancel_future& cancel, Error_code* err_code);

} // namespace pylon::transfer
