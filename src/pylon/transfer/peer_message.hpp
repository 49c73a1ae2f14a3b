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

#include "pylon/transit/abilities.hpp"
#include "pylon/transit/relay_hint.hpp"
#include <ostream>

/**
 * Pylon module implementing the file-transfer protocol between two peers that have completed the wormhole handshake:
 * the exchange of transit parameters and the file offer over the Wormhole, followed by the file's bytes as records
 * over the Transit, and the receiver's final acknowledgment.  Messages are Cap'n Proto structures (see
 * `pylon/schema/peer.capnp`).
 */
namespace pylon::transfer
{

// Types.

/// Metadata of the file on offer.
struct Offer
{
  // Data.

  /// File name; base name only.
  std::string m_file_name;

  /// Size in bytes.
  uint64_t m_file_size;
}; // struct Offer

/// Transit parameters announced by a peer.
struct Peer_transit
{
  // Data.

  /// How the peer can connect.
  transit::Abilities m_abilities;

  /// Relays the peer can use.
  transit::Relay_hints m_relay_hints;
}; // struct Peer_transit

/// One message over the Wormhole, in decoded form.
struct Peer_message
{
  // Types.

  /// Kind of message; which of the data members is meaningful.
  enum class Type
  {
    /// Transit parameters; see #m_transit.
    S_TRANSIT,
    /// File offer; see #m_offer.
    S_OFFER,
    /// Offer accepted.
    S_ANSWER,
    /// Peer gives up; see #m_error.
    S_ERROR
  }; // enum class Type

  // Data.

  /// Kind of message.
  Type m_type;

  /// Meaningful if and only if #m_type is `S_TRANSIT`.
  Peer_transit m_transit;

  /// Meaningful if and only if #m_type is `S_OFFER`.
  Offer m_offer;

  /// Meaningful if and only if #m_type is `S_ERROR`.
  std::string m_error;
}; // struct Peer_message

/// The receiver's final record on the Transit.
struct Transfer_ack
{
  // Data.

  /// `false` if the receiver failed to take the file.
  bool m_ok;

  /// CRC-32 of the bytes the receiver got.
  uint32_t m_crc32;
}; // struct Transfer_ack

// Free functions.

/**
 * Serializes a peer message.
 *
 * @param msg
 *        The message.
 * @return The bytes.
 */
Blob encode_peer_message(const Peer_message& msg);

/**
 * Deserializes a peer message.
 *
 * @param blob
 *        The bytes, as given to the peer's encode_peer_message().
 * @param err_code
 *        Must not be null.  Set to error::Code::S_MALFORMED_PEER_MESSAGE; or cleared.
 * @return The message; meaningless on error.
 */
Peer_message decode_peer_message(const Blob& blob, Error_code* err_code);

/**
 * Serializes a transfer acknowledgment.
 *
 * @param ack
 *        The ack.
 * @return The bytes.
 */
Blob encode_transfer_ack(const Transfer_ack& ack);

/**
 * Deserializes a transfer acknowledgment.
 *
 * @param blob
 *        The bytes.
 * @param err_code
 *        Must not be null.  Set to error::Code::S_MALFORMED_PEER_MESSAGE; or cleared.
 * @return The ack; meaningless on error.
 */
Transfer_ack decode_transfer_ack(const Blob& blob, Error_code* err_code);

/**
 * Prints string representation of the given `Offer` to the given `ostream`.
 *
 * @relatesalso Offer
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Offer& val);

/**
 * Prints string representation of the given `Peer_message::Type` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Peer_message::Type val);

} // namespace pylon::transfer
