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
#include "pylon/transfer/transfer.hpp"
#include "pylon/error.hpp"
#include <boost/crc.hpp>
#include <algorithm>

namespace pylon::transfer
{

// Static initializations.

const std::string S_REJECTION_REASON = "transfer rejected";

// Implementations.

void send_peer_message(wormhole::Wormhole* wormhole, const Peer_message& msg, Error_code* err_code)
{
  wormhole->send(encode_peer_message(msg), err_code);
}

Peer_message receive_peer_message(wormhole::Wormhole* wormhole, const Cancel_future& cancel, Error_code* err_code)
{
  Blob blob;
  wormhole->receive(&blob, cancel, err_code);
  if (*err_code)
  {
    return Peer_message{};
  }
  // else
  return decode_peer_message(blob, err_code);
}

void send_file(flow::log::Logger* logger_ptr, wormhole::Wormhole* wormhole, const Transit_setup& setup,
               std::istream* file, const Offer& offer, const Progress_func& on_progress,
               const Cancel_future& cancel, Error_code* err_code)
{
  using Type = Peer_message::Type;

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSFER);
  assert(err_code);

  // Both of ours go out right away; the receiver sends its transit without waiting for ours.
  Peer_message our_msg{};
  our_msg.m_type = Type::S_TRANSIT;
  our_msg.m_transit.m_abilities = setup.m_abilities;
  our_msg.m_transit.m_relay_hints = setup.m_relay_hints;
  send_peer_message(wormhole, our_msg, err_code);
  if (!*err_code)
  {
    our_msg.m_type = Type::S_OFFER;
    our_msg.m_offer = offer;
    send_peer_message(wormhole, our_msg, err_code);
  }
  if (*err_code)
  {
    FLOW_LOG_WARNING("Sender: Could not send transit parameters and offer [" << offer << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  FLOW_LOG_INFO("Sender: Offered [" << offer << "]; abilities [" << setup.m_abilities << "], "
                "[" << setup.m_relay_hints.size() << "] relay hints.  Awaiting receiver's transit and answer.");

  /* If we stop waiting for the answer while the mailbox is still up, the receiver may yet accept and go on to
   * connect the data channel; it must not wait there for us. */
  const auto abandon_transit = [&]()
  {
    if (*err_code != error::Code::S_CHANNEL_CLOSED)
    {
      setup.m_connector->abandon(wormhole->transit_key());
    }
  };

  auto their_msg = receive_peer_message(wormhole, cancel, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Sender: Awaiting receiver's transit parameters failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    abandon_transit();
    return;
  }
  // else
  if (their_msg.m_type == Type::S_ERROR)
  {
    FLOW_LOG_WARNING("Sender: Receiver gave up: [" << their_msg.m_error << "].");
    *err_code = error::Code::S_TRANSFER_PEER_ERROR;
    return;
  }
  // else
  if (their_msg.m_type != Type::S_TRANSIT)
  {
    FLOW_LOG_WARNING("Sender: Expected transit parameters; got [" << their_msg.m_type << "].");
    *err_code = error::Code::S_UNEXPECTED_PEER_MESSAGE;
    return;
  }
  // else
  const auto their_transit = std::move(their_msg.m_transit);

  their_msg = receive_peer_message(wormhole, cancel, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Sender: Awaiting receiver's answer failed: [" << *err_code << "] [" << err_code->message() << "].");
    abandon_transit();
    return;
  }
  // else
  if (their_msg.m_type == Type::S_ERROR)
  {
    FLOW_LOG_WARNING("Sender: Receiver declined the offer: [" << their_msg.m_error << "].");
    *err_code = error::Code::S_TRANSFER_REJECTED;
    return;
  }
  // else
  if (their_msg.m_type != Type::S_ANSWER)
  {
    FLOW_LOG_WARNING("Sender: Expected answer; got [" << their_msg.m_type << "].");
    *err_code = error::Code::S_UNEXPECTED_PEER_MESSAGE;
    return;
  }
  // else

  FLOW_LOG_INFO("Sender: Receiver accepted; their abilities [" << their_transit.m_abilities << "].  "
                "Connecting data channel.");

  const auto transit = setup.m_connector->connect(transit::Role::S_LEADER, wormhole->transit_key(),
                                                  setup.m_abilities, their_transit.m_abilities,
                                                  setup.m_relay_hints, their_transit.m_relay_hints,
                                                  cancel, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Sender: Data channel failed: [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  FLOW_LOG_INFO("Sender: Data channel up: [" << transit->info() << "].  Sending [" << offer.m_file_size << "] bytes.");
  if (setup.m_on_transit)
  {
    setup.m_on_transit(transit->info());
  }

  const auto total = offer.m_file_size;
  if (on_progress)
  {
    on_progress(0, total);
  }

  boost::crc_32_type crc;
  Blob record(S_RECORD_SIZE);
  uint64_t sent = 0;
  while (sent != total)
  {
    if (cancel_requested(cancel))
    {
      FLOW_LOG_INFO("Sender: Canceled after [" << sent << "] of [" << total << "] bytes.");
      *err_code = error::Code::S_TRANSFER_CANCELED;
      return;
    }
    // else

    const auto record_sz = size_t(std::min(uint64_t(S_RECORD_SIZE), total - sent));
    record.resize(record_sz);
    file->read(reinterpret_cast<char*>(record.data()), record_sz);
    if (size_t(file->gcount()) != record_sz)
    {
      FLOW_LOG_WARNING("Sender: Source yielded only [" << (sent + file->gcount()) << "] of the [" << total << "] "
                       "bytes offered.");
      *err_code = error::Code::S_TRANSFER_SIZE_MISMATCH;
      return;
    }
    // else

    crc.process_bytes(record.data(), record_sz);
    transit->send_record(record, err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("Sender: Sending record failed after [" << sent << "] of [" << total << "] bytes: "
                       "[" << *err_code << "] [" << err_code->message() << "].");
      return;
    }
    // else

    sent += record_sz;
    FLOW_LOG_TRACE("Sender: Sent [" << sent << "] of [" << total << "] bytes.");
    if (on_progress)
    {
      on_progress(sent, total);
    }
  } // while (sent != total)

  Blob ack_record;
  transit->receive_record(&ack_record, cancel, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Sender: Awaiting acknowledgment failed: [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else
  const auto ack = decode_transfer_ack(ack_record, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Sender: Acknowledgment undecodable.");
    return;
  }
  // else
  if (!ack.m_ok)
  {
    FLOW_LOG_WARNING("Sender: Receiver reports it failed to take the file.");
    *err_code = error::Code::S_TRANSFER_PEER_ERROR;
    return;
  }
  // else
  if (ack.m_crc32 != crc.checksum())
  {
    FLOW_LOG_WARNING("Sender: Receiver's checksum [" << std::hex << ack.m_crc32 << "] differs from ours "
                     "[" << crc.checksum() << std::dec << "].");
    *err_code = error::Code::S_TRANSFER_CHECKSUM_MISMATCH;
    return;
  }
  // else

  FLOW_LOG_INFO("Sender: Transfer of [" << offer << "] complete and acknowledged.");
  err_code->clear();
} // send_file()

} // namespace pylon::transfer
