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
#include <boost/system/errc.hpp>

namespace pylon::transfer
{

// Implementations.

std::optional<Receive_request> request_file(flow::log::Logger* logger_ptr, wormhole::Wormhole_ptr wormhole,
                                            const Transit_setup& setup, const Cancel_future& cancel,
                                            Error_code* err_code)
{
  using Type = Peer_message::Type;

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSFER);
  assert(err_code);

  Peer_message our_msg{};
  our_msg.m_type = Type::S_TRANSIT;
  our_msg.m_transit.m_abilities = setup.m_abilities;
  our_msg.m_transit.m_relay_hints = setup.m_relay_hints;
  send_peer_message(wormhole.get(), our_msg, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Receiver: Could not send transit parameters: [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return std::nullopt;
  }
  // else

  FLOW_LOG_INFO("Receiver: Sent abilities [" << setup.m_abilities << "], [" << setup.m_relay_hints.size() << "] "
                "relay hints.  Awaiting sender's transit and offer.");

  Peer_transit their_transit;
  for (const auto expected_type : { Type::S_TRANSIT, Type::S_OFFER })
  {
    auto their_msg = receive_peer_message(wormhole.get(), cancel, err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("Receiver: Awaiting sender's [" << expected_type << "] failed: "
                       "[" << *err_code << "] [" << err_code->message() << "].");
      return std::nullopt;
    }
    // else
    if (their_msg.m_type == Type::S_ERROR)
    {
      FLOW_LOG_WARNING("Receiver: Sender gave up instead of sending [" << expected_type << "]: "
                       "[" << their_msg.m_error << "].  There is nothing to receive.");
      err_code->clear();
      return std::nullopt;
    }
    // else
    if (their_msg.m_type != expected_type)
    {
      FLOW_LOG_WARNING("Receiver: Expected [" << expected_type << "]; got [" << their_msg.m_type << "].");
      *err_code = error::Code::S_UNEXPECTED_PEER_MESSAGE;
      return std::nullopt;
    }
    // else

    if (expected_type == Type::S_TRANSIT)
    {
      their_transit = std::move(their_msg.m_transit);
      continue;
    }
    // else

    FLOW_LOG_INFO("Receiver: Got offer [" << their_msg.m_offer << "]; sender's abilities "
                  "[" << their_transit.m_abilities << "].");
    err_code->clear();
    return Receive_request(logger_ptr, std::move(wormhole), setup, std::move(their_transit),
                           std::move(their_msg.m_offer));
  } // for (expected_type)

  assert(false && "Loop above always returns.");
  return std::nullopt;
} // request_file()

Receive_request::Receive_request(flow::log::Logger* logger_ptr, wormhole::Wormhole_ptr wormhole, Transit_setup setup,
                                 Peer_transit their_transit, Offer offer) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSFER),
  m_wormhole(std::move(wormhole)),
  m_setup(std::move(setup)),
  m_their_transit(std::move(their_transit)),
  m_offer(std::move(offer))
{
  // That's it.
}

const Offer& Receive_request::offer() const
{
  return m_offer;
}

void Receive_request::accept(std::ostream* file, const Progress_func& on_progress, const Cancel_future& cancel,
                             Error_code* err_code)
{
  assert(err_code);
  assert(m_wormhole && "Receive_request used after accept() or reject().");

  Peer_message answer{};
  answer.m_type = Peer_message::Type::S_ANSWER;
  send_peer_message(m_wormhole.get(), answer, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Receiver: Could not answer offer [" << m_offer << "]: [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return;
  }
  // else

  FLOW_LOG_INFO("Receiver: Accepted offer [" << m_offer << "].  Connecting data channel.");

  const auto transit = m_setup.m_connector->connect(transit::Role::S_FOLLOWER, m_wormhole->transit_key(),
                                                    m_setup.m_abilities, m_their_transit.m_abilities,
                                                    m_setup.m_relay_hints, m_their_transit.m_relay_hints,
                                                    cancel, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Receiver: Data channel failed: [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  FLOW_LOG_INFO("Receiver: Data channel up: [" << transit->info() << "].");
  if (m_setup.m_on_transit)
  {
    m_setup.m_on_transit(transit->info());
  }

  const auto total = m_offer.m_file_size;
  if (on_progress)
  {
    on_progress(0, total);
  }

  boost::crc_32_type crc;
  Blob record;
  uint64_t received = 0;
  while (received != total)
  {
    if (cancel_requested(cancel))
    {
      FLOW_LOG_INFO("Receiver: Canceled after [" << received << "] of [" << total << "] bytes.");
      *err_code = error::Code::S_TRANSFER_CANCELED;
      return;
    }
    // else

    transit->receive_record(&record, cancel, err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("Receiver: Receiving record failed after [" << received << "] of [" << total << "] bytes: "
                       "[" << *err_code << "] [" << err_code->message() << "].");
      return;
    }
    // else

    // On failure past this point, tell the sender not to wait for a good acknowledgment.
    const auto send_failure_ack = [&]()
    {
      Error_code ack_err_code;
      transit->send_record(encode_transfer_ack({ false, 0 }), &ack_err_code);
      if (ack_err_code)
      {
        FLOW_LOG_TRACE("Receiver: Failure acknowledgment not delivered: [" << ack_err_code << "].");
      }
    };

    if (record.size() > (total - received))
    {
      FLOW_LOG_WARNING("Receiver: Sender sent more than the [" << total << "] bytes offered.");
      send_failure_ack();
      *err_code = error::Code::S_TRANSFER_SIZE_MISMATCH;
      return;
    }
    // else

    file->write(reinterpret_cast<const char*>(record.data()), record.size());
    if (!*file)
    {
      FLOW_LOG_WARNING("Receiver: Writing to destination failed after [" << received << "] of [" << total << "] "
                       "bytes.");
      send_failure_ack();
      *err_code = boost::system::errc::make_error_code(boost::system::errc::io_error);
      return;
    }
    // else

    crc.process_bytes(record.data(), record.size());
    received += record.size();
    FLOW_LOG_TRACE("Receiver: Received [" << received << "] of [" << total << "] bytes.");
    if (on_progress)
    {
      on_progress(received, total);
    }
  } // while (received != total)

  file->flush();
  const bool ok = bool(*file);
  transit->send_record(encode_transfer_ack({ ok, ok ? uint32_t(crc.checksum()) : 0 }), err_code);
  if (!ok)
  {
    FLOW_LOG_WARNING("Receiver: Flushing destination failed.");
    *err_code = boost::system::errc::make_error_code(boost::system::errc::io_error);
    return;
  }
  // else
  if (*err_code)
  {
    FLOW_LOG_WARNING("Receiver: Got all [" << total << "] bytes but could not acknowledge: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  FLOW_LOG_INFO("Receiver: Transfer of [" << m_offer << "] complete.");
} // Receive_request::accept()

void Receive_request::reject(Error_code* err_code)
{
  assert(err_code);

  Peer_message rejection{};
  rejection.m_type = Peer_message::Type::S_ERROR;
  rejection.m_error = S_REJECTION_REASON;
  send_peer_message(m_wormhole.get(), rejection, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Receiver: Could not reject offer [" << m_offer << "]: [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return;
  }
  // else

  FLOW_LOG_INFO("Receiver: Rejected offer [" << m_offer << "].");
}

} // namespace pylon::transfer
