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
#include "pylon/transfer/peer_message.hpp"
#include "pylon/error.hpp"
#include "pylon/schema/peer.capnp.h"
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/array.h>
#include <kj/exception.h>
#include <cstring>
#include <sstream>

namespace pylon::transfer
{

namespace
{

/**
 * File-local helper: serializes a Cap'n Proto message into flat bytes.
 *
 * @param msg
 *        Message.
 * @return See above.
 */
Blob to_blob(capnp::MessageBuilder* msg)
{
  const auto words = capnp::messageToFlatArray(*msg);
  const auto bytes = words.asBytes();
  return Blob(bytes.begin(), bytes.end());
}

/**
 * File-local helper: copies flat bytes into word-aligned storage for `capnp::FlatArrayMessageReader`.
 *
 * @param blob
 *        Bytes.
 * @param words
 *        On success, set to the storage.
 * @return `false` if the size cannot be that of a Cap'n Proto message.
 */
bool to_words(const Blob& blob, kj::Array<capnp::word>* words)
{
  if (blob.empty() || ((blob.size() % sizeof(capnp::word)) != 0))
  {
    return false;
  }
  // else
  *words = kj::heapArray<capnp::word>(blob.size() / sizeof(capnp::word));
  std::memcpy(words->begin(), blob.data(), blob.size());
  return true;
}

} // namespace (anon)

// Implementations.

Blob encode_peer_message(const Peer_message& msg)
{
  using transit::Abilities;
  using Ability = Abilities::Ability;

  capnp::MallocMessageBuilder capnp_msg;
  auto root = capnp_msg.initRoot<schema::PeerMessage>();

  switch (msg.m_type)
  {
  case Peer_message::Type::S_TRANSIT:
  {
    auto transit_root = root.initTransit();

    const auto& abilities = msg.m_transit.m_abilities;
    unsigned int n_abilities = 0;
    for (size_t idx = 0; idx != size_t(Ability::S_END_SENTINEL); ++idx)
    {
      n_abilities += abilities.has(Ability(idx)) ? 1 : 0;
    }
    auto abilities_root = transit_root.initAbilities(n_abilities);
    unsigned int out_idx = 0;
    for (size_t idx = 0; idx != size_t(Ability::S_END_SENTINEL); ++idx)
    {
      if (abilities.has(Ability(idx)))
      {
        abilities_root.set(out_idx++, schema::Ability(idx));
      }
    }

    const auto& hints = msg.m_transit.m_relay_hints;
    auto hints_root = transit_root.initRelayHints(hints.size());
    for (size_t hint_idx = 0; hint_idx != hints.size(); ++hint_idx)
    {
      const auto& hint = hints[hint_idx];
      auto hint_root = hints_root[hint_idx];
      hint_root.setName(hint.m_name.c_str());
      auto urls_root = hint_root.initUrls(hint.m_endpoints.size());
      for (size_t url_idx = 0; url_idx != hint.m_endpoints.size(); ++url_idx)
      {
        std::ostringstream os;
        os << hint.m_endpoints[url_idx];
        urls_root.set(url_idx, os.str().c_str());
      }
    }
    break;
  }

  case Peer_message::Type::S_OFFER:
  {
    auto offer_root = root.initOffer();
    offer_root.setFileName(msg.m_offer.m_file_name.c_str());
    offer_root.setFileSize(msg.m_offer.m_file_size);
    break;
  }

  case Peer_message::Type::S_ANSWER:
    root.setAnswer();
    break;

  case Peer_message::Type::S_ERROR:
    root.setError(msg.m_error.c_str());
    break;
  } // switch (msg.m_type)

  return to_blob(&capnp_msg);
} // encode_peer_message()

Peer_message decode_peer_message(const Blob& blob, Error_code* err_code)
{
  using transit::Relay_hint;
  using Ability = transit::Abilities::Ability;
  using std::string;

  assert(err_code);

  Peer_message msg{};
  kj::Array<capnp::word> words;
  if (!to_words(blob, &words))
  {
    *err_code = error::Code::S_MALFORMED_PEER_MESSAGE;
    return msg;
  }
  // else

  // Reader validates lazily, as fields are accessed; so everything below may throw.
  try
  {
    capnp::FlatArrayMessageReader capnp_msg(words);
    const auto root = capnp_msg.getRoot<schema::PeerMessage>();

    switch (root.which())
    {
    case schema::PeerMessage::TRANSIT:
    {
      msg.m_type = Peer_message::Type::S_TRANSIT;
      const auto transit_root = root.getTransit();

      for (const auto ability : transit_root.getAbilities())
      {
        // Abilities newer than ours are of no use to us; skip them.
        if (size_t(ability) < size_t(Ability::S_END_SENTINEL))
        {
          msg.m_transit.m_abilities.set(Ability(size_t(ability)));
        }
      }

      for (const auto hint_root : transit_root.getRelayHints())
      {
        std::vector<string> urls;
        for (const auto url : hint_root.getUrls())
        {
          urls.emplace_back(string(url));
        }
        const auto name = string(hint_root.getName());
        auto hint = Relay_hint::from_urls(name.empty() ? std::nullopt : std::optional<string>(name),
                                          urls, err_code);
        if (*err_code)
        {
          *err_code = error::Code::S_MALFORMED_PEER_MESSAGE;
          return msg;
        }
        // else
        msg.m_transit.m_relay_hints.emplace_back(std::move(hint));
      }
      break;
    }

    case schema::PeerMessage::OFFER:
    {
      msg.m_type = Peer_message::Type::S_OFFER;
      const auto offer_root = root.getOffer();
      msg.m_offer.m_file_name = string(offer_root.getFileName());
      msg.m_offer.m_file_size = offer_root.getFileSize();
      break;
    }

    case schema::PeerMessage::ANSWER:
      msg.m_type = Peer_message::Type::S_ANSWER;
      break;

    case schema::PeerMessage::ERROR:
      msg.m_type = Peer_message::Type::S_ERROR;
      msg.m_error = string(root.getError());
      break;

    default:
      // Union member newer than ours.
      *err_code = error::Code::S_MALFORMED_PEER_MESSAGE;
      return msg;
    } // switch (root.which())
  }
  catch (const kj::Exception&)
  {
    *err_code = error::Code::S_MALFORMED_PEER_MESSAGE;
    return msg;
  }

  err_code->clear();
  return msg;
} // decode_peer_message()

Blob encode_transfer_ack(const Transfer_ack& ack)
{
  capnp::MallocMessageBuilder capnp_msg;
  auto root = capnp_msg.initRoot<schema::TransferAck>();
  root.setOk(ack.m_ok);
  root.setCrc32(ack.m_crc32);
  return to_blob(&capnp_msg);
}

Transfer_ack decode_transfer_ack(const Blob& blob, Error_code* err_code)
{
  assert(err_code);

  Transfer_ack ack{ false, 0 };
  kj::Array<capnp::word> words;
  if (!to_words(blob, &words))
  {
    *err_code = error::Code::S_MALFORMED_PEER_MESSAGE;
    return ack;
  }
  // else

  try
  {
    capnp::FlatArrayMessageReader capnp_msg(words);
    const auto root = capnp_msg.getRoot<schema::TransferAck>();
    ack.m_ok = root.getOk();
    ack.m_crc32 = root.getCrc32();
  }
  catch (const kj::Exception&)
  {
    *err_code = error::Code::S_MALFORMED_PEER_MESSAGE;
    return ack;
  }

  err_code->clear();
  return ack;
}

std::ostream& operator<<(std::ostream& os, const Offer& val)
{
  return os << "file[" << val.m_file_name << "] size[" << val.m_file_size << ']';
}

std::ostream& operator<<(std::ostream& os, Peer_message::Type val)
{
  switch (val)
  {
  case Peer_message::Type::S_TRANSIT:
    return os << "transit";
  case Peer_message::Type::S_OFFER:
    return os << "offer";
  case Peer_message::Type::S_ANSWER:
    return os << "answer";
  case Peer_message::Type::S_ERROR:
    return os << "error";
  }
  return os << "unknown";
}

} // namespace pylon::transfer
