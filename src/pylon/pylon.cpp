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
#include "pylon/pylon.hpp"
#include "pylon/error.hpp"
#include "pylon/schema/peer.capnp.h"
#include <capnp/message.h>
#include <capnp/compat/json.h>
#include <boost/filesystem/fstream.hpp>
#include <cerrno>
#include <sstream>

namespace pylon
{

namespace
{

/**
 * The error behind a just-failed file stream open, from `errno` (which the caller zeroed before opening).
 *
 * @return See above.
 */
Error_code open_error()
{
  using boost::system::system_category;
  // using ::errno; // It's a macro apparently.

  const int sys_errno = errno;
  return Error_code((sys_errno == 0) ? EIO : sys_errno, system_category());
}

} // namespace (anon)

// Implementations.

Pylon::Pylon(flow::log::Logger* logger_ptr, const Config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_config(config),
  m_async_worker(get_logger(), "pylon_async")
{
  assert(m_config.m_rendezvous && m_config.m_transit_connector);

  m_async_worker.start();
  FLOW_LOG_INFO("Pylon [" << *this << "]: Created with config [" << m_config << "].");
}

Pylon::~Pylon()
{
  FLOW_LOG_INFO("Pylon [" << *this << "]: Shutting down.  Async operation in progress, if any, is allowed to "
                "finish first.");
  m_async_worker.stop();

  if (m_handshake)
  {
    FLOW_LOG_INFO("Pylon [" << *this << "]: Abandoning pending handshake; its code is released.");
    release_code(*m_handshake);
  }
  if (m_transfer_request)
  {
    FLOW_LOG_INFO("Pylon [" << *this << "]: Abandoning pending offer [" << m_transfer_request->offer() << "].  "
                  "No graceful teardown is performed; the peer will see the channel close.");
  }
}

std::string Pylon::gen_code(size_t code_length, Error_code* err_code)
{
  std::string code_str;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> std::string { return gen_code(code_length, actual_err_code); },
         &code_str, err_code, "Pylon::gen_code()"))
  {
    return code_str;
  }
  // else

  if (m_handshake)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: gen_code() invoked while a handshake is already pending; "
                     "send_file() must consume it first.");
    *err_code = error::Code::S_HANDSHAKE_ALREADY_PENDING;
    return code_str;
  }
  // else
  if (code_length == 0)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: gen_code() invoked with zero code length.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return code_str;
  }
  // else

  wormhole::App_config app;
  make_app_config(&app, err_code);
  if (*err_code)
  {
    return code_str;
  }
  // else

  wormhole::Code code;
  auto handshake = m_config.m_rendezvous->connect_without_code(app, code_length, &code, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Could not allocate code: [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return code_str;
  }
  // else

  code_str = code.str();
  m_handshake = Pending_handshake{ std::move(app), std::move(code), std::move(handshake) };
  FLOW_LOG_INFO("Pylon [" << *this << "]: Allocated [" << code_length << "]-word code with nameplate "
                "[" << code.nameplate() << "]; handshake pending.");
  return code_str;
} // Pylon::gen_code()

void Pylon::send_file(const fs::path& file_path, const Progress_func& on_progress, const Cancel_future& cancel,
                      Error_code* err_code)
{
  using boost::system::system_error;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send_file(file_path, on_progress, cancel, actual_err_code); },
         err_code, "Pylon::send_file()"))
  {
    return;
  }
  // else

  if (!m_handshake)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: send_file() invoked with no handshake pending; gen_code() first.");
    *err_code = error::Code::S_NO_ACTIVE_HANDSHAKE;
    return;
  }
  // else

  // The handshake is used up from here on, whatever happens.
  const auto ticket = std::move(*m_handshake);
  m_handshake.reset();
  auto handshake = ticket.m_handshake;

  const auto file_name = file_path.filename();
  if ((!file_path.has_filename()) || (file_name == ".") || (file_name == ".."))
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Path [" << file_path << "] does not name a file.");
    *err_code = error::Code::S_INVALID_FILE_NAME;
    release_code(ticket);
    return;
  }
  // else

  transfer::Offer offer;
  offer.m_file_name = file_name.string();
  offer.m_file_size = fs::file_size(file_path, *err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Could not get size of [" << file_path << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    release_code(ticket);
    return;
  }
  // else

  errno = 0;
  fs::ifstream file(file_path, std::ios::binary);
  if (!file)
  {
    *err_code = open_error();
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Could not open [" << file_path << "] for reading: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    release_code(ticket);
    return;
  }
  // else

  transfer::Transit_setup setup;
  make_transit_setup(&setup, err_code);
  if (*err_code)
  {
    release_code(ticket);
    return;
  }
  // else

  FLOW_LOG_INFO("Pylon [" << *this << "]: Will send [" << offer << "] from [" << file_path << "].  "
                "Awaiting peer's redemption of code.");

  if (!wait_unless_canceled(&handshake, cancel))
  {
    FLOW_LOG_INFO("Pylon [" << *this << "]: Canceled while awaiting peer.");
    *err_code = error::Code::S_TRANSFER_CANCELED;
    release_code(ticket);
    return;
  }
  // else

  wormhole::Wormhole_ptr wormhole;
  try
  {
    wormhole = handshake.get();
  }
  catch (const system_error& exc)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Handshake failed: [" << exc.what() << "].");
    *err_code = exc.code();
    return;
  }
  catch (const boost::future_error& exc)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Rendezvous abandoned the handshake: [" << exc.what() << "].");
    *err_code = error::Code::S_CHANNEL_CLOSED;
    return;
  }

  FLOW_LOG_INFO("Pylon [" << *this << "]: Handshake complete.  Sending.");

  transfer::send_file(get_logger(), wormhole.get(), setup, &file, offer, on_progress, cancel, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Sending [" << offer << "] failed: [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return;
  }
  // else

  FLOW_LOG_INFO("Pylon [" << *this << "]: Sent [" << offer << "].");
} // Pylon::send_file()

void Pylon::request_file(const std::string& code_str, const Cancel_future& cancel, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { request_file(code_str, cancel, actual_err_code); },
         err_code, "Pylon::request_file()"))
  {
    return;
  }
  // else

  if (m_transfer_request)
  {
    FLOW_LOG_INFO("Pylon [" << *this << "]: request_file() discards the pending offer "
                  "[" << m_transfer_request->offer() << "].");
    m_transfer_request.reset();
  }

  transfer::Transit_setup setup;
  make_transit_setup(&setup, err_code);
  if (*err_code)
  {
    return;
  }
  // else
  wormhole::App_config app;
  make_app_config(&app, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  const auto code = wormhole::Code::parse(code_str, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Code is malformed.");
    FLOW_LOG_TRACE("Pylon [" << *this << "]: Malformed code: [" << code_str << "].");
    return;
  }
  // else

  FLOW_LOG_INFO("Pylon [" << *this << "]: Redeeming code with nameplate [" << code.nameplate() << "].");

  auto wormhole = m_config.m_rendezvous->connect_with_code(app, code, cancel, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Handshake failed: [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return;
  }
  // else

  auto request = transfer::request_file(get_logger(), std::move(wormhole), setup, cancel, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Awaiting offer failed: [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return;
  }
  // else

  if (!request)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Peer sent no offer; nothing to receive.");
    return;
  }
  // else

  FLOW_LOG_INFO("Pylon [" << *this << "]: Offer [" << request->offer() << "] pending.");
  m_transfer_request = std::move(request);
} // Pylon::request_file()

void Pylon::receive_file(const fs::path& destination, const Progress_func& on_progress, const Cancel_future& cancel,
                         Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { receive_file(destination, on_progress, cancel, actual_err_code); },
         err_code, "Pylon::receive_file()"))
  {
    return;
  }
  // else

  if (!m_transfer_request)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: receive_file() invoked with no offer pending; "
                     "request_file() first.");
    *err_code = error::Code::S_NO_ACTIVE_TRANSFER_REQUEST;
    return;
  }
  // else

  // The offer is used up from here on, whatever happens.
  auto request = std::move(*m_transfer_request);
  m_transfer_request.reset();

  // If we cannot take the file, say so, so the sender does not wait for an answer forever.
  const auto decline = [&]()
  {
    Error_code reject_err_code;
    request.reject(&reject_err_code);
    if (reject_err_code)
    {
      FLOW_LOG_INFO("Pylon [" << *this << "]: Sender did not get our refusal: [" << reject_err_code << "].");
    }
  };

  if (!m_config.m_allow_overwrite)
  {
    Error_code exists_err_code;
    if (fs::exists(destination, exists_err_code) || exists_err_code)
    {
      FLOW_LOG_WARNING("Pylon [" << *this << "]: Destination [" << destination << "] exists (or cannot be "
                       "checked: [" << exists_err_code << "]), and overwriting is not allowed.  Declining offer.");
      decline();
      *err_code = exists_err_code ? exists_err_code : Error_code(error::Code::S_DESTINATION_EXISTS);
      return;
    }
  }
  // else

  errno = 0;
  fs::ofstream file(destination, std::ios::binary | std::ios::trunc);
  if (!file)
  {
    *err_code = open_error();
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Could not create [" << destination << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].  Declining offer.");
    decline();
    return;
  }
  // else

  const auto offer = request.offer();
  FLOW_LOG_INFO("Pylon [" << *this << "]: Receiving [" << offer << "] into [" << destination << "].");

  request.accept(&file, on_progress, cancel, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Receiving [" << offer << "] failed: [" << *err_code << "] "
                     "[" << err_code->message() << "].  Partial file, if any, is left in place.");
    return;
  }
  // else

  FLOW_LOG_INFO("Pylon [" << *this << "]: Received [" << offer << "].");
} // Pylon::receive_file()

void Pylon::reject_file(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { reject_file(actual_err_code); },
         err_code, "Pylon::reject_file()"))
  {
    return;
  }
  // else

  if (!m_transfer_request)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: reject_file() invoked with no offer pending.");
    *err_code = error::Code::S_NO_ACTIVE_TRANSFER_REQUEST;
    return;
  }
  // else

  auto request = std::move(*m_transfer_request);
  m_transfer_request.reset();

  request.reject(err_code);
}

void Pylon::release_code(const Pending_handshake& ticket)
{
  m_config.m_rendezvous->release_code(ticket.m_app, ticket.m_code);
}

bool Pylon::has_pending_handshake() const
{
  return bool(m_handshake);
}

std::optional<transfer::Offer> Pylon::transfer_offer() const
{
  if (!m_transfer_request)
  {
    return std::nullopt;
  }
  // else
  return m_transfer_request->offer();
}

std::string Pylon::to_json() const
{
  using Ability = transit::Abilities::Ability;

  capnp::MallocMessageBuilder capnp_msg;
  auto root = capnp_msg.initRoot<schema::PylonView>();
  root.setId(m_config.m_id.c_str());
  root.setRelayUrl(m_config.m_relay_url.c_str());
  root.setRendezvousUrl(m_config.m_rendezvous_url.c_str());
  root.setAllowOverwrite(m_config.m_allow_overwrite);

  std::vector<schema::Ability> abilities;
  for (size_t idx = 0; idx != size_t(Ability::S_END_SENTINEL); ++idx)
  {
    if (m_config.m_abilities.has(Ability(idx)))
    {
      abilities.push_back(schema::Ability(idx));
    }
  }
  auto abilities_root = root.initAbilities(abilities.size());
  for (size_t idx = 0; idx != abilities.size(); ++idx)
  {
    abilities_root.set(idx, abilities[idx]);
  }

  capnp::JsonCodec codec;
  const auto json = codec.encode(root.asReader());
  return std::string(json.cStr(), json.size());
}

const Config& Pylon::config() const
{
  return m_config;
}

void Pylon::make_app_config(wormhole::App_config* app, Error_code* err_code) const
{
  app->m_id = m_config.m_id;
  app->m_rendezvous_url = parse_url(m_config.m_rendezvous_url, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Rendezvous URL [" << m_config.m_rendezvous_url << "] is malformed.");
  }
}

void Pylon::make_transit_setup(transfer::Transit_setup* setup, Error_code* err_code) const
{
  auto relay_hint = transit::Relay_hint::from_urls(std::nullopt, { m_config.m_relay_url }, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Pylon [" << *this << "]: Relay URL [" << m_config.m_relay_url << "] is unusable: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  setup->m_connector = m_config.m_transit_connector;
  setup->m_abilities = m_config.m_abilities;
  setup->m_relay_hints = { std::move(relay_hint) };
  setup->m_on_transit = m_config.m_transit_handler;
}

std::ostream& operator<<(std::ostream& os, const Pylon& val)
{
  return os << '[' << val.config().m_id << "]@" << static_cast<const void*>(&val);
}

} // namespace pylon
