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
#include "pylon/wormhole/loopback_rendezvous.hpp"
#include "pylon/error.hpp"
#include <boost/algorithm/hex.hpp>
#include <boost/random/random_device.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/exception_ptr.hpp>
#include <boost/make_shared.hpp>
#include <iterator>
#include <sstream>

namespace pylon::wormhole
{

// Types.

/// Our end of a Loopback_pipe used as the mailbox; closing it on destruction is what the peer observes.
class Loopback_rendezvous::Loopback_wormhole :
  public Wormhole,
  private boost::noncopyable
{
public:
  Loopback_wormhole(detail::Loopback_pipe_ptr pipe, size_t side, const std::string& transit_key) :
    m_pipe(std::move(pipe)),
    m_side(side),
    m_transit_key(transit_key)
  {
    // That's it.
  }

  ~Loopback_wormhole() override
  {
    m_pipe->close(m_side);
  }

  void send(const Blob& msg, Error_code* err_code) override
  {
    m_pipe->send(m_side, msg, err_code);
  }

  void receive(Blob* msg, const Cancel_future& cancel, Error_code* err_code) override
  {
    m_pipe->receive(m_side, msg, cancel, err_code);
  }

  const std::string& transit_key() const override
  {
    return m_transit_key;
  }

private:
  const detail::Loopback_pipe_ptr m_pipe;
  const size_t m_side;
  const std::string m_transit_key;
}; // class Loopback_rendezvous::Loopback_wormhole

// Implementations.

Loopback_rendezvous::Loopback_rendezvous(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_WORMHOLE),
  m_reachable(true),
  m_next_nameplate(1)
{
  // That's it.
}

Loopback_rendezvous::~Loopback_rendezvous()
{
  boost::lock_guard<boost::mutex> lock(m_mutex);
  if (!m_allocations.empty())
  {
    FLOW_LOG_INFO("Loopback_rendezvous [" << this << "]: Shutting down with [" << m_allocations.size() << "] "
                  "codes never redeemed; their handshakes will fail.");
  }
  for (const auto& key_and_allocation : m_allocations)
  {
    key_and_allocation.second->m_wormhole_promise.set_exception
      (boost::copy_exception(flow::error::Runtime_error(error::Code::S_CHANNEL_CLOSED,
                                                        "Loopback_rendezvous::~Loopback_rendezvous()")));
  }
}

Rendezvous_ptr Loopback_rendezvous::default_instance() // Static.
{
  static const Rendezvous_ptr s_instance = boost::make_shared<Loopback_rendezvous>(nullptr);
  return s_instance;
}

void Loopback_rendezvous::set_reachable(bool reachable)
{
  boost::lock_guard<boost::mutex> lock(m_mutex);
  FLOW_LOG_INFO("Loopback_rendezvous [" << this << "]: Reachable: [" << m_reachable << "] => [" << reachable << "].");
  m_reachable = reachable;
}

Handshake Loopback_rendezvous::connect_without_code(const App_config& app, size_t code_length, Code* code,
                                                    Error_code* err_code)
{
  assert(err_code && code);
  assert(code_length != 0);

  boost::lock_guard<boost::mutex> lock(m_mutex);

  if (!m_reachable)
  {
    FLOW_LOG_WARNING("Loopback_rendezvous [" << this << "]: [" << app << "]: Cannot allocate code: unreachable.");
    *err_code = error::Code::S_RENDEZVOUS_UNREACHABLE;
    return Handshake();
  }
  // else

  const auto nameplate = m_next_nameplate++;
  const auto allocation = boost::make_shared<Allocation>();
  allocation->m_code = Code::generate(nameplate, code_length);
  Handshake handshake(allocation->m_wormhole_promise.get_future());
  m_allocations.emplace(nameplate_key(app, allocation->m_code.nameplate()), allocation);

  FLOW_LOG_INFO("Loopback_rendezvous [" << this << "]: [" << app << "]: Allocated nameplate [" << nameplate << "] "
                "with [" << code_length << "]-word code; awaiting peer.");
  FLOW_LOG_TRACE("Loopback_rendezvous [" << this << "]: Code is [" << allocation->m_code << "].");

  *code = allocation->m_code;
  err_code->clear();
  return handshake;
} // Loopback_rendezvous::connect_without_code()

Wormhole_ptr Loopback_rendezvous::connect_with_code(const App_config& app, const Code& code,
                                                    const Cancel_future& cancel, Error_code* err_code)
{
  using boost::copy_exception;
  using flow::error::Runtime_error;

  assert(err_code);

  if (code.empty())
  {
    *err_code = error::Code::S_MALFORMED_CODE;
    return Wormhole_ptr();
  }
  // else
  if (cancel_requested(cancel))
  {
    *err_code = error::Code::S_TRANSFER_CANCELED;
    return Wormhole_ptr();
  }
  // else

  Allocation_ptr allocation;
  {
    boost::lock_guard<boost::mutex> lock(m_mutex);

    if (!m_reachable)
    {
      FLOW_LOG_WARNING("Loopback_rendezvous [" << this << "]: [" << app << "]: Cannot redeem code: unreachable.");
      *err_code = error::Code::S_RENDEZVOUS_UNREACHABLE;
      return Wormhole_ptr();
    }
    // else

    const auto key = nameplate_key(app, code.nameplate());
    if (m_used.count(key) != 0)
    {
      FLOW_LOG_WARNING("Loopback_rendezvous [" << this << "]: [" << app << "]: Nameplate [" << code.nameplate() << "] "
                       "was already used.");
      *err_code = error::Code::S_CODE_ALREADY_USED;
      return Wormhole_ptr();
    }
    // else

    const auto allocation_it = m_allocations.find(key);
    if (allocation_it == m_allocations.end())
    {
      FLOW_LOG_WARNING("Loopback_rendezvous [" << this << "]: [" << app << "]: Nameplate [" << code.nameplate() << "] "
                       "has no peer waiting on it.");
      *err_code = error::Code::S_PEER_ABSENT;
      return Wormhole_ptr();
    }
    // else

    // One attempt per code, successful or not.
    allocation = allocation_it->second;
    m_allocations.erase(allocation_it);
    m_used.insert(key);
  } // lock_guard lock(m_mutex)

  if (allocation->m_code.password() != code.password())
  {
    FLOW_LOG_WARNING("Loopback_rendezvous [" << this << "]: [" << app << "]: Nameplate [" << code.nameplate() << "]: "
                     "Key agreement failed: the peers' passwords differ.  Failing both sides.");
    allocation->m_wormhole_promise.set_exception
      (copy_exception(Runtime_error(error::Code::S_AUTHENTICATION_MISMATCH,
                                    "Loopback_rendezvous::connect_with_code()")));
    *err_code = error::Code::S_AUTHENTICATION_MISMATCH;
    return Wormhole_ptr();
  }
  // else

  const auto pipe = boost::make_shared<detail::Loopback_pipe>();
  const auto transit_key = make_transit_key();
  allocation->m_wormhole_promise.set_value(boost::make_shared<Loopback_wormhole>(pipe, 0, transit_key));

  FLOW_LOG_INFO("Loopback_rendezvous [" << this << "]: [" << app << "]: Nameplate [" << code.nameplate() << "]: "
                "Handshake complete.");

  err_code->clear();
  return boost::make_shared<Loopback_wormhole>(pipe, 1, transit_key);
} // Loopback_rendezvous::connect_with_code()

void Loopback_rendezvous::release_code(const App_config& app, const Code& code)
{
  Allocation_ptr allocation;
  {
    boost::lock_guard<boost::mutex> lock(m_mutex);

    const auto key = nameplate_key(app, code.nameplate());
    const auto allocation_it = m_allocations.find(key);
    if ((allocation_it == m_allocations.end()) || (!(allocation_it->second->m_code == code)))
    {
      FLOW_LOG_TRACE("Loopback_rendezvous [" << this << "]: [" << app << "]: Nameplate [" << code.nameplate() << "] "
                     "is not awaiting a peer under that code; nothing to release.");
      return;
    }
    // else

    allocation = allocation_it->second;
    m_allocations.erase(allocation_it);
    m_used.insert(key);
  } // lock_guard lock(m_mutex)

  FLOW_LOG_INFO("Loopback_rendezvous [" << this << "]: [" << app << "]: Nameplate [" << code.nameplate() << "] "
                "released by its allocator; the code is now worthless.");
  allocation->m_wormhole_promise.set_exception
    (boost::copy_exception(flow::error::Runtime_error(error::Code::S_TRANSFER_CANCELED,
                                                      "Loopback_rendezvous::release_code()")));
} // Loopback_rendezvous::release_code()

std::string Loopback_rendezvous::nameplate_key(const App_config& app, const std::string& nameplate) // Static.
{
  std::ostringstream os;
  os << app.m_rendezvous_url << ' ' << app.m_id << ' ' << nameplate;
  return os.str();
}

std::string Loopback_rendezvous::make_transit_key() // Static.
{
  constexpr size_t KEY_SZ = 32;

  boost::random::random_device rng;
  boost::random::uniform_int_distribution<unsigned int> byte_dist(0, 255);

  std::vector<uint8_t> key_bytes(KEY_SZ);
  for (auto& key_byte : key_bytes)
  {
    key_byte = static_cast<uint8_t>(byte_dist(rng));
  }

  std::string key;
  boost::algorithm::hex(key_bytes.begin(), key_bytes.end(), std::back_inserter(key));
  return key;
}

} // namespace pylon::wormhole
