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
#include "pylon/transit/loopback_connector.hpp"
#include "pylon/error.hpp"
#include <boost/make_shared.hpp>
#include <boost/exception_ptr.hpp>
#include <boost/move/make_unique.hpp>
#include <sstream>

namespace pylon::transit
{

// Types.

/// Our end of a Loopback_pipe; closing it on destruction is what the peer observes as the channel going away.
class Loopback_connector::Loopback_transit :
  public Transit,
  private boost::noncopyable
{
public:
  Loopback_transit(detail::Loopback_pipe_ptr&& pipe, size_t side, Transit_info&& info) :
    m_pipe(std::move(pipe)),
    m_side(side),
    m_info(std::move(info))
  {
    // That's it.
  }

  ~Loopback_transit() override
  {
    m_pipe->close(m_side);
  }

  void send_record(const Blob& record, Error_code* err_code) override
  {
    m_pipe->send(m_side, record, err_code);
  }

  void receive_record(Blob* record, const Cancel_future& cancel, Error_code* err_code) override
  {
    m_pipe->receive(m_side, record, cancel, err_code);
  }

  const Transit_info& info() const override
  {
    return m_info;
  }

private:
  const detail::Loopback_pipe_ptr m_pipe;
  const size_t m_side;
  const Transit_info m_info;
}; // class Loopback_connector::Loopback_transit

// Implementations.

Loopback_connector::Loopback_connector(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSIT)
{
  // That's it.
}

Loopback_connector::~Loopback_connector()
{
  boost::lock_guard<boost::mutex> lock(m_mutex);
  if (!m_waiters.empty())
  {
    FLOW_LOG_INFO("Loopback_connector [" << this << "]: Shutting down with [" << m_waiters.size() << "] "
                  "connect()s still awaiting their peers; they will fail.");
  }
  for (const auto& key_and_waiter : m_waiters)
  {
    key_and_waiter.second->m_pipe_promise.set_exception
      (boost::copy_exception(flow::error::Runtime_error(error::Code::S_CHANNEL_CLOSED,
                                                        "Loopback_connector::~Loopback_connector()")));
  }
}

Connector_ptr Loopback_connector::default_instance() // Static.
{
  static const Connector_ptr s_instance = boost::make_shared<Loopback_connector>(nullptr);
  return s_instance;
}

Transit_ptr Loopback_connector::connect(Role role, const std::string& transit_key,
                                       const Abilities& our_abilities, const Abilities& their_abilities,
                                       const Relay_hints& our_hints, const Relay_hints& their_hints,
                                       const Cancel_future& cancel, Error_code* err_code)
{
  using boost::lock_guard;
  using boost::unique_lock;

  assert(err_code);

  Transit_info info;
  if (!choose_conn_type(our_abilities, their_abilities, our_hints, their_hints, &info.m_conn_type))
  {
    FLOW_LOG_WARNING("Loopback_connector [" << this << "]: As [" << role << "]: Our abilities "
                     "[" << our_abilities << "] and peer's [" << their_abilities << "] (with "
                     "[" << our_hints.size() << "] + [" << their_hints.size() << "] relay hints) have no "
                     "way of connecting in common.");
    *err_code = error::Code::S_TRANSIT_NO_COMMON_ABILITY;
    return Transit_ptr();
  }
  // else

  if (info.m_conn_type == Transit_info::Conn_type::S_DIRECT)
  {
    info.m_peer_addr = "loopback";
  }
  else
  {
    // Leader's relay if it offered one (follower connects to the same one); else follower's.
    const auto& leader_hints = (role == Role::S_LEADER) ? our_hints : their_hints;
    const auto& follower_hints = (role == Role::S_LEADER) ? their_hints : our_hints;
    const auto& hints = leader_hints.empty() ? follower_hints : leader_hints;
    std::ostringstream os;
    os << hints.front().m_endpoints.front();
    info.m_peer_addr = os.str();
  }

  // Leader always gets side 0 of the pipe.
  const size_t side = (role == Role::S_LEADER) ? 0 : 1;

  unique_lock<boost::mutex> lock(m_mutex);

  if (m_abandoned.erase(transit_key) != 0)
  {
    lock.unlock();
    FLOW_LOG_WARNING("Loopback_connector [" << this << "]: As [" << role << "]: Peer gave up on this data channel "
                     "before we arrived.");
    *err_code = error::Code::S_CHANNEL_CLOSED;
    return Transit_ptr();
  }
  // else

  const auto waiter_it = m_waiters.find(transit_key);
  if (waiter_it != m_waiters.end())
  {
    // Peer is here already: we complete the pairing.
    const auto waiter = waiter_it->second;
    if (waiter->m_role == role)
    {
      FLOW_LOG_WARNING("Loopback_connector [" << this << "]: As [" << role << "]: The party already waiting "
                       "under our transit key has the same role; refusing to pair.");
      *err_code = error::Code::S_INVALID_ARGUMENT;
      return Transit_ptr();
    }
    // else
    m_waiters.erase(waiter_it);
    lock.unlock();

    auto pipe = boost::make_shared<detail::Loopback_pipe>();
    waiter->m_pipe_promise.set_value(pipe);

    FLOW_LOG_INFO("Loopback_connector [" << this << "]: As [" << role << "]: Paired with waiting peer; "
                  "channel [" << info << "].");
    err_code->clear();
    return boost::movelib::make_unique<Loopback_transit>(std::move(pipe), side, std::move(info));
  }
  // else: We are first.  Wait for the peer (or cancellation).

  const auto waiter = boost::make_shared<Waiter>();
  waiter->m_role = role;
  auto pipe_future = waiter->m_pipe_promise.get_future();
  m_waiters.emplace(transit_key, waiter);
  lock.unlock();

  FLOW_LOG_TRACE("Loopback_connector [" << this << "]: As [" << role << "]: Awaiting peer.");

  if (!wait_unless_canceled(&pipe_future, cancel))
  {
    lock.lock();
    const auto our_it = m_waiters.find(transit_key);
    if ((our_it != m_waiters.end()) && (our_it->second == waiter))
    {
      m_waiters.erase(our_it);
      m_abandoned.insert(transit_key);
      lock.unlock();

      FLOW_LOG_INFO("Loopback_connector [" << this << "]: As [" << role << "]: Canceled while awaiting peer; "
                    "peer arriving later will be told we are gone.");
      *err_code = error::Code::S_TRANSFER_CANCELED;
      return Transit_ptr();
    }
    // else: Peer paired with us concurrently with the cancellation.  Take our end only to close it.
    lock.unlock();
    pipe_future.wait();
  }
  // else

  detail::Loopback_pipe_ptr pipe;
  try
  {
    pipe = pipe_future.get();
  }
  catch (const boost::system::system_error& exc)
  {
    FLOW_LOG_WARNING("Loopback_connector [" << this << "]: As [" << role << "]: Pairing failed: "
                     "[" << exc.what() << "].");
    *err_code = exc.code();
    return Transit_ptr();
  }

  if (cancel_requested(cancel))
  {
    pipe->close(side);
    FLOW_LOG_INFO("Loopback_connector [" << this << "]: As [" << role << "]: Canceled just as peer arrived; "
                  "closed our end.");
    *err_code = error::Code::S_TRANSFER_CANCELED;
    return Transit_ptr();
  }
  // else

  FLOW_LOG_INFO("Loopback_connector [" << this << "]: As [" << role << "]: Peer arrived; "
                "channel [" << info << "].");
  err_code->clear();
  return boost::movelib::make_unique<Loopback_transit>(std::move(pipe), side, std::move(info));
} // Loopback_connector::connect()

void Loopback_connector::abandon(const std::string& transit_key)
{
  Waiter_ptr waiter;
  {
    boost::lock_guard<boost::mutex> lock(m_mutex);
    const auto waiter_it = m_waiters.find(transit_key);
    if (waiter_it == m_waiters.end())
    {
      m_abandoned.insert(transit_key);
    }
    else
    {
      waiter = waiter_it->second;
      m_waiters.erase(waiter_it);
    }
  }

  if (waiter)
  {
    FLOW_LOG_INFO("Loopback_connector [" << this << "]: Abandoning data channel; failing the [" << waiter->m_role << "] "
                  "awaiting us.");
    waiter->m_pipe_promise.set_exception
      (boost::copy_exception(flow::error::Runtime_error(error::Code::S_CHANNEL_CLOSED,
                                                        "Loopback_connector::abandon()")));
    return;
  }
  // else
  FLOW_LOG_INFO("Loopback_connector [" << this << "]: Abandoning data channel before peer arrived.");
} // Loopback_connector::abandon()

} // namespace pylon::transit
