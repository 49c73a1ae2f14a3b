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
#include "pylon/detail/loopback_pipe.hpp"
#include "pylon/error.hpp"

namespace pylon::detail
{

// Implementations.

Loopback_pipe::Loopback_pipe() :
  m_closed{ { false, false } }
{
  // That's it.
}

void Loopback_pipe::send(size_t from_side, const Blob& msg, Error_code* err_code)
{
  assert(from_side < 2);
  const size_t to_side = 1 - from_side;

  {
    boost::lock_guard<boost::mutex> lock(m_mutex);
    if (m_closed[from_side] || m_closed[to_side])
    {
      *err_code = error::Code::S_CHANNEL_CLOSED;
      return;
    }
    // else
    m_inboxes[to_side].push_back(msg);
  }
  m_state_changed.notify_all();
  err_code->clear();
}

void Loopback_pipe::receive(size_t to_side, Blob* msg, const Cancel_future& cancel, Error_code* err_code)
{
  assert(to_side < 2);

  boost::unique_lock<boost::mutex> lock(m_mutex);
  auto& inbox = m_inboxes[to_side];
  while (true)
  {
    if (!inbox.empty())
    {
      *msg = std::move(inbox.front());
      inbox.pop_front();
      err_code->clear();
      return;
    }
    // else
    if (m_closed[0] || m_closed[1])
    {
      *err_code = error::Code::S_CHANNEL_CLOSED;
      return;
    }
    // else
    if (cancel_requested(cancel))
    {
      *err_code = error::Code::S_TRANSFER_CANCELED;
      return;
    }
    // else

    /* The cancel signal is a future and cannot notify our condition variable, so wake up periodically to
     * check it.  A queued message or a close wakes us immediately. */
    m_state_changed.wait_for(lock, S_CANCEL_POLL_PERIOD);
  }
} // Loopback_pipe::receive()

void Loopback_pipe::close(size_t side)
{
  assert(side < 2);
  {
    boost::lock_guard<boost::mutex> lock(m_mutex);
    m_closed[side] = true;
  }
  m_state_changed.notify_all();
}

} // namespace pylon::detail
