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
#include "pylon/transit/relay_hint.hpp"
#include "pylon/error.hpp"

namespace pylon::transit
{

// Static initializations.

const uint16_t Relay_hint::S_DEFAULT_WS_PORT = 80;
const uint16_t Relay_hint::S_DEFAULT_WSS_PORT = 443;

// Implementations.

Relay_hint Relay_hint::from_urls(const std::optional<std::string>& name, const std::vector<std::string>& urls,
                                 Error_code* err_code) // Static.
{
  Relay_hint hint;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Relay_hint { return from_urls(name, urls, actual_err_code); },
         &hint, err_code, "Relay_hint::from_urls()"))
  {
    return hint;
  }
  // else

  if (urls.empty())
  {
    *err_code = error::Code::S_RELAY_HINT_PARSE_FAILED;
    return hint;
  }
  // else

  if (name)
  {
    hint.m_name = *name;
  }

  for (const auto& url_str : urls)
  {
    auto url = parse_url(url_str, err_code);
    if (*err_code)
    {
      return hint;
    }
    // else

    if (url.m_scheme == "tcp")
    {
      if (!url.m_port)
      {
        *err_code = error::Code::S_RELAY_HINT_PARSE_FAILED;
        return hint;
      }
    }
    else if (url.m_scheme == "ws")
    {
      if (!url.m_port)
      {
        url.m_port = S_DEFAULT_WS_PORT;
      }
    }
    else if (url.m_scheme == "wss")
    {
      if (!url.m_port)
      {
        url.m_port = S_DEFAULT_WSS_PORT;
      }
    }
    else
    {
      *err_code = error::Code::S_RELAY_HINT_PARSE_FAILED;
      return hint;
    }

    hint.m_endpoints.emplace_back(std::move(url));
  } // for (url_str : urls)

  err_code->clear();
  return hint;
} // Relay_hint::from_urls()

bool operator==(const Relay_hint& val1, const Relay_hint& val2)
{
  return (val1.m_name == val2.m_name) && (val1.m_endpoints == val2.m_endpoints);
}

std::ostream& operator<<(std::ostream& os, const Relay_hint& val)
{
  os << "relay[" << (val.m_name.empty() ? "-" : val.m_name) << "] endpoints[";
  for (size_t idx = 0; idx != val.m_endpoints.size(); ++idx)
  {
    os << ((idx == 0) ? "" : " ") << val.m_endpoints[idx];
  }
  return os << ']';
}

} // namespace pylon::transit
