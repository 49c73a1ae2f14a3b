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
#include "pylon/url.hpp"
#include "pylon/error.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <mutex>
#include <regex>

namespace pylon
{

namespace
{

/// File-local helper variable: the regex used by parse_url().
std::regex url_regex;

/// File-local helper variable: ensures #url_regex is built thread-safely only once.
std::once_flag url_regex_built;

} // namespace (anon)

Url parse_url(const std::string& text, Error_code* err_code)
{
  using boost::algorithm::to_lower_copy;
  using std::regex_match;
  using std::smatch;
  using std::stoul;

  Url url;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Url { return parse_url(text, actual_err_code); },
         &url, err_code, "pylon::parse_url()"))
  {
    return url;
  }
  // else

  // Built once, thread-safely; parse_url() may be called concurrently from any number of Pylons.
  std::call_once(url_regex_built, [&]()
  {
    url_regex.assign("([A-Za-z][A-Za-z0-9+.-]*)://" // scheme
                     "(?:\\[([0-9A-Fa-f:.]+)\\]|([A-Za-z0-9._~-]+))" // host: [ipv6] or name/ipv4
                     "(?::([0-9]{1,5}))?" // port
                     "(/[^?#\\s]*)?"); // path
  });

  smatch matches;
  if (!regex_match(text, matches, url_regex))
  {
    *err_code = error::Code::S_URL_PARSE_FAILED;
    return url;
  }
  // else

  url.m_scheme = to_lower_copy(matches[1].str());
  url.m_host = to_lower_copy(matches[2].matched ? matches[2].str() : matches[3].str());
  if (matches[4].matched)
  {
    const auto port = stoul(matches[4].str()); // Cannot throw: 1-5 digits.
    if ((port == 0) || (port > 65535))
    {
      *err_code = error::Code::S_URL_PARSE_FAILED;
      return url;
    }
    // else
    url.m_port = static_cast<uint16_t>(port);
  }
  url.m_path = matches[5].str();

  err_code->clear();
  return url;
} // parse_url()

std::ostream& operator<<(std::ostream& os, const Url& val)
{
  os << val.m_scheme << "://";
  if (val.m_host.find(':') == std::string::npos)
  {
    os << val.m_host;
  }
  else
  {
    os << '[' << val.m_host << ']';
  }
  if (val.m_port)
  {
    os << ':' << *val.m_port;
  }
  return os << val.m_path;
}

bool operator==(const Url& val1, const Url& val2)
{
  return (val1.m_scheme == val2.m_scheme) && (val1.m_host == val2.m_host)
         && (val1.m_port == val2.m_port) && (val1.m_path == val2.m_path);
}

} // namespace pylon
