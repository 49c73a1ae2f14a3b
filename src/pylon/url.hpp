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

#include "pylon/common.hpp"
#include <optional>
#include <ostream>

namespace pylon
{

// Types.

/**
 * A parsed absolute network URL of the form `scheme://host[:port][/path]`, as used for the rendezvous server and
 * relay server endpoints.  Only the subset of RFC 3986 that such endpoints use is supported: no user-info,
 * query or fragment.  Host may be a DNS name, IPv4 address, or bracketed IPv6 address.
 *
 * This is a data store; obtain one via parse_url().
 */
struct Url
{
  // Data.

  /// Scheme, lower-cased, e.g., "ws" or "tcp".
  std::string m_scheme;

  /// Host, lower-cased, brackets (if IPv6) removed.
  std::string m_host;

  /// Port if one was given explicitly.
  std::optional<uint16_t> m_port;

  /// Path including leading slash; or empty.
  std::string m_path;
}; // struct Url

// Free functions.

/**
 * Parses a URL string.
 *
 * @param text
 *        The string.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_URL_PARSE_FAILED (not a URL in the supported subset, or port out of range).
 * @return The URL; meaningless on error.
 */
Url parse_url(const std::string& text, Error_code* err_code = 0);

/**
 * Prints string representation of the given `Url` to the given `ostream`, in canonical URL form.
 *
 * @relatesalso Url
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Url& val);

/**
 * Returns `true` if and only if the two URLs are equal member-wise.
 *
 * @relatesalso Url
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Url& val1, const Url& val2);

} // namespace pylon
