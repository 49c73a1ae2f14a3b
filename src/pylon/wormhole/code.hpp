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

#include "pylon/wormhole/wormhole_fwd.hpp"

namespace pylon::wormhole
{

// Types.

/**
 * A wormhole code, e.g., "7-guitarist-revenge": a numeric *nameplate*, which the rendezvous server allocates
 * and uses to bring the two peers together, followed by one or more words, which are the password of the
 * key agreement and never leave the peer in the clear.
 *
 * Generated codes draw their words alternately from the even and odd halves of the PGP word list, so that
 * transposed or dropped words are easy to spot when read aloud.  Parsed codes are not required to come from that
 * list: any lower-case words are accepted, and a mistyped word simply fails authentication.
 *
 * Value type.  A default-constructed Code is empty() and is not usable in a handshake.
 */
class Code
{
public:
  // Constructors/destructor.

  /// Constructs empty code.
  Code();

  // Methods.

  /**
   * Generates a code with the given nameplate and `code_length` random words.
   *
   * @param nameplate
   *        Nameplate allocated by the rendezvous server.
   * @param code_length
   *        Number of words; must be at least 1 (behavior undefined otherwise; assertion may trip).
   * @return See above.
   */
  static Code generate(unsigned int nameplate, size_t code_length);

  /**
   * Parses a code typed in by the user: `<digits>-<word>[-<word>...]` where each word is lower-case ASCII letters.
   * Surrounding whitespace is ignored.
   *
   * @param text
   *        The code as entered.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_MALFORMED_CODE.
   * @return The code; empty() on error.
   */
  static Code parse(const std::string& text, Error_code* err_code = 0);

  /**
   * Full code string.
   *
   * @return See above.
   */
  const std::string& str() const;

  /**
   * The nameplate part (decimal digits).
   *
   * @return See above.
   */
  const std::string& nameplate() const;

  /**
   * The password part: the words joined by dashes.
   *
   * @return See above.
   */
  std::string password() const;

  /**
   * Number of words.
   *
   * @return See above.
   */
  size_t word_count() const;

  /**
   * Returns `true` if this is a default-constructed code.
   *
   * @return See above.
   */
  bool empty() const;

private:
  // Constructors.

  /**
   * Constructs code from its parts.
   *
   * @param nameplate
   *        Nameplate.
   * @param words
   *        Words; at least 1.
   */
  explicit Code(std::string&& nameplate, std::vector<std::string>&& words);

  // Data.

  /// See nameplate().
  std::string m_nameplate;

  /// The words, in order.
  std::vector<std::string> m_words;

  /// See str().
  std::string m_str;
}; // class Code

// Free functions.

/**
 * Returns `true` if and only if the two codes are equal.
 *
 * @relatesalso Code
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Code& val1, const Code& val2);

} // namespace pylon::wormhole
