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
#include "pylon/wormhole/code.hpp"
#include "pylon/wormhole/detail/pgp_words.hpp"
#include "pylon/error.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/random/random_device.hpp>
#include <boost/random/uniform_int_distribution.hpp>

namespace pylon::wormhole
{

// Implementations.

Code::Code() = default;

Code::Code(std::string&& nameplate, std::vector<std::string>&& words) :
  m_nameplate(std::move(nameplate)),
  m_words(std::move(words))
{
  assert(!m_words.empty());
  m_str = m_nameplate + '-' + password();
}

Code Code::generate(unsigned int nameplate, size_t code_length) // Static.
{
  using boost::random::uniform_int_distribution;

  assert(code_length != 0);

  boost::random::random_device rng;
  uniform_int_distribution<size_t> word_idx_dist(0, detail::S_PGP_WORD_COUNT - 1);

  std::vector<std::string> words;
  words.reserve(code_length);
  for (size_t idx = 0; idx != code_length; ++idx)
  {
    const auto& word_list = ((idx % 2) == 0) ? detail::S_PGP_EVEN_WORDS : detail::S_PGP_ODD_WORDS;
    words.emplace_back(word_list[word_idx_dist(rng)]);
  }

  return Code(std::to_string(nameplate), std::move(words));
}

Code Code::parse(const std::string& text, Error_code* err_code) // Static.
{
  using boost::algorithm::all;
  using boost::algorithm::is_digit;
  using boost::algorithm::is_from_range;
  using boost::algorithm::is_any_of;
  using boost::algorithm::split;
  using boost::algorithm::trim_copy;

  Code code;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Code { return parse(text, actual_err_code); },
         &code, err_code, "Code::parse()"))
  {
    return code;
  }
  // else

  std::vector<std::string> parts;
  split(parts, trim_copy(text), is_any_of("-"));

  // Need the nameplate and at least 1 word; no part may be empty (this also rejects leading/trailing/double dashes).
  bool ok = parts.size() >= 2;
  for (size_t idx = 0; ok && (idx != parts.size()); ++idx)
  {
    const auto& part = parts[idx];
    ok = (!part.empty())
         && ((idx == 0) ? all(part, is_digit()) : all(part, is_from_range('a', 'z')));
  }

  if (!ok)
  {
    *err_code = error::Code::S_MALFORMED_CODE;
    return code;
  }
  // else

  auto nameplate = std::move(parts.front());
  parts.erase(parts.begin());
  code = Code(std::move(nameplate), std::move(parts));

  err_code->clear();
  return code;
} // Code::parse()

const std::string& Code::str() const
{
  return m_str;
}

const std::string& Code::nameplate() const
{
  return m_nameplate;
}

std::string Code::password() const
{
  return boost::algorithm::join(m_words, "-");
}

size_t Code::word_count() const
{
  return m_words.size();
}

bool Code::empty() const
{
  return m_words.empty();
}

bool operator==(const Code& val1, const Code& val2)
{
  return val1.str() == val2.str();
}

std::ostream& operator<<(std::ostream& os, const Code& val)
{
  return os << (val.empty() ? "<empty>" : val.str());
}

} // namespace pylon::wormhole
