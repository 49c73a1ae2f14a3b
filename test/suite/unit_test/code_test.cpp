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

#include "pylon/wormhole/code.hpp"
#include "pylon/wormhole/detail/pgp_words.hpp"
#include "pylon/error.hpp"
#include <boost/algorithm/string.hpp>
#include <gtest/gtest.h>
#include <algorithm>

namespace pylon::test
{

using wormhole::Code;

namespace
{

bool in_list(const std::array<const char*, wormhole::detail::S_PGP_WORD_COUNT>& list, const std::string& word)
{
  return std::find_if(list.begin(), list.end(), [&](const char* entry) { return word == entry; }) != list.end();
}

} // namespace (anon)

TEST(Code, Generate)
{
  using wormhole::detail::S_PGP_EVEN_WORDS;
  using wormhole::detail::S_PGP_ODD_WORDS;

  const auto code = Code::generate(17, 4);
  EXPECT_FALSE(code.empty());
  EXPECT_EQ(code.nameplate(), "17");
  EXPECT_EQ(code.word_count(), 4u);

  std::vector<std::string> parts;
  boost::algorithm::split(parts, code.str(), boost::algorithm::is_any_of("-"));
  ASSERT_EQ(parts.size(), 5u);
  EXPECT_EQ(parts[0], "17");
  EXPECT_TRUE(in_list(S_PGP_EVEN_WORDS, parts[1]));
  EXPECT_TRUE(in_list(S_PGP_ODD_WORDS, parts[2]));
  EXPECT_TRUE(in_list(S_PGP_EVEN_WORDS, parts[3]));
  EXPECT_TRUE(in_list(S_PGP_ODD_WORDS, parts[4]));
  EXPECT_EQ(code.password(), parts[1] + '-' + parts[2] + '-' + parts[3] + '-' + parts[4]);

  EXPECT_EQ(Code::generate(3, 1).word_count(), 1u);
}

TEST(Code, Parse)
{
  Error_code err_code;

  const auto code = Code::parse("  7-guitarist-revenge\n", &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(code.str(), "7-guitarist-revenge");
  EXPECT_EQ(code.nameplate(), "7");
  EXPECT_EQ(code.password(), "guitarist-revenge");
  EXPECT_EQ(code.word_count(), 2u);
  EXPECT_EQ(code, Code::parse("7-guitarist-revenge"));

  const auto generated = Code::generate(123, 3);
  EXPECT_EQ(Code::parse(generated.str()), generated);
}

TEST(Code, ParseRejects)
{
  for (const auto text : { "", "7", "7-", "-guitarist", "seven-guitarist", "7-Guitarist", "7--revenge",
                           "7-guitarist-", "7-guitar1st", "7 guitarist revenge" })
  {
    Error_code err_code;
    const auto code = Code::parse(text, &err_code);
    EXPECT_EQ(err_code, error::Code::S_MALFORMED_CODE) << "For [" << text << "].";
    EXPECT_TRUE(code.empty());
  }

  EXPECT_THROW(Code::parse("nope"), flow::error::Runtime_error);
}

} // namespace pylon::test
