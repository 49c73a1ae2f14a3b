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

#include <array>
#include <cstddef>

namespace pylon::wormhole::detail
{

// Constants.

/// Number of words in each half of the PGP word list; one per byte value.
constexpr size_t S_PGP_WORD_COUNT = 256;

/// The "even" half of the PGP word list (two-syllable words), lower-cased, indexed by byte value.
extern const std::array<const char*, S_PGP_WORD_COUNT> S_PGP_EVEN_WORDS;

/// The "odd" half of the PGP word list (three-syllable words), lower-cased, indexed by byte value.
extern const std::array<const char*, S_PGP_WORD_COUNT> S_PGP_ODD_WORDS;

} // namespace pylon::wormhole::detail
