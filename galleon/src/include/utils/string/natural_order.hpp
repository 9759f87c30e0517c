//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <string>

namespace galleon {
/**
 * @brief Compare two UTF-8 file names the way a file manager displays them: names are split
 * into alternating text/digit runs, digit runs compare by integer value and text runs compare
 * case-insensitively.
 *
 * @return negative, zero or positive, like strcmp. Zero does not imply a == b ("Img2" and
 * "img2" compare equal here).
 */
auto NaturalCompare(const std::string& a, const std::string& b) -> int;

/**
 * @brief Strict weak order built on NaturalCompare; names that compare equal are ordered by
 * their raw bytes so the result is a total order.
 */
auto NaturalLess(const std::string& a, const std::string& b) -> bool;
};  // namespace galleon
