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

namespace conv {
auto ToBytes(const std::wstring& wstr) -> std::string;
auto FromBytes(const std::string& str) -> std::wstring;

/**
 * @brief Decode a UTF-8 string into code points. Malformed sequences do not throw: each byte of
 * an undecodable input is taken as its own code point instead.
 */
auto ToCodepoints(const std::string& str) -> std::u32string;
};  // namespace conv
