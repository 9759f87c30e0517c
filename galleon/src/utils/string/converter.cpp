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

#include <iterator>
#include <string>

#include "utf8/checked.h"
#include "utils/string/convert.hpp"

namespace conv {
auto ToBytes(const std::wstring& wstr) -> std::string {
  std::string str;
  if constexpr (sizeof(wchar_t) == 2) {
    utf8::utf16to8(wstr.begin(), wstr.end(), std::back_inserter(str));
  } else {
    utf8::utf32to8(wstr.begin(), wstr.end(), std::back_inserter(str));
  }
  return str;
}

auto FromBytes(const std::string& str) -> std::wstring {
  std::wstring wstr;
  if constexpr (sizeof(wchar_t) == 2) {
    utf8::utf8to16(str.begin(), str.end(), std::back_inserter(wstr));
  } else {
    utf8::utf8to32(str.begin(), str.end(), std::back_inserter(wstr));
  }
  return wstr;
}

auto ToCodepoints(const std::string& str) -> std::u32string {
  std::u32string out;
  try {
    utf8::utf8to32(str.begin(), str.end(), std::back_inserter(out));
  } catch (const utf8::exception&) {
    out.clear();
    for (unsigned char c : str) out.push_back(static_cast<char32_t>(c));
  }
  return out;
}
};  // namespace conv
