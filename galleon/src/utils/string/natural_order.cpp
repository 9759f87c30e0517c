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

#include "utils/string/natural_order.hpp"

#include <algorithm>
#include <cwchar>
#include <exception>
#include <locale>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/string/convert.hpp"

#if defined(_WIN32)
#include <windows.h>
#include <shlwapi.h>
#endif

namespace galleon {
namespace {
struct Run {
  bool           digits_;
  std::u32string text_;
};

inline bool IsDigit(char32_t c) { return c >= U'0' && c <= U'9'; }

// Case folding needs a UTF-8 locale; the default "C" locale only knows ASCII
auto FoldLocale() -> const std::locale& {
  static const std::locale loc = []() {
    for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8", ""}) {
      try {
        return std::locale(name);
      } catch (const std::runtime_error&) {
        // not installed, try the next one
      }
    }
    return std::locale::classic();
  }();
  return loc;
}

inline char32_t Fold(char32_t c) {
  if (c > static_cast<char32_t>(WCHAR_MAX)) return c;
  return static_cast<char32_t>(std::tolower(static_cast<wchar_t>(c), FoldLocale()));
}

// Always starts with a text run (possibly empty), then alternates digits/text
auto SplitRuns(const std::u32string& s) -> std::vector<Run> {
  std::vector<Run> runs;
  runs.push_back({false, {}});
  for (char32_t c : s) {
    bool digit = IsDigit(c);
    if (runs.back().digits_ != digit) {
      runs.push_back({digit, {}});
    }
    runs.back().text_.push_back(digit ? c : Fold(c));
  }
  return runs;
}

auto CompareNumber(const std::u32string& a, const std::u32string& b) -> int {
  size_t ia = a.find_first_not_of(U'0');
  size_t ib = b.find_first_not_of(U'0');
  ia        = ia == std::u32string::npos ? a.size() : ia;
  ib        = ib == std::u32string::npos ? b.size() : ib;

  size_t len_a = a.size() - ia;
  size_t len_b = b.size() - ib;
  if (len_a != len_b) return len_a < len_b ? -1 : 1;
  int cmp = a.compare(ia, len_a, b, ib, len_b);
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

// Mixed runs at the same index only happen when one side ran out of text: the empty text run
// sorts first, which is where a digit-leading name lands.
auto CompareRun(const Run& a, const Run& b) -> int {
  if (a.digits_ && b.digits_) return CompareNumber(a.text_, b.text_);
  if (a.digits_ != b.digits_) return a.digits_ ? 1 : -1;
  int cmp = a.text_.compare(b.text_);
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

auto PortableCompare(const std::string& a, const std::string& b) -> int {
  auto runs_a = SplitRuns(conv::ToCodepoints(a));
  auto runs_b = SplitRuns(conv::ToCodepoints(b));

  size_t n    = std::min(runs_a.size(), runs_b.size());
  for (size_t i = 0; i < n; ++i) {
    int cmp = CompareRun(runs_a[i], runs_b[i]);
    if (cmp != 0) return cmp;
  }
  if (runs_a.size() == runs_b.size()) return 0;
  return runs_a.size() < runs_b.size() ? -1 : 1;
}
};  // namespace

auto NaturalCompare(const std::string& a, const std::string& b) -> int {
#if defined(_WIN32)
  try {
    std::wstring wa = conv::FromBytes(a);
    std::wstring wb = conv::FromBytes(b);
    return StrCmpLogicalW(wa.c_str(), wb.c_str());
  } catch (const std::exception&) {
    // Undecodable names go through the portable comparator
  }
#endif
  return PortableCompare(a, b);
}

auto NaturalLess(const std::string& a, const std::string& b) -> bool {
  int cmp = NaturalCompare(a, b);
  if (cmp != 0) return cmp < 0;
  return a < b;
}
};  // namespace galleon
