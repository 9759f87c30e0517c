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

#include <atomic>
#include <chrono>
#include <string>

namespace galleon {
class TimeProvider {
 private:
  static std::atomic<std::chrono::system_clock::time_point> _cached_sys_time;
  static std::atomic<std::chrono::steady_clock::time_point> _cached_steady_time;

 public:
  static constexpr const char* kDisplayFormat = "%Y-%m-%d %H:%M:%S";
  static constexpr const char* kFileFormat    = "%Y-%m-%d_%H-%M-%S";

  /**
   * @brief Re-anchor the wall clock. Now() afterwards advances with the steady clock, so
   * intervals measured through it never go backwards.
   */
  static void                                  Refresh();
  static std::chrono::system_clock::time_point Now();
  static std::string TimePointToString(const std::chrono::system_clock::time_point& tp,
                                       const char* format = kDisplayFormat);
};
};  // namespace galleon
