//  Copyright 2026 Yurun Zi
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

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace galleon {
/**
 * @brief Named spdlog loggers shared across the process. Loggers are created on first use as
 * colored stdout sinks and registered with spdlog, so the same name always yields the same
 * instance.
 */
class Logger {
 public:
  static auto GetLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

  // Applies to every logger already created and to those created later
  static void SetLevel(spdlog::level::level_enum level);
};
};  // namespace galleon
