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

#include "utils/log/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>

namespace galleon {
namespace {
std::mutex                             registry_lock;
std::atomic<spdlog::level::level_enum> default_level{spdlog::level::info};
};  // namespace

auto Logger::GetLogger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
  std::lock_guard<std::mutex> lock(registry_lock);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto logger = spdlog::stdout_color_mt(name);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  logger->set_level(default_level.load());
  return logger;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(registry_lock);
  default_level = level;
  spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& logger) {
    logger->set_level(level);
  });
}
};  // namespace galleon
