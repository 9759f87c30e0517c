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

#include <mutex>

#include "type/type.hpp"

namespace galleon {
/**
 * @brief Byte accumulator shared by concurrently running transfers
 */
class AtomicCounter {
 public:
  AtomicCounter() = default;

  AtomicCounter(const AtomicCounter&)            = delete;
  AtomicCounter& operator=(const AtomicCounter&) = delete;

  void Add(byte_count_t amount) {
    std::lock_guard<std::mutex> lock(lock_);
    value_ += amount;
  }

  auto Get() const -> byte_count_t {
    std::lock_guard<std::mutex> lock(lock_);
    return value_;
  }

  void Reset() {
    std::lock_guard<std::mutex> lock(lock_);
    value_ = 0;
  }

 private:
  mutable std::mutex lock_;
  byte_count_t       value_ = 0;
};
};  // namespace galleon
