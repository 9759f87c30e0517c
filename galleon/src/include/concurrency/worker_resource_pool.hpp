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

#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace galleon {
// One lazily created resource per worker slot. Creation is serialized, use is not: a slot is
// only ever touched by the worker that owns it.
template <typename T>
class WorkerResourcePool {
 public:
  using Initializer = std::function<std::unique_ptr<T>()>;

  WorkerResourcePool(size_t slot_count, Initializer init)
      : slots_(slot_count), init_func_(std::move(init)) {}

  WorkerResourcePool(const WorkerResourcePool&)            = delete;
  WorkerResourcePool& operator=(const WorkerResourcePool&) = delete;

  auto Get(worker_slot_t slot) -> T& {
    if (slot >= slots_.size()) {
      throw std::out_of_range("WorkerResourcePool: slot " + std::to_string(slot) +
                              " is out of range");
    }
    std::lock_guard<std::mutex> lock(create_lock_);
    if (!slots_[slot]) {
      slots_[slot] = init_func_();
      if (!slots_[slot]) {
        throw std::runtime_error("WorkerResourcePool: initializer returned no resource");
      }
    }
    return *slots_[slot];
  }

  auto CreatedCount() const -> size_t {
    std::lock_guard<std::mutex> lock(create_lock_);
    size_t                      count = 0;
    for (const auto& slot : slots_) {
      if (slot) ++count;
    }
    return count;
  }

  auto SlotCount() const -> size_t { return slots_.size(); }

 private:
  std::vector<std::unique_ptr<T>> slots_;
  Initializer                     init_func_;
  mutable std::mutex              create_lock_;
};
};  // namespace galleon
