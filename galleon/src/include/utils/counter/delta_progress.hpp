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

#include <functional>
#include <utility>
#include <vector>

#include "type/type.hpp"
#include "utils/counter/atomic_counter.hpp"

namespace galleon {
// (bytes sent so far for this transfer, total bytes of this transfer)
using TransferProgressCallback = std::function<void(byte_count_t, byte_count_t)>;

/**
 * @brief Turns the cumulative progress of one transfer into increments for shared counters.
 *
 * One adapter belongs to exactly one file transfer and must not be reused for another. Calls
 * are expected from the thread running that transfer, so last_seen_ needs no lock; only the
 * counters are shared.
 */
class DeltaProgressAdapter {
 public:
  explicit DeltaProgressAdapter(std::vector<AtomicCounter*> counters,
                                TransferProgressCallback    downstream = nullptr)
      : counters_(std::move(counters)), downstream_(std::move(downstream)) {}

  void OnProgress(byte_count_t so_far, byte_count_t total) {
    if (so_far > last_seen_) {
      byte_count_t delta = so_far - last_seen_;
      for (auto* counter : counters_) {
        if (counter) counter->Add(delta);
      }
      last_seen_ = so_far;
    }
    if (downstream_) downstream_(so_far, total);
  }

  auto LastSeen() const -> byte_count_t { return last_seen_; }

  /**
   * @brief Callback bound to this adapter; the adapter must outlive every call through it
   */
  auto AsCallback() -> TransferProgressCallback {
    return [this](byte_count_t so_far, byte_count_t total) { OnProgress(so_far, total); };
  }

 private:
  std::vector<AtomicCounter*> counters_;
  TransferProgressCallback    downstream_;
  byte_count_t                last_seen_ = 0;
};
};  // namespace galleon
