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

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace galleon {
struct UploadLogEntry {
  file_name_t file_name_{};
  uint32_t    attempts_ = 0;
  bool        succeeded_ = false;
  std::string last_error_{};
};

struct UploadLogSnapshot {
  std::vector<UploadLogEntry> attempted_{};
  std::vector<file_name_t>    succeeded_{};
  std::vector<UploadLogEntry> failed_{};
};

class UploadLog {
 public:
  void MarkAttempt(const file_name_t& file_name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto&                       entry = entries_[file_name];
    entry.file_name_                  = file_name;
    ++entry.attempts_;
  }

  void MarkSuccess(const file_name_t& file_name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto                        it = entries_.find(file_name);
    if (it == entries_.end()) {
      return;
    }
    it->second.succeeded_ = true;
    it->second.last_error_.clear();
  }

  void MarkFailure(const file_name_t& file_name, const std::string& error) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto                        it = entries_.find(file_name);
    if (it == entries_.end()) {
      return;
    }
    it->second.succeeded_  = false;
    it->second.last_error_ = error;
  }

  auto AttemptsOf(const file_name_t& file_name) const -> uint32_t {
    std::lock_guard<std::mutex> lock(mtx_);
    auto                        it = entries_.find(file_name);
    return it == entries_.end() ? 0 : it->second.attempts_;
  }

  auto Snapshot() const -> UploadLogSnapshot {
    std::lock_guard<std::mutex> lock(mtx_);
    UploadLogSnapshot           snapshot;
    snapshot.attempted_.reserve(entries_.size());

    for (const auto& [name, entry] : entries_) {
      snapshot.attempted_.push_back(entry);
      if (entry.succeeded_) {
        snapshot.succeeded_.push_back(name);
      } else {
        snapshot.failed_.push_back(entry);
      }
    }
    return snapshot;
  }

 private:
  mutable std::mutex                         mtx_{};
  std::map<file_name_t, UploadLogEntry>      entries_{};
};
};  // namespace galleon
