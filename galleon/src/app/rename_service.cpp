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

#include "app/rename_service.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

#include "utils/log/logger.hpp"

namespace galleon {
PendingRenameStore::PendingRenameStore(std::filesystem::path path) : path_(std::move(path)) {
  Load();
}

void PendingRenameStore::Load() {
  if (!std::filesystem::exists(path_)) {
    return;
  }
  std::ifstream file(path_);
  if (!file.is_open()) {
    throw std::runtime_error("PendingRenameStore: failed to open " + path_.string() +
                             " for reading");
  }

  nlohmann::json pending;
  try {
    file >> pending;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("PendingRenameStore: malformed " + path_.string() + ": " + e.what());
  }
  if (!pending.is_object()) {
    throw std::runtime_error("PendingRenameStore: " + path_.string() + " is not a JSON object");
  }
  for (const auto& [id, name] : pending.items()) {
    if (name.is_string()) entries_[id] = name.get<std::string>();
  }
}

void PendingRenameStore::Persist() const {
  nlohmann::json pending = nlohmann::json::object();
  for (const auto& [id, name] : entries_) {
    pending[id] = name;
  }

  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path());
  }
  // Write aside and swap in, so a crash never leaves a truncated store
  auto          staging = path_;
  staging += ".tmp";
  std::ofstream file(staging);
  if (!file.is_open()) {
    throw std::runtime_error("PendingRenameStore: failed to open " + staging.string() +
                             " for writing");
  }
  file << pending.dump(4);
  file.close();
  if (!file) {
    throw std::runtime_error("PendingRenameStore: failed to write " + staging.string());
  }
  std::filesystem::rename(staging, path_);
}

void PendingRenameStore::Add(const gallery_id_t& gallery_id, const std::string& gallery_name) {
  std::lock_guard<std::mutex> lock(mtx_);
  entries_[gallery_id] = gallery_name;
  Persist();
}

auto PendingRenameStore::Remove(const gallery_id_t& gallery_id) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  if (entries_.erase(gallery_id) == 0) {
    return false;
  }
  Persist();
  return true;
}

auto PendingRenameStore::Contains(const gallery_id_t& gallery_id) const -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  return entries_.count(gallery_id) > 0;
}

auto PendingRenameStore::Entries() const -> std::map<gallery_id_t, std::string> {
  std::lock_guard<std::mutex> lock(mtx_);
  return entries_;
}

RenameService::RenameService(std::shared_ptr<PendingRenameStore> store,
                             std::shared_ptr<GalleryRenamer>     renamer)
    : store_(std::move(store)), renamer_(std::move(renamer)) {
  if (!store_) {
    throw std::invalid_argument("RenameService: a pending rename store is required");
  }
  if (renamer_) {
    worker_ = std::thread(&RenameService::WorkerLoop, this);
  }
}

RenameService::~RenameService() { Stop(); }

auto RenameService::Dispatch(const gallery_id_t& gallery_id, const std::string& gallery_name)
    -> bool {
  {
    std::lock_guard<std::mutex> lock(state_lock_);
    if (renamer_ && !stopped_) {
      requests_.push(RenameRequest{gallery_id, gallery_name});
      return true;
    }
  }
  store_->Add(gallery_id, gallery_name);
  Logger::GetLogger("rename")->info("[{}] Recorded for later rename as '{}'", gallery_id,
                                    gallery_name);
  return true;
}

auto RenameService::TryRename(const gallery_id_t& gallery_id, const std::string& gallery_name)
    -> bool {
  auto logger = Logger::GetLogger("rename");
  try {
    if (renamer_->RenameGallery(gallery_id, gallery_name)) {
      logger->info("[{}] Renamed to '{}'", gallery_id, gallery_name);
      return true;
    }
    logger->warn("[{}] Rename to '{}' was rejected", gallery_id, gallery_name);
  } catch (const std::exception& e) {
    logger->warn("[{}] Rename to '{}' failed: {}", gallery_id, gallery_name, e.what());
  }
  return false;
}

void RenameService::WorkerLoop() {
  while (true) {
    auto request = requests_.pop();
    if (!request) {
      return;
    }
    bool renamed = TryRename(request->gallery_id_, request->gallery_name_);
    try {
      if (renamed) {
        store_->Remove(request->gallery_id_);
      } else {
        store_->Add(request->gallery_id_, request->gallery_name_);
      }
    } catch (const std::exception& e) {
      // Worker must survive a failing disk
      Logger::GetLogger("rename")->error("[{}] Could not update pending renames: {}",
                                         request->gallery_id_, e.what());
    }
  }
}

auto RenameService::RenamePending() -> size_t {
  auto logger = Logger::GetLogger("rename");
  if (!renamer_) {
    logger->warn("No renamer configured; {} gallery(ies) stay pending", store_->Entries().size());
    return 0;
  }

  size_t renamed = 0;
  for (const auto& [id, name] : store_->Entries()) {
    if (TryRename(id, name)) {
      store_->Remove(id);
      ++renamed;
    }
  }
  logger->info("Renamed {} pending gallery(ies)", renamed);
  return renamed;
}

void RenameService::Stop() {
  {
    std::lock_guard<std::mutex> lock(state_lock_);
    if (stopped_) return;
    stopped_ = true;
    if (worker_.joinable()) requests_.push(std::nullopt);
  }
  if (worker_.joinable()) worker_.join();
}
};  // namespace galleon
