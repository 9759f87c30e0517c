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

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "app/upload_hooks.hpp"
#include "type/type.hpp"
#include "utils/queue/queue.hpp"

namespace galleon {
/**
 * @brief Applies a display name to an existing gallery on the remote service
 */
class GalleryRenamer {
 public:
  virtual ~GalleryRenamer() = default;

  virtual auto RenameGallery(const gallery_id_t& gallery_id, const std::string& gallery_name)
      -> bool = 0;
};

/**
 * @brief Durable map of galleries still waiting for their name, kept as a JSON object
 * {gallery_id: name}. Every change is written through to disk.
 */
class PendingRenameStore {
 public:
  explicit PendingRenameStore(std::filesystem::path path);

  void Add(const gallery_id_t& gallery_id, const std::string& gallery_name);
  auto Remove(const gallery_id_t& gallery_id) -> bool;
  auto Contains(const gallery_id_t& gallery_id) const -> bool;
  auto Entries() const -> std::map<gallery_id_t, std::string>;

  auto Path() const -> const std::filesystem::path& { return path_; }

 private:
  void                                Load();
  void                                Persist() const;

  std::filesystem::path               path_;
  mutable std::mutex                  mtx_;
  std::map<gallery_id_t, std::string> entries_;
};

class RenameService final : public RenameDispatcher {
 public:
  /**
   * @param renamer if null, every dispatched gallery is only recorded in the store
   */
  RenameService(std::shared_ptr<PendingRenameStore> store,
                std::shared_ptr<GalleryRenamer>     renamer = nullptr);
  ~RenameService();

  RenameService(const RenameService&)            = delete;
  RenameService& operator=(const RenameService&) = delete;

  auto Dispatch(const gallery_id_t& gallery_id, const std::string& gallery_name) -> bool override;

  /**
   * @brief Try every stored gallery once with the renamer; successes leave the store
   *
   * @return number of galleries renamed
   */
  auto RenamePending() -> size_t;

  // Finishes queued renames, then joins the worker
  void Stop();

  auto Store() const -> const std::shared_ptr<PendingRenameStore>& { return store_; }

 private:
  struct RenameRequest {
    gallery_id_t gallery_id_;
    std::string  gallery_name_;
  };

  void                                                  WorkerLoop();
  auto TryRename(const gallery_id_t& gallery_id, const std::string& gallery_name) -> bool;

  std::shared_ptr<PendingRenameStore>                   store_;
  std::shared_ptr<GalleryRenamer>                       renamer_;

  // nullopt is the stop sentinel
  ConcurrentBlockingQueue<std::optional<RenameRequest>> requests_;
  std::mutex                                            state_lock_;
  bool                                                  stopped_ = false;
  std::thread                                           worker_;
};
};  // namespace galleon
