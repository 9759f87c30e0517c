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
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "app/rename_service.hpp"
#include "transfer/transfer_client.hpp"
#include "utils/id/id_generator.hpp"

namespace galleon {
/**
 * @brief Transfer client that mirrors galleries into a local directory. Each gallery becomes
 * <root>/<gallery_id>/ and each file is copied in chunks, reporting progress after every chunk.
 */
class DirectoryTransferClient final : public TransferClient {
 public:
  static constexpr size_t kDefaultChunkSize = 64 * 1024;

  explicit DirectoryTransferClient(folder_path_t root, size_t chunk_size = kDefaultChunkSize);

  auto CreateSession() -> std::unique_ptr<TransferSession> override;
  auto UploadFile(const UploadRequest& request, TransferSession& session,
                  const TransferProgressCallback& on_progress) -> UploadResponse override;
  auto GalleryUrl(const gallery_id_t& gallery_id) const -> std::string override;

  auto SessionsCreated() const -> uint64_t { return session_ids_.GetCurrentID(); }

 private:
  folder_path_t                  root_;
  size_t                         chunk_size_;

  IncrID::IDGenerator<uint64_t>  gallery_ids_;
  IncrID::IDGenerator<uint64_t>  image_ids_{0};
  IncrID::IDGenerator<uint64_t>  session_ids_{0};
};

/**
 * @brief Names a mirrored gallery by writing <root>/<gallery_id>/gallery_name.txt
 */
class DirectoryGalleryRenamer final : public GalleryRenamer {
 public:
  static constexpr const char* kNameFile = "gallery_name.txt";

  explicit DirectoryGalleryRenamer(folder_path_t root) : root_(std::move(root)) {}

  auto RenameGallery(const gallery_id_t& gallery_id, const std::string& gallery_name)
      -> bool override;

 private:
  folder_path_t root_;
};
};  // namespace galleon
