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

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "type/type.hpp"
#include "utils/counter/delta_progress.hpp"

namespace galleon {
/**
 * @brief Per-worker connection state owned by a transfer client. The orchestrator never looks
 * inside; it only hands each worker its own instance.
 */
class TransferSession {
 public:
  virtual ~TransferSession() = default;
};

// Passed through to the remote service untouched
struct ThumbnailSettings {
  int  size_           = 3;
  int  format_         = 2;
  bool public_gallery_ = true;
};

struct UploadRequest {
  folder_path_t               image_path_{};
  bool                        create_gallery_ = false;
  std::optional<gallery_id_t> gallery_id_{};
  ThumbnailSettings           thumbnail_{};
};

struct UploadResponse {
  bool           success_ = false;
  // Service payload on success; a gallery-creating upload must carry "gallery_id"
  nlohmann::json data_    = nlohmann::json::object();
  std::string    error_{};
};

class TransferClient {
 public:
  virtual ~TransferClient() = default;

  virtual auto CreateSession() -> std::unique_ptr<TransferSession> = 0;

  /**
   * @brief Transfer one file. May block for the whole transfer. Reports cumulative bytes through
   * on_progress. Service-side rejections come back as a response with success_ == false;
   * transport failures may be thrown.
   */
  virtual auto UploadFile(const UploadRequest& request, TransferSession& session,
                          const TransferProgressCallback& on_progress) -> UploadResponse = 0;

  virtual auto GalleryUrl(const gallery_id_t& gallery_id) const -> std::string = 0;
};
};  // namespace galleon
