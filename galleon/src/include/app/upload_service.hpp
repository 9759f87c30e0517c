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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "app/upload_hooks.hpp"
#include "transfer/transfer_client.hpp"
#include "type/type.hpp"
#include "utils/counter/atomic_counter.hpp"
#include "utils/upload/upload_log.hpp"

namespace galleon {
enum class UploadErrorCode : uint8_t {
  UNKNOWN = 0,
  FOLDER_NOT_FOUND,
  NO_IMAGES,
  GALLERY_CREATE_FAILED,
  INVALID_REQUEST,
  GALLERY_ALREADY_EXISTS
};

/**
 * @brief Raised when a run cannot produce a result at all. Per-file failures never raise; they
 * are reported in RunResult::failed_details_.
 */
class UploadRunError : public std::runtime_error {
 public:
  UploadRunError(UploadErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  auto Code() const -> UploadErrorCode { return code_; }

 private:
  UploadErrorCode code_;
};

// Pre-computed by the caller, echoed into the result
struct ImageDimensions {
  double   avg_width_  = 0.0;
  double   avg_height_ = 0.0;
  uint32_t max_width_  = 0;
  uint32_t max_height_ = 0;
  uint32_t min_width_  = 0;
  uint32_t min_height_ = 0;
};

struct RunRequest {
  folder_path_t                   folder_{};
  std::optional<std::string>      gallery_name_{};
  ThumbnailSettings               thumbnail_{};
  int                             max_retries_ = 3;
  int                             concurrency_ = 4;
  std::string                     template_name_ = "default";

  // Files uploaded by an earlier session of the same gallery
  std::unordered_set<file_name_t> already_uploaded_{};
  std::optional<gallery_id_t>     existing_gallery_id_{};
  std::optional<ImageDimensions>  dimensions_{};

  // Append mode only: the existing gallery never received its name
  bool                            gallery_known_unnamed_ = false;
};

struct UploadProgress {
  uint32_t    completed_ = 0;
  uint32_t    total_     = 0;
  uint32_t    percent_   = 0;
  file_name_t current_file_{};
};

struct FailedUpload {
  file_name_t file_name_{};
  std::string error_{};
};

struct RunResult {
  gallery_id_t                          gallery_id_{};
  std::string                           gallery_url_{};
  std::string                           gallery_name_{};

  // Success payloads of this run, in folder display order
  std::vector<nlohmann::json>           images_{};

  uint32_t                              successful_count_      = 0;
  uint32_t                              failed_count_          = 0;
  uint32_t                              never_attempted_count_ = 0;
  uint32_t                              total_images_          = 0;
  std::vector<FailedUpload>             failed_details_{};
  std::vector<file_name_t>              incomplete_files_{};
  uint32_t                              retry_passes_ = 0;
  bool                                  cancelled_    = false;

  std::chrono::system_clock::time_point started_at_{};
  std::chrono::system_clock::time_point finished_at_{};
  double                                upload_time_ = 0.0;

  byte_count_t                          total_size_        = 0;
  byte_count_t                          uploaded_size_     = 0;
  byte_count_t                          transferred_bytes_ = 0;
  double                                transfer_speed_    = 0.0;

  ThumbnailSettings                     thumbnail_{};
  uint32_t                              parallel_batch_size_ = 0;
  std::string                           template_name_{};
  std::optional<ImageDimensions>        dimensions_{};

  bool                                  rename_dispatched_ = false;
};

auto ToJson(const RunResult& result) -> nlohmann::json;

class UploadJob {
 public:
  using ProgressCallback = std::function<void(const UploadProgress&)>;
  using FileUploadedCallback =
      std::function<void(const file_name_t&, const nlohmann::json&, byte_count_t)>;
  using CancelPredicate    = std::function<bool()>;
  using DuplicatePredicate = std::function<bool(const std::string& gallery_name,
                                                const std::vector<folder_path_t>& matches)>;

  // Cancellation token observed by implementation
  std::atomic<bool>          canceled_{false};

  ProgressCallback           on_progress_{};
  FileUploadedCallback       on_file_uploaded_{};
  CancelPredicate            should_cancel_{};

  // Asked before creating a gallery whose name was used before; false aborts the run
  DuplicatePredicate         confirm_duplicate_{};

  std::shared_ptr<UploadLog> upload_log_ = nullptr;

  auto IsCancelled() const -> bool {
    if (canceled_.load()) return true;
    return should_cancel_ && should_cancel_();
  }
};

class UploadService {
 public:
  virtual ~UploadService()                                      = default;

  virtual auto Run(const RunRequest& request, std::shared_ptr<UploadJob> job = nullptr)
      -> RunResult = 0;
};

class UploadServiceImpl final : public UploadService {
 public:
  explicit UploadServiceImpl(std::shared_ptr<TransferClient>          client,
                             std::shared_ptr<RenameDispatcher>        rename_dispatcher = nullptr,
                             std::shared_ptr<GalleryExistenceChecker> existence_checker = nullptr,
                             std::shared_ptr<AtomicCounter>           bandwidth_counter = nullptr);

  ~UploadServiceImpl() = default;

  /**
   * @brief Upload every eligible image of request.folder_ into one gallery.
   *
   * Blocks until all passes are over. Throws UploadRunError for a missing folder, an empty
   * folder, a rejected duplicate or a failed gallery creation; everything else is reported in
   * the returned result.
   */
  auto Run(const RunRequest& request, std::shared_ptr<UploadJob> job = nullptr)
      -> RunResult override;

 private:
  std::shared_ptr<TransferClient>          client_;
  std::shared_ptr<RenameDispatcher>        rename_dispatcher_;
  std::shared_ptr<GalleryExistenceChecker> existence_checker_;
  std::shared_ptr<AtomicCounter>           bandwidth_counter_;
};
};  // namespace galleon
