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

#include "app/upload_service.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <deque>
#include <filesystem>
#include <map>
#include <system_error>
#include <utility>

#include "concurrency/thread_pool.hpp"
#include "concurrency/worker_resource_pool.hpp"
#include "io/folder_scan.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/counter/delta_progress.hpp"
#include "utils/log/logger.hpp"
#include "utils/queue/queue.hpp"
#include "utils/string/gallery_name.hpp"

namespace galleon {
namespace {
struct TaskOutcome {
  file_name_t    file_name_{};
  bool           success_ = false;
  nlohmann::json data_{};
  std::string    error_{};
};

struct PassOutcome {
  std::vector<FailedUpload> failed_{};
  // Never handed to a worker because cancellation was observed first
  std::vector<file_name_t>  unsubmitted_{};
};

struct SuccessEntry {
  size_t         position_ = 0;
  file_name_t    file_name_{};
  byte_count_t   size_bytes_ = 0;
  nlohmann::json data_{};
};

// State of a single Run call. Members are destroyed in reverse order, so the pool joins its
// workers before the session pool and the completion queue go away.
struct RunContext {
  RunContext(const RunRequest& request, std::shared_ptr<UploadJob> job, TransferClient& client,
             OrderedFileList files, std::shared_ptr<UploadLog> log, AtomicCounter* bandwidth,
             size_t workers)
      : request_(request),
        job_(std::move(job)),
        client_(client),
        logger_(Logger::GetLogger("upload")),
        files_(std::move(files)),
        log_(std::move(log)),
        sessions_(workers, [&client]() { return client.CreateSession(); }),
        pool_(workers) {
    counters_.push_back(&run_bytes_);
    if (bandwidth) counters_.push_back(bandwidth);
  }

  const RunRequest&                    request_;
  std::shared_ptr<UploadJob>           job_;
  TransferClient&                      client_;
  std::shared_ptr<spdlog::logger>      logger_;
  OrderedFileList                      files_;
  std::shared_ptr<UploadLog>           log_;

  AtomicCounter                        run_bytes_;
  std::vector<AtomicCounter*>          counters_;

  gallery_id_t                         gallery_id_{};
  uint32_t                             completed_   = 0;
  size_t                               in_flight_   = 0;
  bool                                 cancel_seen_ = false;
  std::vector<SuccessEntry>            succeeded_{};

  ConcurrentBlockingQueue<TaskOutcome> completions_;
  WorkerResourcePool<TransferSession>  sessions_;
  ThreadPool                           pool_;
};

auto StringField(const nlohmann::json& data, const char* key) -> std::string {
  if (!data.is_object()) return {};
  auto it = data.find(key);
  if (it == data.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

auto DescribePayload(const nlohmann::json& data) -> std::string {
  return data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// "Photo.JPG" -> "Photo.jpg"
auto NormalizeExtension(const file_name_t& name) -> file_name_t {
  auto dot = name.rfind('.');
  if (dot == file_name_t::npos || dot == 0) return name;
  file_name_t out = name;
  std::transform(out.begin() + static_cast<std::ptrdiff_t>(dot), out.end(),
                 out.begin() + static_cast<std::ptrdiff_t>(dot),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

void EnrichPayload(nlohmann::json& data, const file_name_t& name, byte_count_t size_bytes) {
  if (!data.is_object()) return;
  if (!data.contains("original_filename")) data["original_filename"] = NormalizeExtension(name);
  if (!data.contains("size_bytes")) data["size_bytes"] = size_bytes;
}

auto FolderDisplayName(const folder_path_t& folder) -> std::string {
  auto base = folder.filename();
  if (base.empty()) base = folder.parent_path().filename();
  auto u8 = base.u8string();
  return std::string(u8.begin(), u8.end());
}

auto CheckCancelled(RunContext& ctx) -> bool {
  if (ctx.cancel_seen_) return true;
  if (!ctx.job_) return false;
  bool cancelled = false;
  try {
    cancelled = ctx.job_->IsCancelled();
  } catch (const std::exception& e) {
    ctx.logger_->warn("Cancellation check raised, treating as not cancelled: {}", e.what());
  }
  if (cancelled) {
    ctx.cancel_seen_ = true;
    ctx.logger_->info("[{}] Stop requested, waiting for {} in-flight upload(s)",
                      ctx.gallery_id_.empty() ? "new gallery" : ctx.gallery_id_, ctx.in_flight_);
  }
  return cancelled;
}

void NotifyProgress(RunContext& ctx, const file_name_t& current) {
  if (!ctx.job_ || !ctx.job_->on_progress_) return;
  UploadProgress progress;
  progress.completed_    = ctx.completed_;
  progress.total_        = static_cast<uint32_t>(ctx.files_.Size());
  progress.percent_      = progress.completed_ * 100 / std::max<uint32_t>(progress.total_, 1);
  progress.current_file_ = current;
  try {
    ctx.job_->on_progress_(progress);
  } catch (const std::exception& e) {
    ctx.logger_->warn("Progress callback failed for {}: {}", current, e.what());
  }
}

void NotifyFileUploaded(RunContext& ctx, const file_name_t& name, const nlohmann::json& data,
                        byte_count_t size_bytes) {
  if (!ctx.job_ || !ctx.job_->on_file_uploaded_) return;
  try {
    ctx.job_->on_file_uploaded_(name, data, size_bytes);
  } catch (const std::exception& e) {
    ctx.logger_->warn("Upload callback failed for {}: {}", name, e.what());
  }
}

void SubmitUpload(RunContext& ctx, const file_name_t& name, bool create_gallery) {
  UploadRequest request;
  request.image_path_     = PathOf(ctx.request_.folder_, name);
  request.create_gallery_ = create_gallery;
  if (!create_gallery) request.gallery_id_ = ctx.gallery_id_;
  request.thumbnail_ = ctx.request_.thumbnail_;

  ctx.log_->MarkAttempt(name);
  ++ctx.in_flight_;
  ctx.pool_.Submit([&ctx, request = std::move(request), name](worker_slot_t slot) {
    TaskOutcome          outcome;
    outcome.file_name_ = name;
    DeltaProgressAdapter adapter(ctx.counters_);
    try {
      auto& session  = ctx.sessions_.Get(slot);
      auto  response = ctx.client_.UploadFile(request, session, adapter.AsCallback());
      if (response.success_) {
        outcome.success_ = true;
        outcome.data_    = std::move(response.data_);
      } else {
        outcome.error_ = "API error: " +
                         (response.error_.empty() ? DescribePayload(response.data_) : response.error_);
      }
    } catch (const std::exception& e) {
      outcome.error_ = std::string("Network error: ") + e.what();
    } catch (...) {
      outcome.error_ = "Network error: unknown exception";
    }
    // Exactly one outcome per submitted task, or the owner would wait forever
    ctx.completions_.push(std::move(outcome));
  });
}

void HandleOutcome(RunContext& ctx, TaskOutcome& outcome, std::vector<FailedUpload>& failed) {
  const file_name_t name = outcome.file_name_;
  if (outcome.success_) {
    ctx.log_->MarkSuccess(name);
    ++ctx.completed_;
    ctx.logger_->debug("[{}] {} uploaded ({})", ctx.gallery_id_, name,
                       StringField(outcome.data_, "image_url"));

    auto size = FileSizeOrZero(PathOf(ctx.request_.folder_, name));
    NotifyFileUploaded(ctx, name, outcome.data_, size);
    ctx.succeeded_.push_back(
        {ctx.files_.PositionOf(name).value_or(ctx.files_.Size()), name, size,
         std::move(outcome.data_)});
  } else {
    ctx.log_->MarkFailure(name, outcome.error_);
    ctx.logger_->warn("[{}] {} failed: {}", ctx.gallery_id_, name, outcome.error_);
    failed.push_back({name, outcome.error_});
  }
  NotifyProgress(ctx, name);
}

/**
 * @brief One sliding-window sweep over names: keep up to pool-size uploads in flight, refill a
 * slot each time any upload finishes, stop refilling once cancellation is observed.
 */
auto RunPass(RunContext& ctx, const std::vector<file_name_t>& names) -> PassOutcome {
  PassOutcome             outcome;
  std::deque<file_name_t> pending(names.begin(), names.end());
  const size_t            budget = ctx.pool_.ThreadCount();

  if (!CheckCancelled(ctx)) {
    while (ctx.in_flight_ < budget && !pending.empty()) {
      SubmitUpload(ctx, pending.front(), false);
      pending.pop_front();
    }
  }

  while (ctx.in_flight_ > 0) {
    TaskOutcome done = ctx.completions_.pop();
    --ctx.in_flight_;
    HandleOutcome(ctx, done, outcome.failed_);

    if (!pending.empty() && !CheckCancelled(ctx)) {
      SubmitUpload(ctx, pending.front(), false);
      pending.pop_front();
    }
  }

  outcome.unsubmitted_.assign(pending.begin(), pending.end());
  return outcome;
}

void SortByPosition(const OrderedFileList& files, std::vector<FailedUpload>& failed) {
  std::stable_sort(failed.begin(), failed.end(),
                   [&files](const FailedUpload& a, const FailedUpload& b) {
                     return files.PositionOf(a.file_name_).value_or(files.Size()) <
                            files.PositionOf(b.file_name_).value_or(files.Size());
                   });
}

void LogSummary(const std::shared_ptr<spdlog::logger>& logger, const RunResult& result) {
  if (result.failed_count_ == 0 && result.never_attempted_count_ == 0) {
    logger->info("Uploaded {} images ({:.1f} MiB) in {:.1f}s: {} -> {}", result.successful_count_,
                 static_cast<double>(result.uploaded_size_) / (1024.0 * 1024.0),
                 result.upload_time_, result.gallery_name_, result.gallery_url_);
    return;
  }
  logger->warn("Gallery '{}' completed with failures in {:.1f}s ({}/{} images, {} not attempted)",
               result.gallery_id_, result.upload_time_, result.successful_count_,
               result.total_images_, result.never_attempted_count_);
  for (const auto& failure : result.failed_details_) {
    logger->warn("  {}: {}", failure.file_name_, failure.error_);
  }
}
};  // namespace

UploadServiceImpl::UploadServiceImpl(std::shared_ptr<TransferClient>          client,
                                     std::shared_ptr<RenameDispatcher>        rename_dispatcher,
                                     std::shared_ptr<GalleryExistenceChecker> existence_checker,
                                     std::shared_ptr<AtomicCounter>           bandwidth_counter)
    : client_(std::move(client)),
      rename_dispatcher_(std::move(rename_dispatcher)),
      existence_checker_(std::move(existence_checker)),
      bandwidth_counter_(std::move(bandwidth_counter)) {
  if (!client_) {
    throw std::invalid_argument("UploadServiceImpl: a transfer client is required");
  }
  if (!rename_dispatcher_) rename_dispatcher_ = std::make_shared<NoopRenameDispatcher>();
  if (!existence_checker_) existence_checker_ = std::make_shared<NullExistenceChecker>();
}

auto UploadServiceImpl::Run(const RunRequest& request, std::shared_ptr<UploadJob> job)
    -> RunResult {
  auto logger = Logger::GetLogger("upload");

  if (request.concurrency_ <= 0) {
    throw UploadRunError(UploadErrorCode::INVALID_REQUEST,
                         fmt::format("UploadService: concurrency must be positive, got {}",
                                     request.concurrency_));
  }
  if (request.max_retries_ < 0) {
    throw UploadRunError(UploadErrorCode::INVALID_REQUEST,
                         fmt::format("UploadService: max retries must not be negative, got {}",
                                     request.max_retries_));
  }
  if (request.existing_gallery_id_ && request.existing_gallery_id_->empty()) {
    throw UploadRunError(UploadErrorCode::INVALID_REQUEST,
                         "UploadService: existing gallery id is empty");
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(request.folder_, ec)) {
    throw UploadRunError(UploadErrorCode::FOLDER_NOT_FOUND,
                         "UploadService: folder not found: " + request.folder_.string());
  }

  OrderedFileList files;
  try {
    files = OrderedFileList::FromFolder(request.folder_);
  } catch (const std::filesystem::filesystem_error& e) {
    throw UploadRunError(UploadErrorCode::FOLDER_NOT_FOUND,
                         fmt::format("UploadService: cannot read folder {}: {}",
                                     request.folder_.string(), e.what()));
  }

  std::vector<file_name_t> to_upload;
  uint32_t                 resumed      = 0;
  byte_count_t             resume_bytes = 0;
  byte_count_t             total_size   = 0;
  for (const auto& name : files.Names()) {
    auto size = FileSizeOrZero(PathOf(request.folder_, name));
    total_size += size;
    if (request.already_uploaded_.count(name) > 0) {
      ++resumed;
      resume_bytes += size;
    } else {
      to_upload.push_back(name);
    }
  }
  if (to_upload.empty()) {
    throw UploadRunError(
        UploadErrorCode::NO_IMAGES,
        files.Empty()
            ? "UploadService: no image files found in " + request.folder_.string()
            : fmt::format("UploadService: all {} images in {} were already uploaded",
                          files.Size(), request.folder_.string()));
  }

  const std::string raw_name     = request.gallery_name_.value_or(FolderDisplayName(request.folder_));
  const std::string gallery_name = SanitizeGalleryName(raw_name);
  if (gallery_name != raw_name) {
    logger->info("Sanitized gallery name: '{}' -> '{}'", raw_name, gallery_name);
  }

  if (!request.existing_gallery_id_) {
    std::vector<folder_path_t> matches;
    try {
      matches = existence_checker_->FindExisting(gallery_name, request.folder_);
    } catch (const std::exception& e) {
      logger->warn("Lookup of earlier uploads of '{}' failed: {}", gallery_name, e.what());
    }
    if (!matches.empty()) {
      logger->warn("Gallery '{}' was uploaded before ({} artifact(s), e.g. {})", gallery_name,
                   matches.size(), matches.front().string());
      if (job && job->confirm_duplicate_ && !job->confirm_duplicate_(gallery_name, matches)) {
        throw UploadRunError(UploadErrorCode::GALLERY_ALREADY_EXISTS,
                             "UploadService: gallery '" + gallery_name + "' already exists");
      }
    }
  }

  auto upload_log = std::make_shared<UploadLog>();
  if (job) {
    job->upload_log_ = upload_log;
  }

  RunResult result;
  result.gallery_name_        = gallery_name;
  result.thumbnail_           = request.thumbnail_;
  result.parallel_batch_size_ = static_cast<uint32_t>(request.concurrency_);
  result.template_name_       = request.template_name_;
  result.dimensions_          = request.dimensions_;
  result.total_images_        = static_cast<uint32_t>(files.Size());
  result.total_size_          = total_size;

  TimeProvider::Refresh();
  result.started_at_ = TimeProvider::Now();
  const auto start   = std::chrono::steady_clock::now();

  const size_t workers =
      std::min(static_cast<size_t>(request.concurrency_), std::max<size_t>(to_upload.size(), 1));
  RunContext ctx(request, job, *client_, std::move(files), upload_log, bandwidth_counter_.get(),
                 workers);
  ctx.completed_ = resumed;

  bool fresh_gallery = false;
  if (request.existing_gallery_id_) {
    ctx.gallery_id_ = *request.existing_gallery_id_;
    logger->info("[{}] Resuming with {} of {} images already uploaded", ctx.gallery_id_, resumed,
                 ctx.files_.Size());
  } else {
    const file_name_t first = to_upload.front();
    to_upload.erase(to_upload.begin());
    logger->info("Uploading first image to create gallery: {}", first);

    SubmitUpload(ctx, first, true);
    TaskOutcome created = ctx.completions_.pop();
    --ctx.in_flight_;

    gallery_id_t gallery_id = created.success_ ? StringField(created.data_, "gallery_id") : "";
    if (gallery_id.empty()) {
      std::string reason = created.success_
                               ? "response carries no gallery_id: " + DescribePayload(created.data_)
                               : created.error_;
      upload_log->MarkFailure(first, reason);
      // Without a gallery id no other upload can go anywhere
      throw UploadRunError(UploadErrorCode::GALLERY_CREATE_FAILED,
                           fmt::format("UploadService: failed to create gallery from {}: {}",
                                       first, reason));
    }
    ctx.gallery_id_ = gallery_id;
    fresh_gallery   = true;
    logger->info("[{}] Created gallery '{}'", gallery_id, gallery_name);

    std::vector<FailedUpload> none;
    HandleOutcome(ctx, created, none);
  }

  // First pass
  auto                      first_pass      = RunPass(ctx, to_upload);
  std::vector<FailedUpload> failed          = std::move(first_pass.failed_);
  std::vector<file_name_t>  never_attempted = std::move(first_pass.unsubmitted_);

  // Retry passes over the survivors only
  int retry = 0;
  while (!failed.empty() && retry < request.max_retries_ && !CheckCancelled(ctx)) {
    ++retry;
    SortByPosition(ctx.files_, failed);
    logger->info("[{}] Retrying {} failed uploads (attempt {}/{})", ctx.gallery_id_,
                 failed.size(), retry, request.max_retries_);

    std::map<file_name_t, std::string> last_errors;
    std::vector<file_name_t>           names;
    names.reserve(failed.size());
    for (const auto& failure : failed) {
      last_errors[failure.file_name_] = failure.error_;
      names.push_back(failure.file_name_);
    }

    auto pass = RunPass(ctx, names);
    failed    = std::move(pass.failed_);
    for (const auto& name : pass.unsubmitted_) {
      failed.push_back({name, last_errors[name]});
    }
  }
  SortByPosition(ctx.files_, failed);

  // Finalize
  result.upload_time_ =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

  std::stable_sort(ctx.succeeded_.begin(), ctx.succeeded_.end(),
                   [](const SuccessEntry& a, const SuccessEntry& b) {
                     return a.position_ < b.position_;
                   });
  byte_count_t uploaded = resume_bytes;
  result.images_.reserve(ctx.succeeded_.size());
  for (auto& entry : ctx.succeeded_) {
    uploaded += entry.size_bytes_;
    EnrichPayload(entry.data_, entry.file_name_, entry.size_bytes_);
    result.images_.push_back(std::move(entry.data_));
  }

  result.gallery_id_            = ctx.gallery_id_;
  result.successful_count_      = ctx.completed_;
  result.failed_count_          = static_cast<uint32_t>(failed.size());
  result.failed_details_        = std::move(failed);
  result.never_attempted_count_ = static_cast<uint32_t>(never_attempted.size());
  result.incomplete_files_      = std::move(never_attempted);
  result.retry_passes_          = static_cast<uint32_t>(retry);
  result.cancelled_             = ctx.cancel_seen_;
  result.uploaded_size_         = uploaded;
  result.transferred_bytes_     = ctx.run_bytes_.Get();
  result.transfer_speed_ =
      result.upload_time_ > 0.0 ? static_cast<double>(uploaded) / result.upload_time_ : 0.0;

  try {
    result.gallery_url_ = client_->GalleryUrl(ctx.gallery_id_);
  } catch (const std::exception& e) {
    logger->warn("[{}] Gallery URL unavailable: {}", ctx.gallery_id_, e.what());
  }

  if (fresh_gallery || request.gallery_known_unnamed_) {
    try {
      result.rename_dispatched_ = rename_dispatcher_->Dispatch(ctx.gallery_id_, gallery_name);
    } catch (const std::exception& e) {
      // Non-fatal: the images are uploaded, only the display name is missing
      logger->warn("[{}] Rename dispatch for '{}' failed: {}", ctx.gallery_id_, gallery_name,
                   e.what());
    }
  }

  result.finished_at_ = TimeProvider::Now();
  LogSummary(logger, result);
  return result;
}

auto ToJson(const RunResult& result) -> nlohmann::json {
  nlohmann::json failed = nlohmann::json::array();
  for (const auto& failure : result.failed_details_) {
    failed.push_back({{"filename", failure.file_name_}, {"error", failure.error_}});
  }

  nlohmann::json j = {
      {"gallery_id", result.gallery_id_},
      {"gallery_url", result.gallery_url_},
      {"gallery_name", result.gallery_name_},
      {"images", result.images_},
      {"successful_count", result.successful_count_},
      {"failed_count", result.failed_count_},
      {"never_attempted_count", result.never_attempted_count_},
      {"total_images", result.total_images_},
      {"failed_details", failed},
      {"incomplete_files", result.incomplete_files_},
      {"retry_passes", result.retry_passes_},
      {"cancelled", result.cancelled_},
      {"started_at", TimeProvider::TimePointToString(result.started_at_)},
      {"finished_at", TimeProvider::TimePointToString(result.finished_at_)},
      {"upload_time", result.upload_time_},
      {"total_size", result.total_size_},
      {"uploaded_size", result.uploaded_size_},
      {"transferred_bytes", result.transferred_bytes_},
      {"transfer_speed", result.transfer_speed_},
      {"thumbnail_size", result.thumbnail_.size_},
      {"thumbnail_format", result.thumbnail_.format_},
      {"public_gallery", result.thumbnail_.public_gallery_ ? 1 : 0},
      {"parallel_batch_size", result.parallel_batch_size_},
      {"template_name", result.template_name_},
      {"rename_dispatched", result.rename_dispatched_}};

  const ImageDimensions dims = result.dimensions_.value_or(ImageDimensions{});
  j["avg_width"]             = dims.avg_width_;
  j["avg_height"]            = dims.avg_height_;
  j["max_width"]             = dims.max_width_;
  j["max_height"]            = dims.max_height_;
  j["min_width"]             = dims.min_width_;
  j["min_height"]            = dims.min_height_;
  return j;
}
};  // namespace galleon
