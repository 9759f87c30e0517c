#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "app/upload_service.hpp"
#include "io/folder_scan.hpp"
#include "test_fixation.hpp"
#include "transfer/transfer_client.hpp"

namespace galleon {
/**
 * @brief Scriptable in-process transfer client: injected failures, random latency and
 * bookkeeping of every call and of the number of simultaneous transfers.
 */
class FakeTransferClient final : public TransferClient {
 public:
  struct Call {
    file_name_t                 file_name_;
    bool                        create_gallery_ = false;
    std::optional<gallery_id_t> gallery_id_;
  };

  class FakeSession final : public TransferSession {
   public:
    std::atomic<int> users_{0};
  };

  gallery_id_t      gallery_id_ = "G1";
  std::atomic<bool> fail_gallery_creation_{false};
  std::atomic<bool> omit_gallery_id_{false};
  int               min_latency_ms_ = 0;
  int               max_latency_ms_ = 0;

  // The next `times` uploads of name fail; with throw_error they throw instead of returning
  void FailTimes(const file_name_t& name, int times, bool throw_error = false) {
    std::lock_guard<std::mutex> lock(mtx_);
    failures_[name] = {times, throw_error};
  }

  auto CreateSession() -> std::unique_ptr<TransferSession> override {
    sessions_created_.fetch_add(1);
    return std::make_unique<FakeSession>();
  }

  auto UploadFile(const UploadRequest& request, TransferSession& session,
                  const TransferProgressCallback& on_progress) -> UploadResponse override {
    auto              u8 = request.image_path_.filename().u8string();
    const file_name_t name(u8.begin(), u8.end());

    auto&             fake = dynamic_cast<FakeSession&>(session);
    if (fake.users_.fetch_add(1) != 0) shared_session_used_ = true;
    int now = in_flight_.fetch_add(1) + 1;
    int seen = high_water_.load();
    while (now > seen && !high_water_.compare_exchange_weak(seen, now)) {
    }

    bool fail        = false;
    bool throw_error = false;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      calls_.push_back({name, request.create_gallery_, request.gallery_id_});
      auto it = failures_.find(name);
      if (it != failures_.end() && it->second.first > 0) {
        --it->second.first;
        fail        = true;
        throw_error = it->second.second;
      }
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(NextLatency()));
    const byte_count_t total = FileSizeOrZero(request.image_path_);
    if (on_progress) {
      on_progress(total / 2, total);
      on_progress(total / 2, total);
      on_progress(total, total);
    }

    in_flight_.fetch_sub(1);
    fake.users_.fetch_sub(1);

    if (request.create_gallery_ && fail_gallery_creation_) {
      return {false, nlohmann::json::object(), "gallery quota exceeded"};
    }
    if (fail) {
      if (throw_error) throw std::runtime_error("connection reset");
      return {false, nlohmann::json::object(), "server busy"};
    }

    UploadResponse response;
    response.success_ = true;
    response.data_    = {{"image_id", "id_" + name},
                         {"image_url", "https://img.example/i/" + name}};
    if (!(request.create_gallery_ && omit_gallery_id_)) {
      response.data_["gallery_id"] =
          request.create_gallery_ ? gallery_id_ : request.gallery_id_.value_or("");
    }
    return response;
  }

  auto GalleryUrl(const gallery_id_t& gallery_id) const -> std::string override {
    return "https://img.example/g/" + gallery_id;
  }

  auto Calls() const -> std::vector<Call> {
    std::lock_guard<std::mutex> lock(mtx_);
    return calls_;
  }

  auto AttemptsOf(const file_name_t& name) const -> int {
    std::lock_guard<std::mutex> lock(mtx_);
    int                         attempts = 0;
    for (const auto& call : calls_) {
      if (call.file_name_ == name) ++attempts;
    }
    return attempts;
  }

  auto HighWater() const -> int { return high_water_.load(); }
  auto SessionsCreated() const -> int { return sessions_created_.load(); }
  auto SharedSessionUsed() const -> bool { return shared_session_used_.load(); }

 private:
  auto NextLatency() -> int {
    if (max_latency_ms_ <= min_latency_ms_) return min_latency_ms_;
    std::lock_guard<std::mutex>        lock(mtx_);
    std::uniform_int_distribution<int> dist(min_latency_ms_, max_latency_ms_);
    return dist(rng_);
  }

  mutable std::mutex                             mtx_;
  std::vector<Call>                              calls_;
  std::map<file_name_t, std::pair<int, bool>>    failures_;
  std::mt19937                                   rng_{std::random_device{}()};
  std::atomic<int>                               in_flight_{0};
  std::atomic<int>                               high_water_{0};
  std::atomic<int>                               sessions_created_{0};
  std::atomic<bool>                              shared_session_used_{false};
};

class RecordingDispatcher final : public RenameDispatcher {
 public:
  bool throw_on_dispatch_ = false;

  auto Dispatch(const gallery_id_t& gallery_id, const std::string& gallery_name) -> bool override {
    if (throw_on_dispatch_) throw std::runtime_error("rename backend down");
    std::lock_guard<std::mutex> lock(mtx_);
    dispatched_.push_back({gallery_id, gallery_name});
    return true;
  }

  auto Dispatched() const -> std::vector<std::pair<gallery_id_t, std::string>> {
    std::lock_guard<std::mutex> lock(mtx_);
    return dispatched_;
  }

 private:
  mutable std::mutex                                 mtx_;
  std::vector<std::pair<gallery_id_t, std::string>>  dispatched_;
};

class FixedExistenceChecker final : public GalleryExistenceChecker {
 public:
  std::vector<folder_path_t> matches_;

  auto FindExisting(const std::string&, const folder_path_t&) const
      -> std::vector<folder_path_t> override {
    return matches_;
  }
};

class UploadServiceTests : public TempFolderTest {
 protected:
  std::shared_ptr<FakeTransferClient> client_;

  void                                SetUp() override {
    TempFolderTest::SetUp();
    client_ = std::make_shared<FakeTransferClient>();
  }

  auto MakeRequest(int concurrency = 2, int max_retries = 3) -> RunRequest {
    RunRequest request;
    request.folder_      = folder_;
    request.concurrency_ = concurrency;
    request.max_retries_ = max_retries;
    return request;
  }

  static auto UploadedNames(const RunResult& result) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& image : result.images_) {
      names.push_back(image.value("original_filename", std::string()));
    }
    return names;
  }

  static auto Conserved(const RunResult& result) -> bool {
    return result.successful_count_ + result.failed_count_ + result.never_attempted_count_ ==
           result.total_images_;
  }
};
}  // namespace galleon
