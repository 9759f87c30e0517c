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

#include "transfer/directory_transfer_client.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "io/folder_scan.hpp"
#include "utils/log/logger.hpp"

namespace galleon {
namespace {
// Holds the copy buffer so each worker reuses its own allocation
class DirectorySession final : public TransferSession {
 public:
  DirectorySession(uint64_t id, size_t chunk_size) : id_(id), buffer_(chunk_size) {}

  uint64_t          id_;
  std::vector<char> buffer_;
};

auto ToUrl(const folder_path_t& path) -> std::string {
  auto u8 = std::filesystem::absolute(path).generic_u8string();
  return "file://" + std::string(u8.begin(), u8.end());
}

auto Failure(std::string message) -> UploadResponse {
  UploadResponse response;
  response.success_ = false;
  response.error_   = std::move(message);
  return response;
}

auto StartId() -> uint64_t {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count()) *
         1000;
}
};  // namespace

DirectoryTransferClient::DirectoryTransferClient(folder_path_t root, size_t chunk_size)
    : root_(std::move(root)), chunk_size_(chunk_size), gallery_ids_(StartId()) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("DirectoryTransferClient: chunk size must be positive");
  }
  std::filesystem::create_directories(root_);
}

auto DirectoryTransferClient::CreateSession() -> std::unique_ptr<TransferSession> {
  return std::make_unique<DirectorySession>(session_ids_.GenerateID(), chunk_size_);
}

auto DirectoryTransferClient::UploadFile(const UploadRequest& request, TransferSession& session,
                                         const TransferProgressCallback& on_progress)
    -> UploadResponse {
  auto* dir_session = dynamic_cast<DirectorySession*>(&session);
  if (dir_session == nullptr) {
    throw std::invalid_argument("DirectoryTransferClient: foreign session");
  }

  gallery_id_t gallery_id;
  if (request.create_gallery_) {
    // Skip ids whose directory is already taken by an earlier process
    std::error_code ec;
    do {
      gallery_id = "g" + std::to_string(gallery_ids_.GenerateID());
    } while (!std::filesystem::create_directory(root_ / gallery_id, ec) && !ec);
    if (ec) {
      return Failure("cannot create gallery directory: " + ec.message());
    }
    Logger::GetLogger("transfer")->info("Created gallery {} under {}", gallery_id,
                                        root_.string());
  } else {
    if (!request.gallery_id_ || request.gallery_id_->empty()) {
      return Failure("no gallery id given");
    }
    gallery_id = *request.gallery_id_;
    if (!std::filesystem::is_directory(root_ / gallery_id)) {
      return Failure("unknown gallery " + gallery_id);
    }
  }

  // A gallery created by this call must not outlive a failed upload
  auto fail = [&](std::string message) {
    if (request.create_gallery_) {
      std::error_code ec;
      std::filesystem::remove_all(root_ / gallery_id, ec);
    }
    return Failure(std::move(message));
  };

  std::ifstream in(request.image_path_, std::ios::binary);
  if (!in.is_open()) {
    return fail("cannot open " + request.image_path_.string());
  }
  const byte_count_t total  = FileSizeOrZero(request.image_path_);
  const auto         target = root_ / gallery_id / request.image_path_.filename();
  std::ofstream      out(target, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return fail("cannot write " + target.string());
  }

  auto&        buffer = dir_session->buffer_;
  byte_count_t sent   = 0;
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if (got <= 0) break;
    out.write(buffer.data(), got);
    if (!out) {
      out.close();
      return fail("short write to " + target.string());
    }
    sent += static_cast<byte_count_t>(got);
    if (on_progress) on_progress(sent, total);
  }
  if (in.bad()) {
    out.close();
    return fail("read error on " + request.image_path_.string());
  }
  out.close();

  auto           image_id = "i" + std::to_string(image_ids_.GenerateID());
  UploadResponse response;
  response.success_ = true;
  response.data_    = {{"gallery_id", gallery_id},
                       {"image_id", image_id},
                       {"image_url", ToUrl(target)},
                       {"thumb_url", ToUrl(target)}};
  return response;
}

auto DirectoryGalleryRenamer::RenameGallery(const gallery_id_t& gallery_id,
                                            const std::string&  gallery_name) -> bool {
  const auto gallery_dir = root_ / gallery_id;
  if (gallery_id.empty() || !std::filesystem::is_directory(gallery_dir)) {
    return false;
  }
  std::ofstream file(gallery_dir / kNameFile, std::ios::trunc);
  if (!file.is_open()) {
    return false;
  }
  file << gallery_name;
  file.close();
  return static_cast<bool>(file);
}

auto DirectoryTransferClient::GalleryUrl(const gallery_id_t& gallery_id) const -> std::string {
  return ToUrl(root_ / gallery_id);
}
};  // namespace galleon
