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

#include "app/config_service.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include "utils/log/logger.hpp"

namespace galleon {
namespace {
auto IsValidThumbnailSize(int size) -> bool {
  return size == 1 || size == 2 || size == 3 || size == 4 || size == 6;
}

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end()) return;
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("ConfigService: bad value for '") + key + "': " +
                             e.what());
  }
}

void Validate(const UploadDefaults& defaults) {
  if (!IsValidThumbnailSize(defaults.thumbnail_size_)) {
    throw std::runtime_error("ConfigService: thumbnail_size must be one of 1, 2, 3, 4, 6, got " +
                             std::to_string(defaults.thumbnail_size_));
  }
  if (defaults.thumbnail_format_ < 1 || defaults.thumbnail_format_ > 4) {
    throw std::runtime_error("ConfigService: thumbnail_format must be within 1..4, got " +
                             std::to_string(defaults.thumbnail_format_));
  }
  if (defaults.max_retries_ < 0) {
    throw std::runtime_error("ConfigService: max_retries must not be negative, got " +
                             std::to_string(defaults.max_retries_));
  }
  if (defaults.parallel_batch_size_ < 1) {
    throw std::runtime_error("ConfigService: parallel_batch_size must be positive, got " +
                             std::to_string(defaults.parallel_batch_size_));
  }
}
};  // namespace

auto UploadDefaults::DefaultCentralStore() -> std::filesystem::path {
#if defined(_WIN32)
  const char* home = std::getenv("USERPROFILE");
#else
  const char* home = std::getenv("HOME");
#endif
  if (home == nullptr || *home == '\0') {
    return std::filesystem::path(".galleon");
  }
  return std::filesystem::path(home) / ".galleon";
}

auto ConfigService::FromJson(const nlohmann::json& j) -> UploadDefaults {
  if (!j.is_object()) {
    throw std::runtime_error("ConfigService: configuration must be a JSON object");
  }
  UploadDefaults defaults;
  ReadKey(j, "thumbnail_size", defaults.thumbnail_size_);
  ReadKey(j, "thumbnail_format", defaults.thumbnail_format_);
  ReadKey(j, "max_retries", defaults.max_retries_);
  ReadKey(j, "parallel_batch_size", defaults.parallel_batch_size_);
  ReadKey(j, "template_name", defaults.template_name_);
  ReadKey(j, "auto_rename", defaults.auto_rename_);

  // Stored as 0/1
  int public_gallery = defaults.public_gallery_ ? 1 : 0;
  ReadKey(j, "public_gallery", public_gallery);
  defaults.public_gallery_ = public_gallery != 0;

  std::string store;
  ReadKey(j, "central_store_path", store);
  if (!store.empty()) {
    defaults.central_store_path_ =
        std::filesystem::path(std::u8string(store.begin(), store.end()));
  }

  Validate(defaults);
  return defaults;
}

auto ConfigService::ToJson(const UploadDefaults& defaults) -> nlohmann::json {
  nlohmann::json j;
  j["thumbnail_size"]      = defaults.thumbnail_size_;
  j["thumbnail_format"]    = defaults.thumbnail_format_;
  j["max_retries"]         = defaults.max_retries_;
  j["parallel_batch_size"] = defaults.parallel_batch_size_;
  j["public_gallery"]      = defaults.public_gallery_ ? 1 : 0;
  j["template_name"]       = defaults.template_name_;
  j["auto_rename"]         = defaults.auto_rename_;
  auto store               = defaults.central_store_path_.u8string();
  j["central_store_path"]  = std::string(store.begin(), store.end());
  return j;
}

auto ConfigService::Load(const std::filesystem::path& path) -> UploadDefaults {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("ConfigService: failed to open " + path.string() + " for reading");
  }

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("ConfigService: malformed " + path.string() + ": " + e.what());
  }
  return FromJson(j);
}

auto ConfigService::LoadOrDefault(const std::filesystem::path& path) -> UploadDefaults {
  auto logger = Logger::GetLogger("config");
  if (!std::filesystem::exists(path)) {
    logger->debug("No configuration at {}, using defaults", path.string());
    return UploadDefaults{};
  }
  try {
    return Load(path);
  } catch (const std::exception& e) {
    logger->warn("Ignoring configuration: {}", e.what());
    return UploadDefaults{};
  }
}

void ConfigService::Save(const std::filesystem::path& path, const UploadDefaults& defaults) {
  Validate(defaults);
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("ConfigService: failed to open " + path.string() + " for writing");
  }
  file << ToJson(defaults).dump(4);
  file.close();
}

auto ToRunRequest(const UploadDefaults& defaults, const folder_path_t& folder) -> RunRequest {
  RunRequest request;
  request.folder_                    = folder;
  request.thumbnail_.size_           = defaults.thumbnail_size_;
  request.thumbnail_.format_         = defaults.thumbnail_format_;
  request.thumbnail_.public_gallery_ = defaults.public_gallery_;
  request.max_retries_               = defaults.max_retries_;
  request.concurrency_               = defaults.parallel_batch_size_;
  request.template_name_             = defaults.template_name_;
  return request;
}
};  // namespace galleon
