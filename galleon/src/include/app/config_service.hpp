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

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "app/upload_service.hpp"

namespace galleon {
struct UploadDefaults {
  int                   thumbnail_size_      = 3;  // 1, 2, 3, 4 or 6
  int                   thumbnail_format_    = 2;  // 1..4
  int                   max_retries_         = 3;
  int                   parallel_batch_size_ = 4;
  bool                  public_gallery_      = true;
  std::string           template_name_       = "default";
  bool                  auto_rename_         = true;
  std::filesystem::path central_store_path_  = DefaultCentralStore();

  // ~/.galleon, or ./.galleon when no home directory is known
  static auto DefaultCentralStore() -> std::filesystem::path;
};

class ConfigService {
 public:
  /**
   * @brief Read defaults from a JSON file. Keys that are absent keep their default value.
   * Throws std::runtime_error if the file cannot be read, is not JSON or holds invalid values.
   */
  static auto Load(const std::filesystem::path& path) -> UploadDefaults;

  // Like Load, but logs and falls back to built-in defaults on any error
  static auto LoadOrDefault(const std::filesystem::path& path) -> UploadDefaults;

  static void Save(const std::filesystem::path& path, const UploadDefaults& defaults);

  static auto FromJson(const nlohmann::json& j) -> UploadDefaults;
  static auto ToJson(const UploadDefaults& defaults) -> nlohmann::json;
};

auto ToRunRequest(const UploadDefaults& defaults, const folder_path_t& folder) -> RunRequest;
};  // namespace galleon
