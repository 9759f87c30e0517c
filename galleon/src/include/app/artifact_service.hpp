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

#include <string>
#include <utility>
#include <vector>

#include "app/upload_hooks.hpp"
#include "app/upload_service.hpp"

namespace galleon {
// Subfolder of an uploaded folder that keeps its own copy of the artifacts
static constexpr const char* kUploadedSubfolder = ".uploaded";

class ArtifactService {
 public:
  /**
   * @brief Write the result as <gallery name>_<gallery id>.json into dir, creating dir if needed
   *
   * @return path of the written file
   */
  static auto WriteResult(const RunResult& result, const folder_path_t& dir) -> folder_path_t;

  static auto ArtifactName(const std::string& gallery_name, const gallery_id_t& gallery_id)
      -> std::string;
};

/**
 * @brief Finds <name>_*.json and <name>_*_bbcode.txt artifacts in the central store and in the
 * folder's .uploaded subfolder
 */
class ArtifactExistenceChecker final : public GalleryExistenceChecker {
 public:
  explicit ArtifactExistenceChecker(folder_path_t central_dir)
      : central_dir_(std::move(central_dir)) {}

  auto FindExisting(const std::string& gallery_name, const folder_path_t& folder) const
      -> std::vector<folder_path_t> override;

 private:
  folder_path_t central_dir_;
};
};  // namespace galleon
