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
#include <vector>

#include "type/type.hpp"

namespace galleon {
/**
 * @brief Receives galleries that still need their human-readable name applied
 */
class RenameDispatcher {
 public:
  virtual ~RenameDispatcher() = default;

  /**
   * @return true if the request was accepted (queued for renaming or recorded for later)
   */
  virtual auto Dispatch(const gallery_id_t& gallery_id, const std::string& gallery_name)
      -> bool = 0;
};

class NoopRenameDispatcher final : public RenameDispatcher {
 public:
  auto Dispatch(const gallery_id_t&, const std::string&) -> bool override { return false; }
};

/**
 * @brief Looks for evidence that a gallery with the same name was uploaded before
 */
class GalleryExistenceChecker {
 public:
  virtual ~GalleryExistenceChecker() = default;

  virtual auto FindExisting(const std::string& gallery_name, const folder_path_t& folder) const
      -> std::vector<folder_path_t> = 0;
};

class NullExistenceChecker final : public GalleryExistenceChecker {
 public:
  auto FindExisting(const std::string&, const folder_path_t&) const
      -> std::vector<folder_path_t> override {
    return {};
  }
};
};  // namespace galleon
