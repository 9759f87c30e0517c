//  Copyright 2025 Yurun Zi
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

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "type/type.hpp"

namespace galleon {
/**
 * @brief List the uploadable images directly inside a folder, in no particular order.
 * Throws std::filesystem::filesystem_error if the folder cannot be read.
 */
auto ScanFolder(const folder_path_t& folder) -> std::vector<file_name_t>;

/**
 * @brief Sort file names into display order (see NaturalLess)
 */
auto OrderFileNames(std::vector<file_name_t> names) -> std::vector<file_name_t>;

/**
 * @brief Full path of a UTF-8 file name inside a folder
 */
auto PathOf(const folder_path_t& folder, const file_name_t& name) -> folder_path_t;

/**
 * @brief Size of a file, or 0 if it cannot be read
 */
auto FileSizeOrZero(const folder_path_t& path) -> byte_count_t;

/**
 * @brief Display-ordered file names plus their position index. Built once, never modified.
 */
class OrderedFileList {
 public:
  OrderedFileList() = default;
  explicit OrderedFileList(std::vector<file_name_t> names);

  static auto FromFolder(const folder_path_t& folder) -> OrderedFileList;

  auto        Names() const -> const std::vector<file_name_t>& { return names_; }
  auto        Size() const -> size_t { return names_.size(); }
  auto        Empty() const -> bool { return names_.empty(); }
  auto        PositionOf(const file_name_t& name) const -> std::optional<size_t>;
  auto        Contains(const file_name_t& name) const -> bool;

 private:
  std::vector<file_name_t>                names_;
  std::unordered_map<file_name_t, size_t> positions_;
};
};  // namespace galleon
