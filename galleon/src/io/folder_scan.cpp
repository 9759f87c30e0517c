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

#include "io/folder_scan.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "type/supported_file_type.hpp"
#include "utils/string/natural_order.hpp"

namespace galleon {
auto ScanFolder(const folder_path_t& folder) -> std::vector<file_name_t> {
  std::vector<file_name_t> names;
  for (const auto& entry : std::filesystem::directory_iterator(folder)) {
    if (!IsUploadableFile(entry.path())) continue;
    // u8string keeps names stable when the native encoding is not UTF-8
    auto u8 = entry.path().filename().u8string();
    names.emplace_back(u8.begin(), u8.end());
  }
  return names;
}

auto OrderFileNames(std::vector<file_name_t> names) -> std::vector<file_name_t> {
  std::sort(names.begin(), names.end(), NaturalLess);
  names.erase(std::unique(names.begin(), names.end()), names.end());
  return names;
}

auto PathOf(const folder_path_t& folder, const file_name_t& name) -> folder_path_t {
  return folder / std::filesystem::path(std::u8string(name.begin(), name.end()));
}

auto FileSizeOrZero(const folder_path_t& path) -> byte_count_t {
  std::error_code ec;
  auto            size = std::filesystem::file_size(path, ec);
  if (ec) return 0;
  return static_cast<byte_count_t>(size);
}

OrderedFileList::OrderedFileList(std::vector<file_name_t> names)
    : names_(OrderFileNames(std::move(names))) {
  positions_.reserve(names_.size());
  for (size_t i = 0; i < names_.size(); ++i) {
    positions_.emplace(names_[i], i);
  }
}

auto OrderedFileList::FromFolder(const folder_path_t& folder) -> OrderedFileList {
  return OrderedFileList(ScanFolder(folder));
}

auto OrderedFileList::PositionOf(const file_name_t& name) const -> std::optional<size_t> {
  auto it = positions_.find(name);
  if (it == positions_.end()) return std::nullopt;
  return it->second;
}

auto OrderedFileList::Contains(const file_name_t& name) const -> bool {
  return positions_.find(name) != positions_.end();
}
};  // namespace galleon
