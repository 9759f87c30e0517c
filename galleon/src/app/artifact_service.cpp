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

#include "app/artifact_service.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "utils/log/logger.hpp"

namespace galleon {
namespace {
auto EndsWith(const std::string& s, const std::string& suffix) -> bool {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void CollectMatches(const folder_path_t& dir, const std::string& prefix,
                    std::vector<folder_path_t>& out) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) return;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    auto        u8 = it->path().filename().u8string();
    std::string name(u8.begin(), u8.end());
    if (name.rfind(prefix, 0) != 0) continue;
    if (EndsWith(name, ".json") || EndsWith(name, "_bbcode.txt")) {
      out.push_back(it->path());
    }
  }
}
};  // namespace

auto ArtifactService::ArtifactName(const std::string& gallery_name, const gallery_id_t& gallery_id)
    -> std::string {
  std::string id = gallery_id;
  std::replace_if(
      id.begin(), id.end(), [](char c) { return c == '/' || c == '\\' || c == ':'; }, '_');
  return gallery_name + "_" + id + ".json";
}

auto ArtifactService::WriteResult(const RunResult& result, const folder_path_t& dir)
    -> folder_path_t {
  std::filesystem::create_directories(dir);
  const auto    path = dir / ArtifactName(result.gallery_name_, result.gallery_id_);

  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("ArtifactService: failed to open " + path.string() + " for writing");
  }
  file << ToJson(result).dump(4);
  file.close();
  if (!file) {
    throw std::runtime_error("ArtifactService: failed to write " + path.string());
  }
  Logger::GetLogger("upload")->debug("Wrote artifact {}", path.string());
  return path;
}

auto ArtifactExistenceChecker::FindExisting(const std::string&   gallery_name,
                                            const folder_path_t& folder) const
    -> std::vector<folder_path_t> {
  std::vector<folder_path_t> matches;
  const std::string          prefix = gallery_name + "_";
  CollectMatches(central_dir_, prefix, matches);
  CollectMatches(folder / kUploadedSubfolder, prefix, matches);
  std::sort(matches.begin(), matches.end());
  return matches;
}
};  // namespace galleon
