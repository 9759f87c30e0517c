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

#include <CLI/CLI.hpp>
#include <algorithm>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "app/artifact_service.hpp"
#include "app/config_service.hpp"
#include "app/rename_service.hpp"
#include "app/upload_service.hpp"
#include "transfer/directory_transfer_client.hpp"
#include "utils/counter/atomic_counter.hpp"
#include "utils/log/logger.hpp"

namespace {
volatile std::sig_atomic_t stop_requested = 0;

void OnInterrupt(int) { stop_requested = 1; }

auto AskToContinue(const std::string& gallery_name,
                   const std::vector<std::filesystem::path>& matches) -> bool {
  std::cout << "Gallery '" << gallery_name << "' appears to have been uploaded before:\n";
  for (const auto& match : matches) {
    std::cout << "  " << match.string() << "\n";
  }
  std::cout << "Continue anyway? (y/N): " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) return false;
  return answer == "y" || answer == "Y" || answer == "yes";
}

void PrintProgress(const galleon::UploadProgress& progress) {
  constexpr uint32_t kWidth = 30;
  uint32_t           filled = std::min<uint32_t>(progress.percent_, 100) * kWidth / 100;
  std::string        bar    = std::string(filled, '=') + std::string(kWidth - filled, ' ');
  std::printf("\r[%s] %3u%% %u/%u %s", bar.c_str(), progress.percent_, progress.completed_,
              progress.total_, progress.current_file_.c_str());
  std::fflush(stdout);
}
};  // namespace

int main(int argc, char* argv[]) {
  using namespace galleon;

  CLI::App                 app{"galleon: upload image folders as galleries"};

  std::vector<std::string> folders;
  std::string              gallery_name;
  int                      thumbnail_size   = 0;
  int                      thumbnail_format = 0;
  int                      max_retries      = 0;
  int                      parallel         = 0;
  bool                     make_public      = false;
  bool                     make_private     = false;
  std::string              template_name;
  std::string              config_path;
  std::string              mirror_dir;
  bool                     rename_pending = false;
  bool                     assume_yes     = false;
  bool                     verbose        = false;

  app.add_option("folders", folders, "Folders to upload, one gallery each");
  auto* name_opt = app.add_option("--name", gallery_name,
                                  "Gallery name (single folder only; defaults to folder name)");
  auto* size_opt = app.add_option("--size", thumbnail_size, "Thumbnail size")
                       ->check(CLI::IsMember({1, 2, 3, 4, 6}));
  auto* format_opt =
      app.add_option("--format", thumbnail_format, "Thumbnail format")->check(CLI::Range(1, 4));
  auto* retries_opt = app.add_option("--max-retries", max_retries, "Retry passes for failures")
                          ->check(CLI::NonNegativeNumber);
  auto* parallel_opt = app.add_option("--parallel", parallel, "Simultaneous uploads")
                           ->check(CLI::PositiveNumber);
  auto* public_opt   = app.add_flag("--public", make_public, "Make galleries public");
  auto* private_opt  = app.add_flag("--private", make_private, "Make galleries private");
  public_opt->excludes(private_opt);
  auto* template_opt = app.add_option("--template", template_name, "Template name");
  app.add_option("--config", config_path, "Defaults file (JSON)");
  app.add_option("--mirror", mirror_dir, "Directory that receives the uploaded galleries");
  app.add_flag("--rename-pending", rename_pending, "Rename galleries recorded as unnamed");
  app.add_flag("-y,--yes", assume_yes, "Do not ask before re-uploading a known gallery");
  app.add_flag("-v,--verbose", verbose, "Debug logging");

  CLI11_PARSE(app, argc, argv);

  Logger::SetLevel(verbose ? spdlog::level::debug : spdlog::level::info);
  auto logger = Logger::GetLogger("cli");

  if (folders.empty() && !rename_pending) {
    std::cerr << app.help() << std::endl;
    return 1;
  }
  if (name_opt->count() > 0 && folders.size() > 1) {
    logger->error("--name can only be used with a single folder");
    return 1;
  }

  const auto defaults_file = config_path.empty()
                                 ? UploadDefaults::DefaultCentralStore() / "config.json"
                                 : std::filesystem::path(config_path);
  UploadDefaults defaults = ConfigService::LoadOrDefault(defaults_file);
  if (size_opt->count() > 0) defaults.thumbnail_size_ = thumbnail_size;
  if (format_opt->count() > 0) defaults.thumbnail_format_ = thumbnail_format;
  if (retries_opt->count() > 0) defaults.max_retries_ = max_retries;
  if (parallel_opt->count() > 0) defaults.parallel_batch_size_ = parallel;
  if (public_opt->count() > 0) defaults.public_gallery_ = true;
  if (private_opt->count() > 0) defaults.public_gallery_ = false;
  if (template_opt->count() > 0) defaults.template_name_ = template_name;

  const auto central = defaults.central_store_path_;
  const auto mirror  = mirror_dir.empty() ? central / "mirror" : std::filesystem::path(mirror_dir);

  int        exit_code = 0;
  try {
    auto store  = std::make_shared<PendingRenameStore>(central / "pending_renames.json");
    auto client = std::make_shared<DirectoryTransferClient>(mirror);
    std::shared_ptr<GalleryRenamer> renamer =
        defaults.auto_rename_ ? std::make_shared<DirectoryGalleryRenamer>(mirror) : nullptr;
    auto renames = std::make_shared<RenameService>(store, renamer);

    if (rename_pending) {
      auto renamed = renames->RenamePending();
      std::cout << "Renamed " << renamed << " pending galleries, " << store->Entries().size()
                << " still pending" << std::endl;
    }

    auto              bandwidth = std::make_shared<AtomicCounter>();
    UploadServiceImpl service(client, renames, std::make_shared<ArtifactExistenceChecker>(central),
                              bandwidth);

    std::signal(SIGINT, OnInterrupt);

    for (const auto& folder : folders) {
      RunRequest request = ToRunRequest(defaults, std::filesystem::path(folder));
      if (name_opt->count() > 0) request.gallery_name_ = gallery_name;

      auto job            = std::make_shared<UploadJob>();
      job->on_progress_   = PrintProgress;
      job->should_cancel_ = []() { return stop_requested != 0; };
      if (!assume_yes) job->confirm_duplicate_ = AskToContinue;

      try {
        RunResult result = service.Run(request, job);
        std::printf("\n");

        for (const auto& dir : {central, request.folder_ / kUploadedSubfolder}) {
          try {
            auto path = ArtifactService::WriteResult(result, dir);
            logger->debug("Result written to {}", path.string());
          } catch (const std::exception& e) {
            logger->warn("Could not write result into {}: {}", dir.string(), e.what());
          }
        }

        std::cout << result.gallery_name_ << ": " << result.gallery_url_ << " ("
                  << result.successful_count_ << "/" << result.total_images_ << " uploaded)"
                  << std::endl;
        if (result.failed_count_ > 0 || result.never_attempted_count_ > 0) exit_code = 1;
      } catch (const UploadRunError& e) {
        std::printf("\n");
        logger->error("{}", e.what());
        exit_code = 1;
      }
      if (stop_requested) {
        logger->info("Interrupted, skipping remaining folders");
        break;
      }
    }

    logger->info("Transferred {:.1f} MiB in total",
                 static_cast<double>(bandwidth->Get()) / (1024.0 * 1024.0));
    renames->Stop();
  } catch (const std::exception& e) {
    logger->error("{}", e.what());
    return 1;
  }
  return exit_code;
}
