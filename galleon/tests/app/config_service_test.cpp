#include "app/config_service.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "test_fixation.hpp"

namespace galleon {
class ConfigServiceTests : public TempFolderTest {
 protected:
  auto WriteConfig(const std::string& text) -> std::filesystem::path {
    auto          path = folder_ / "config.json";
    std::ofstream out(path, std::ios::trunc);
    out << text;
    return path;
  }
};

TEST_F(ConfigServiceTests, MissingKeysKeepDefaults) {
  auto defaults = ConfigService::FromJson({{"max_retries", 5}, {"public_gallery", 0}});
  EXPECT_EQ(defaults.max_retries_, 5);
  EXPECT_FALSE(defaults.public_gallery_);
  EXPECT_EQ(defaults.thumbnail_size_, 3);
  EXPECT_EQ(defaults.thumbnail_format_, 2);
  EXPECT_EQ(defaults.parallel_batch_size_, 4);
  EXPECT_EQ(defaults.template_name_, "default");
  EXPECT_TRUE(defaults.auto_rename_);
  EXPECT_EQ(defaults.central_store_path_, UploadDefaults::DefaultCentralStore());
}

TEST_F(ConfigServiceTests, SaveThenLoad) {
  UploadDefaults defaults;
  defaults.thumbnail_size_      = 6;
  defaults.thumbnail_format_    = 4;
  defaults.parallel_batch_size_ = 8;
  defaults.template_name_       = "compact";
  defaults.auto_rename_         = false;
  defaults.central_store_path_  = folder_ / "store";

  auto path                     = folder_ / "nested" / "config.json";
  ConfigService::Save(path, defaults);
  auto loaded = ConfigService::Load(path);
  EXPECT_EQ(loaded.thumbnail_size_, 6);
  EXPECT_EQ(loaded.thumbnail_format_, 4);
  EXPECT_EQ(loaded.parallel_batch_size_, 8);
  EXPECT_EQ(loaded.template_name_, "compact");
  EXPECT_FALSE(loaded.auto_rename_);
  EXPECT_EQ(loaded.central_store_path_, folder_ / "store");
}

TEST_F(ConfigServiceTests, InvalidValuesAreRejected) {
  EXPECT_THROW(ConfigService::FromJson({{"thumbnail_size", 5}}), std::runtime_error);
  EXPECT_THROW(ConfigService::FromJson({{"thumbnail_format", 0}}), std::runtime_error);
  EXPECT_THROW(ConfigService::FromJson({{"parallel_batch_size", 0}}), std::runtime_error);
  EXPECT_THROW(ConfigService::FromJson({{"max_retries", -1}}), std::runtime_error);
  EXPECT_THROW(ConfigService::FromJson({{"max_retries", "three"}}), std::runtime_error);
  EXPECT_THROW(ConfigService::FromJson(nlohmann::json::array()), std::runtime_error);

  UploadDefaults bad;
  bad.parallel_batch_size_ = 0;
  EXPECT_THROW(ConfigService::Save(folder_ / "bad.json", bad), std::runtime_error);
}

TEST_F(ConfigServiceTests, LoadOrDefaultFallsBack) {
  EXPECT_EQ(ConfigService::LoadOrDefault(folder_ / "absent.json").max_retries_, 3);
  EXPECT_THROW(ConfigService::Load(WriteConfig("{not json")), std::runtime_error);
  EXPECT_EQ(ConfigService::LoadOrDefault(WriteConfig("{not json")).parallel_batch_size_, 4);
  EXPECT_EQ(ConfigService::LoadOrDefault(WriteConfig(R"({"parallel_batch_size": 2})"))
                .parallel_batch_size_,
            2);
}

TEST_F(ConfigServiceTests, RunRequestCarriesDefaults) {
  UploadDefaults defaults;
  defaults.thumbnail_size_      = 1;
  defaults.public_gallery_      = false;
  defaults.max_retries_         = 0;
  defaults.parallel_batch_size_ = 6;
  defaults.template_name_       = "bbcode";

  RunRequest request            = ToRunRequest(defaults, folder_);
  EXPECT_EQ(request.folder_, folder_);
  EXPECT_EQ(request.thumbnail_.size_, 1);
  EXPECT_FALSE(request.thumbnail_.public_gallery_);
  EXPECT_EQ(request.max_retries_, 0);
  EXPECT_EQ(request.concurrency_, 6);
  EXPECT_EQ(request.template_name_, "bbcode");
  EXPECT_FALSE(request.gallery_name_.has_value());
  EXPECT_FALSE(request.existing_gallery_id_.has_value());
}
};  // namespace galleon
