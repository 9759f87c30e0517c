#include "app/artifact_service.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <nlohmann/json.hpp>
#include <vector>

#include "test_fixation.hpp"

namespace galleon {
class ArtifactServiceTests : public TempFolderTest {};

TEST_F(ArtifactServiceTests, NameEscapesPathCharacters) {
  EXPECT_EQ(ArtifactService::ArtifactName("Trip", "G1"), "Trip_G1.json");
  EXPECT_EQ(ArtifactService::ArtifactName("Trip", "a/b\\c:d"), "Trip_a_b_c_d.json");
}

TEST_F(ArtifactServiceTests, WritesResultAsJson) {
  RunResult result;
  result.gallery_id_       = "G42";
  result.gallery_name_     = "Trip";
  result.successful_count_ = 2;
  result.total_images_     = 2;
  result.images_.push_back({{"image_id", "i1"}});

  auto           path = ArtifactService::WriteResult(result, folder_ / "central");
  EXPECT_EQ(path, folder_ / "central" / "Trip_G42.json");

  std::ifstream  in(path);
  nlohmann::json j;
  in >> j;
  EXPECT_EQ(j["gallery_id"], "G42");
  EXPECT_EQ(j["successful_count"], 2);
  EXPECT_EQ(j["images"][0]["image_id"], "i1");
}

TEST_F(ArtifactServiceTests, FindsEarlierUploadsInBothLocations) {
  auto central = folder_ / "central";
  auto images  = folder_ / "images";
  WriteFileIn(central, "Trip_G1.json", 2);
  WriteFileIn(central, "Trip_G1_bbcode.txt", 2);
  WriteFileIn(central, "Trip_G1.log", 2);
  WriteFileIn(central, "Tripod_G2.json", 2);
  WriteFileIn(images / kUploadedSubfolder, "Trip_G3.json", 2);

  ArtifactExistenceChecker checker(central);
  auto                     matches = checker.FindExisting("Trip", images);
  EXPECT_EQ(matches, (std::vector<folder_path_t>{central / "Trip_G1.json",
                                                 central / "Trip_G1_bbcode.txt",
                                                 images / kUploadedSubfolder / "Trip_G3.json"}));
  EXPECT_TRUE(checker.FindExisting("Holiday", images).empty());
}

TEST_F(ArtifactServiceTests, MissingDirectoriesFindNothing) {
  ArtifactExistenceChecker checker(folder_ / "nowhere");
  EXPECT_TRUE(checker.FindExisting("Trip", folder_ / "also_nowhere").empty());
}
};  // namespace galleon
