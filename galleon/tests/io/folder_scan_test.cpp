#include "io/folder_scan.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "test_fixation.hpp"

namespace galleon {
class FolderScanTests : public TempFolderTest {};

TEST_F(FolderScanTests, OnlyTopLevelImagesAreListed) {
  WriteFile("b.JPG", 1);
  WriteFile("a.jpeg", 1);
  WriteFile("c.png", 1);
  WriteFile("d.gif", 1);
  WriteFile("notes.txt", 1);
  WriteFile("raw.cr2", 1);
  WriteFile("noext", 1);
  WriteFileIn(folder_ / "sub", "nested.jpg", 1);
  std::filesystem::create_directories(folder_ / "looks_like.png");

  auto names = ScanFolder(folder_);
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"a.jpeg", "b.JPG", "c.png", "d.gif"}));
}

TEST_F(FolderScanTests, MissingFolderThrows) {
  EXPECT_THROW(ScanFolder(folder_ / "missing"), std::filesystem::filesystem_error);
}

TEST_F(FolderScanTests, OrderedListIndexesPositions) {
  WriteFile("img10.jpg", 1);
  WriteFile("img2.jpg", 1);
  WriteFile("img1.jpg", 1);

  auto files = OrderedFileList::FromFolder(folder_);
  ASSERT_EQ(files.Size(), 3u);
  EXPECT_EQ(files.Names(), (std::vector<std::string>{"img1.jpg", "img2.jpg", "img10.jpg"}));
  EXPECT_EQ(files.PositionOf("img10.jpg").value_or(99), 2u);
  EXPECT_FALSE(files.PositionOf("img3.jpg").has_value());
  EXPECT_TRUE(files.Contains("img2.jpg"));
  EXPECT_FALSE(OrderedFileList().Contains("img2.jpg"));
  EXPECT_TRUE(OrderedFileList().Empty());
}

TEST_F(FolderScanTests, NonAsciiNamesSurviveThePathRoundTrip) {
  const std::string name = "\xE6\x99\xAE\xE6\xB4\xB1_01.jpg";
  auto              path = PathOf(folder_, name);
  WriteFileIn(folder_, "placeholder.jpg", 1);
  std::filesystem::rename(folder_ / "placeholder.jpg", path);

  auto names = ScanFolder(folder_);
  ASSERT_EQ(names.size(), 1u);
  EXPECT_EQ(names[0], name);
  EXPECT_EQ(FileSizeOrZero(PathOf(folder_, names[0])), 1u);
}

TEST_F(FolderScanTests, SizeOfMissingFileIsZero) {
  WriteFile("x.jpg", 123);
  EXPECT_EQ(FileSizeOrZero(folder_ / "x.jpg"), 123u);
  EXPECT_EQ(FileSizeOrZero(folder_ / "y.jpg"), 0u);
}
};  // namespace galleon
