#include "transfer/directory_transfer_client.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "test_fixation.hpp"

namespace galleon {
class DirectoryTransferClientTests : public TempFolderTest {
 protected:
  auto Mirror() const -> std::filesystem::path { return folder_ / "mirror"; }

  static auto ReadAll(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }
};

TEST_F(DirectoryTransferClientTests, CreatesGalleryAndCopiesInChunks) {
  auto                    source = WriteFile("pic.jpg", 2500);
  DirectoryTransferClient client(Mirror(), 1000);
  auto                    session = client.CreateSession();
  EXPECT_EQ(client.SessionsCreated(), 1u);

  std::vector<std::pair<byte_count_t, byte_count_t>> progress;
  UploadRequest                                      request;
  request.image_path_     = source;
  request.create_gallery_ = true;
  auto response           = client.UploadFile(
      request, *session,
      [&progress](byte_count_t so_far, byte_count_t total) { progress.emplace_back(so_far, total); });

  ASSERT_TRUE(response.success_) << response.error_;
  auto gallery_id = response.data_.value("gallery_id", std::string());
  ASSERT_FALSE(gallery_id.empty());
  EXPECT_EQ(gallery_id[0], 'g');
  EXPECT_FALSE(response.data_.value("image_id", std::string()).empty());
  EXPECT_EQ(response.data_.value("image_url", std::string()).rfind("file://", 0), 0u);

  EXPECT_EQ(ReadAll(Mirror() / gallery_id / "pic.jpg"), ReadAll(source));
  ASSERT_EQ(progress.size(), 3u);
  EXPECT_EQ(progress[0], std::make_pair(byte_count_t{1000}, byte_count_t{2500}));
  EXPECT_EQ(progress[2], std::make_pair(byte_count_t{2500}, byte_count_t{2500}));
  EXPECT_EQ(client.GalleryUrl(gallery_id).rfind("file://", 0), 0u);
}

TEST_F(DirectoryTransferClientTests, AppendsToExistingGalleryOnly) {
  auto                    source = WriteFile("pic.png", 10);
  DirectoryTransferClient client(Mirror());
  auto                    session = client.CreateSession();

  UploadRequest           create;
  create.image_path_     = source;
  create.create_gallery_ = true;
  auto created           = client.UploadFile(create, *session, nullptr);
  ASSERT_TRUE(created.success_);
  auto          gallery_id = created.data_["gallery_id"].get<std::string>();

  UploadRequest append;
  append.image_path_ = WriteFile("second.png", 20);
  append.gallery_id_ = gallery_id;
  auto appended      = client.UploadFile(append, *session, nullptr);
  ASSERT_TRUE(appended.success_) << appended.error_;
  EXPECT_EQ(appended.data_["gallery_id"], gallery_id);
  EXPECT_NE(appended.data_["image_id"], created.data_["image_id"]);

  append.gallery_id_ = "g0";
  auto unknown       = client.UploadFile(append, *session, nullptr);
  EXPECT_FALSE(unknown.success_);
  EXPECT_EQ(unknown.error_, "unknown gallery g0");

  append.gallery_id_.reset();
  EXPECT_FALSE(client.UploadFile(append, *session, nullptr).success_);
}

TEST_F(DirectoryTransferClientTests, MissingSourceFails) {
  DirectoryTransferClient client(Mirror());
  auto                    session = client.CreateSession();
  UploadRequest           request;
  request.image_path_     = folder_ / "missing.jpg";
  request.create_gallery_ = true;
  auto response           = client.UploadFile(request, *session, nullptr);
  EXPECT_FALSE(response.success_);
  EXPECT_EQ(response.error_.rfind("cannot open", 0), 0u);
  // The gallery made for the failed upload is gone
  EXPECT_TRUE(std::filesystem::is_empty(Mirror()));
}

TEST_F(DirectoryTransferClientTests, GalleryIdsAreUnique) {
  auto                    source = WriteFile("p.jpg", 1);
  DirectoryTransferClient first(Mirror());
  DirectoryTransferClient second(Mirror());
  auto                    s1 = first.CreateSession();
  auto                    s2 = second.CreateSession();

  UploadRequest           request;
  request.image_path_     = source;
  request.create_gallery_ = true;
  auto a                  = first.UploadFile(request, *s1, nullptr);
  auto b                  = second.UploadFile(request, *s2, nullptr);
  ASSERT_TRUE(a.success_);
  ASSERT_TRUE(b.success_);
  EXPECT_NE(a.data_["gallery_id"], b.data_["gallery_id"]);
}

TEST_F(DirectoryTransferClientTests, RenamerWritesNameFile) {
  auto                    source = WriteFile("p.jpg", 1);
  DirectoryTransferClient client(Mirror());
  auto                    session = client.CreateSession();
  UploadRequest           request;
  request.image_path_     = source;
  request.create_gallery_ = true;
  auto gallery_id =
      client.UploadFile(request, *session, nullptr).data_["gallery_id"].get<std::string>();

  DirectoryGalleryRenamer renamer(Mirror());
  EXPECT_TRUE(renamer.RenameGallery(gallery_id, "Summer trip"));
  EXPECT_EQ(ReadAll(Mirror() / gallery_id / DirectoryGalleryRenamer::kNameFile), "Summer trip");
  EXPECT_FALSE(renamer.RenameGallery("g0", "Nope"));
  EXPECT_FALSE(renamer.RenameGallery("", "Nope"));
}
};  // namespace galleon
