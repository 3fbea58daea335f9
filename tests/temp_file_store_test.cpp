#include "common/temp_file_store.h"

#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "common/fs.h"
#include "test_support.h"

namespace chatimport::common {
namespace {

TEST(TempFileStoreTest, SameNameGetsDistinctPaths) {
  chatimport::testing::ScopedTempDir dir;
  TempFileStore store(dir.path() + "/tmp/");

  std::string first;
  std::string second;
  std::string error;
  ASSERT_TRUE(store.tempFile("media/IMG 1.jpg", &first, &error)) << error;
  ASSERT_TRUE(store.tempFile("other/IMG 1.jpg", &second, &error)) << error;

  EXPECT_NE(first, second);
  EXPECT_EQ(std::filesystem::path(first).filename().string(), "IMG_1.jpg");
  EXPECT_TRUE(std::filesystem::is_directory(std::filesystem::path(first).parent_path()));
  EXPECT_FALSE(std::filesystem::exists(first));
  EXPECT_EQ(store.rootDir(), dir.path() + "/tmp");
}

TEST(TempFileStoreTest, PurgeRemovesEverything) {
  chatimport::testing::ScopedTempDir dir;
  TempFileStore store(dir.file("tmp"));
  std::string path;
  std::string error;
  ASSERT_TRUE(store.tempFile("a.txt", &path, &error));
  chatimport::testing::writeFile(path, "x");

  store.purge();
  EXPECT_FALSE(std::filesystem::exists(store.rootDir()));
  store.purge();
}

TEST(FsTest, SanitizesFileNames) {
  EXPECT_EQ(sanitizeFileName("WhatsApp Chat.txt"), "WhatsApp_Chat.txt");
  EXPECT_EQ(sanitizeFileName(".."), "file");
  EXPECT_EQ(sanitizeFileName(""), "file");
}

TEST(FsTest, ReportsFileSize) {
  chatimport::testing::ScopedTempDir dir;
  chatimport::testing::writeFile(dir.file("five"), "12345");
  int64_t size = 0;
  std::string error;
  ASSERT_TRUE(fileSize(dir.file("five"), &size, &error));
  EXPECT_EQ(size, 5);
  EXPECT_FALSE(fileSize(dir.file("none"), &size, &error));
  EXPECT_FALSE(error.empty());
}

}  // namespace
}  // namespace chatimport::common
