#include "queue/gallery_scanner.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "queue_test_fixation.hpp"

namespace gallup {
TEST_F(QueueTests, ScannerCountsSupportedImagesOnly) {
  auto folder = root_ / "mixed";
  std::filesystem::create_directories(folder / "nested");
  std::ofstream(folder / "b.JPG") << std::string(100, 'x');
  std::ofstream(folder / "a.png") << std::string(50, 'x');
  std::ofstream(folder / "c.Jpeg") << std::string(10, 'x');
  std::ofstream(folder / "d.gif") << std::string(5, 'x');
  std::ofstream(folder / "notes.txt") << "skip me";
  std::ofstream(folder / "raw.cr2") << "skip me";
  std::ofstream(folder / "nested" / "deep.jpg") << "not scanned";

  GalleryScanner scanner;
  auto           result = scanner.Scan(folder);
  EXPECT_EQ(result.image_count_, 4u);
  EXPECT_EQ(result.total_bytes_, 165u);
  ASSERT_EQ(result.images_.size(), 4u);
  EXPECT_EQ(result.images_.front().filename(), "a.png");
  EXPECT_EQ(result.images_.back().filename(), "d.gif");
}

TEST_F(QueueTests, ScannerRejectsMissingFolder) {
  GalleryScanner scanner;
  EXPECT_THROW(scanner.Scan(root_ / "does_not_exist"), std::runtime_error);
}

TEST_F(QueueTests, ScannerAcceptsEmptyFolder) {
  std::filesystem::create_directories(root_ / "empty");
  GalleryScanner scanner;
  auto           result = scanner.Scan(root_ / "empty");
  EXPECT_EQ(result.image_count_, 0u);
  EXPECT_TRUE(result.images_.empty());
}
}  // namespace gallup
