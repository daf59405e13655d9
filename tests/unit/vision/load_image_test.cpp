#include <tessera/vision/load_image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace tv = tessera::vision;
namespace tc = tessera::core;
namespace fs = std::filesystem;

namespace {

class LoadImageTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("tessera_load_image_" + std::to_string(::getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }
  void TearDown() override {
    std::error_code ec;
    fs::permissions(dir_ / "locked.png", fs::perms::owner_all, ec);
    fs::remove_all(dir_, ec);
  }

  std::string write_png(const std::string& name, int w, int h, int type, cv::Scalar colour) {
    const auto path = (dir_ / name).string();
    cv::Mat mat(h, w, type, colour);
    EXPECT_TRUE(cv::imwrite(path, mat));
    return path;
  }

  std::string touch(const std::string& name, const std::string& content = "") {
    const auto path = (dir_ / name).string();
    std::ofstream(path) << content;
    return path;
  }

  fs::path dir_;
};

}  // namespace

TEST_F(LoadImageTest, LoadsColourImageAsBgr) {
  const auto path = write_png("colour.png", 40, 30, CV_8UC3, cv::Scalar(255, 0, 0));
  auto frame = tv::load_image(path);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->width(), 40u);
  EXPECT_EQ(frame->height(), 30u);
  EXPECT_EQ(frame->format(), tc::PixelFormat::BGR8);
  EXPECT_EQ(std::to_integer<int>(frame->data()[0]), 255);
  EXPECT_EQ(std::to_integer<int>(frame->data()[2]), 0);
}

TEST_F(LoadImageTest, MissingFileIsFileNotFound) {
  auto frame = tv::load_image((dir_ / "nope.jpg").string());
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error().code, tc::ErrorCode::FileNotFound);
  EXPECT_NE(frame.error().message.find("nope.jpg"), std::string::npos);
}

TEST_F(LoadImageTest, GarbageIsInvalidImage) {
  const auto path = touch("garbage.jpg", "this is not a jpeg");
  auto frame = tv::load_image(path);
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error().code, tc::ErrorCode::InvalidImage);
}

TEST_F(LoadImageTest, EmptyFileIsInvalidImage) {
  const auto path = touch("empty.png");
  auto frame = tv::load_image(path);
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error().code, tc::ErrorCode::InvalidImage);
}

TEST_F(LoadImageTest, DirectoryIsInvalidImage) {
  fs::create_directories(dir_ / "folder.jpg");
  auto frame = tv::load_image((dir_ / "folder.jpg").string());
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error().code, tc::ErrorCode::InvalidImage);
}

TEST_F(LoadImageTest, UnreadableFileIsPermissionDenied) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "root ignores file permissions";
  }
  const auto path = write_png("locked.png", 8, 8, CV_8UC3, cv::Scalar(1, 2, 3));
  fs::permissions(path, fs::perms::none);
  auto frame = tv::load_image(path);
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error().code, tc::ErrorCode::PermissionDenied);
}

TEST_F(LoadImageTest, ListImagesFiltersAndSorts) {
  touch("b.jpg");
  touch("a.jpg");
  touch("c.JPG");
  touch("d.png");
  fs::create_directories(dir_ / "e.jpg");

  const auto with_dot = tv::list_images(dir_.string(), ".jpg");
  const auto without_dot = tv::list_images(dir_.string(), "jpg");
  EXPECT_EQ(with_dot, without_dot);
  ASSERT_EQ(with_dot.size(), 3u);
  EXPECT_EQ(fs::path(with_dot[0]).filename().string(), "a.jpg");
  EXPECT_EQ(fs::path(with_dot[1]).filename().string(), "b.jpg");
  EXPECT_EQ(fs::path(with_dot[2]).filename().string(), "c.JPG");
}

TEST_F(LoadImageTest, ListImagesMissingDirectoryThrows) {
  EXPECT_THROW((void)tv::list_images((dir_ / "missing").string(), "jpg"),
               fs::filesystem_error);
}
