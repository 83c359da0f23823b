#include <gtest/gtest.h>

#include <filesystem>
#include <set>

#include "image_converter.h"
#include "scratch_dir.h"
#include "test_helpers.h"

using namespace epubgs;
namespace fs = std::filesystem;

class ImageConverterTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    std::string err;
    ASSERT_TRUE(dir_.create("epubgs-test-", err)) << err;
    fs::create_directories(fs::path(dir_.path()) / "images");
  }

  std::string root() const
  {
    return dir_.path();
  }

  std::string path(const std::string &rel) const
  {
    return dir_.path() + "/" + rel;
  }

  ScratchDir dir_;
  ErrorDiffusionQuantizer dither_{4};
};

TEST_F(ImageConverterTest, OutputPathSwapsExtension)
{
  EXPECT_EQ(ImageConverter::output_path_for("images/cover.JPG"), "images/cover.png");
  EXPECT_EQ(ImageConverter::output_path_for("cover.jpeg"), "cover.png");
  EXPECT_EQ(ImageConverter::output_path_for("a/b.c/pic.png"), "a/b.c/pic.png");
  EXPECT_TRUE(ImageConverter::is_convertible("x/y.Jpeg"));
  EXPECT_FALSE(ImageConverter::is_convertible("x/y.svg"));
}

TEST_F(ImageConverterTest, JpegBecomesSiblingPng)
{
  ASSERT_TRUE(test::write_jpeg(path("images/cover.jpg"), test::make_gradient(40, 30), 3));

  const ImageConverter converter(dither_, 9);
  ConvertResult result;
  ErrorKind kind = ErrorKind::None;
  std::string err;
  ASSERT_TRUE(converter.convert(root(), "images/cover.jpg", result, kind, err)) << err;
  EXPECT_EQ(result.old_path, "images/cover.jpg");
  EXPECT_EQ(result.new_path, "images/cover.png");
  EXPECT_EQ(result.source.format, SourceFormat::Jpeg);
  EXPECT_EQ(result.source.width, 40u);
  EXPECT_EQ(result.bit_depth, 2);
  EXPECT_FALSE(result.palette);
  EXPECT_GT(result.old_size, 0u);
  EXPECT_EQ(result.new_size, fs::file_size(path("images/cover.png")));
  EXPECT_FALSE(fs::exists(path("images/cover.jpg")));
  EXPECT_FALSE(fs::exists(path("images/cover.png.tmp")));

  GrayImage out;
  SourceInfo info;
  ASSERT_TRUE(load_png_gray(path("images/cover.png"), out, &info, err)) << err;
  EXPECT_EQ(info.bit_depth, 2);
  std::set<int> values(out.data.begin(), out.data.end());
  for (int v : values)
    EXPECT_EQ(v % 85, 0);
}

TEST_F(ImageConverterTest, PngIsReplacedInPlace)
{
  ASSERT_TRUE(test::write_gray_png(path("images/logo.png"), test::make_gradient(20, 20)));

  const ImageConverter converter(dither_, 9);
  ConvertResult result;
  ErrorKind kind = ErrorKind::None;
  std::string err;
  ASSERT_TRUE(converter.convert(root(), "images/logo.png", result, kind, err)) << err;
  EXPECT_EQ(result.new_path, "images/logo.png");
  EXPECT_EQ(result.source.bit_depth, 8);

  GrayImage out;
  SourceInfo info;
  ASSERT_TRUE(load_png_gray(path("images/logo.png"), out, &info, err)) << err;
  EXPECT_EQ(info.bit_depth, 2);
}

TEST_F(ImageConverterTest, UpperCasePngExtensionIsNormalized)
{
  ASSERT_TRUE(test::write_gray_png(path("images/Photo.PNG"), test::make_uniform(8, 8, 10)));

  const ImageConverter converter(dither_, 9);
  ConvertResult result;
  ErrorKind kind = ErrorKind::None;
  std::string err;
  ASSERT_TRUE(converter.convert(root(), "images/Photo.PNG", result, kind, err)) << err;
  EXPECT_EQ(result.new_path, "images/Photo.png");

  std::set<std::string> names;
  for (const auto &entry : fs::directory_iterator(path("images")))
    names.insert(entry.path().filename().string());
  EXPECT_EQ(names, (std::set<std::string>{"Photo.png"}));
}

TEST_F(ImageConverterTest, PaletteModeWritesFourBitPalette)
{
  ASSERT_TRUE(test::write_jpeg(path("images/bg.jpeg"), test::make_gradient(64, 4), 1));

  const MedianCutQuantizer median_cut(16);
  const ImageConverter converter(median_cut, 6);
  ConvertResult result;
  ErrorKind kind = ErrorKind::None;
  std::string err;
  ASSERT_TRUE(converter.convert(root(), "images/bg.jpeg", result, kind, err)) << err;
  EXPECT_EQ(result.new_path, "images/bg.png");
  EXPECT_EQ(result.bit_depth, 4);
  EXPECT_TRUE(result.palette);

  const std::vector<std::string> chunks = test::png_chunk_types(test::read_file(path("images/bg.png")));
  ASSERT_GE(chunks.size(), 2u);
  EXPECT_EQ(chunks[1], "PLTE");
}

TEST_F(ImageConverterTest, CorruptImageIsLeftUntouched)
{
  ASSERT_TRUE(test::write_file(path("images/broken.jpg"), "not a jpeg"));

  const ImageConverter converter(dither_, 9);
  ConvertResult result;
  ErrorKind kind = ErrorKind::None;
  std::string err;
  EXPECT_FALSE(converter.convert(root(), "images/broken.jpg", result, kind, err));
  EXPECT_EQ(kind, ErrorKind::ImageDecode);
  EXPECT_FALSE(err.empty());
  EXPECT_EQ(test::read_file(path("images/broken.jpg")), "not a jpeg");
  EXPECT_FALSE(fs::exists(path("images/broken.png")));
}

TEST_F(ImageConverterTest, RefusesToOverwriteExistingPng)
{
  ASSERT_TRUE(test::write_jpeg(path("images/cover.jpg"), test::make_uniform(8, 8, 90), 1));
  ASSERT_TRUE(test::write_file(path("images/cover.png"), "existing"));

  const ImageConverter converter(dither_, 9);
  ConvertResult result;
  ErrorKind kind = ErrorKind::None;
  std::string err;
  EXPECT_FALSE(converter.convert(root(), "images/cover.jpg", result, kind, err));
  EXPECT_EQ(kind, ErrorKind::ImageEncode);
  EXPECT_TRUE(fs::exists(path("images/cover.jpg")));
  EXPECT_EQ(test::read_file(path("images/cover.png")), "existing");
}
