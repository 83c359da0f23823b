#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <set>

#include "quantizer.h"
#include "test_helpers.h"

using namespace epubgs;

TEST(QuantizationStep, MatchesEvenlySpacedLevels)
{
  EXPECT_DOUBLE_EQ(quantization_step(2), 255.0);
  EXPECT_DOUBLE_EQ(quantization_step(4), 85.0);
  EXPECT_DOUBLE_EQ(quantization_step(16), 17.0);
}

TEST(QuantizationStep, BitDepthCoversLevels)
{
  EXPECT_EQ(bit_depth_for_levels(2), 1);
  EXPECT_EQ(bit_depth_for_levels(3), 2);
  EXPECT_EQ(bit_depth_for_levels(4), 2);
  EXPECT_EQ(bit_depth_for_levels(5), 4);
  EXPECT_EQ(bit_depth_for_levels(16), 4);
  EXPECT_EQ(bit_depth_for_levels(17), 8);
}

TEST(DiffuseError, OutputsOnlyQuantizationLevels)
{
  const GrayImage img = test::make_gradient(37, 23);
  for (int levels : {2, 3, 4, 5, 16})
  {
    std::vector<uint8_t> plane = img.data;
    diffuse_error(plane, img.width, img.height, levels);
    const double step = quantization_step(levels);
    for (uint8_t v : plane)
    {
      const double k = std::nearbyint(v / step);
      EXPECT_GE(k, 0.0);
      EXPECT_LE(k, levels - 1.0);
      EXPECT_EQ(v, static_cast<int>(std::min(255.0, k * step))) << "levels=" << levels;
    }
  }
}

TEST(DiffuseError, TwoLevelRasterMatchesHandComputedResult)
{
  std::vector<uint8_t> plane = {100, 200, 50,
                                30, 150, 220};
  diffuse_error(plane, 3, 2, 2);
  EXPECT_EQ(plane, (std::vector<uint8_t>{0, 255, 0,
                                         0, 255, 255}));
}

TEST(DiffuseError, FourLevelRasterMatchesHandComputedResult)
{
  std::vector<uint8_t> plane = {60, 100, 130,
                                140, 20, 200};
  diffuse_error(plane, 3, 2, 4);
  EXPECT_EQ(plane, (std::vector<uint8_t>{85, 85, 170,
                                         170, 0, 170}));
}

TEST(DiffusePixel, TruncatesEveryNeighborWrite)
{
  // 60 -> 85, error -25: 100 - 10.9375 = 89.0625 is stored as 89
  std::vector<uint8_t> plane = {60, 100, 130,
                                140, 20, 200};
  const double error = diffuse_pixel(plane, 3, 2, 0, 0, quantization_step(4));
  EXPECT_DOUBLE_EQ(error, -25.0);
  EXPECT_EQ(plane, (std::vector<uint8_t>{85, 89, 130,
                                         132, 18, 200}));
}

TEST(DiffusePixel, SpreadsErrorToAllNeighbors)
{
  // 3x2, the pixel at (1,0) has all four neighbors
  std::vector<uint8_t> plane(6, 0);
  plane[1] = 100;
  const double error = diffuse_pixel(plane, 3, 2, 1, 0, quantization_step(2));
  EXPECT_DOUBLE_EQ(error, 100.0);
  EXPECT_EQ(plane[1], 0);
  EXPECT_EQ(plane[2], 43); // right, 43.75
  EXPECT_EQ(plane[3], 18); // below left, 18.75
  EXPECT_EQ(plane[4], 31); // below, 31.25
  EXPECT_EQ(plane[5], 6);  // below right, 6.25
  EXPECT_EQ(plane[0], 0);  // already visited
}

TEST(DiffusePixel, DropsFractionsOutsideImage)
{
  // right column: no right or below-right neighbor
  std::vector<uint8_t> plane = {0, 100,
                                0, 0};
  diffuse_pixel(plane, 2, 2, 1, 0, quantization_step(2));
  EXPECT_EQ(plane, (std::vector<uint8_t>{0, 0,
                                         18, 31}));

  // single row: only the right neighbor
  std::vector<uint8_t> row = {100, 0};
  diffuse_pixel(row, 2, 1, 0, 0, quantization_step(2));
  EXPECT_EQ(row[1], 43);
}

TEST(DiffusePixel, ClampsNeighbors)
{
  std::vector<uint8_t> plane = {100, 250};
  diffuse_pixel(plane, 2, 1, 0, 0, quantization_step(2));
  EXPECT_EQ(plane[1], 255);

  std::vector<uint8_t> dark = {200, 10};
  const double error = diffuse_pixel(dark, 2, 1, 0, 0, quantization_step(2));
  EXPECT_DOUBLE_EQ(error, -55.0);
  EXPECT_EQ(dark[0], 255);
  EXPECT_EQ(dark[1], 0);
}

TEST(DiffusePixel, ThreeLevelMiddleIsTruncated)
{
  // step 127.5: the middle level is stored as 127
  std::vector<uint8_t> plane = {128};
  diffuse_pixel(plane, 1, 1, 0, 0, quantization_step(3));
  EXPECT_EQ(plane[0], 127);
}

TEST(ErrorDiffusionQuantizer, UniformMidGrayUsesAdjacentLevels)
{
  GrayImage img = test::make_uniform(50, 50, 128);
  IndexedImage out;
  std::string err;
  ErrorDiffusionQuantizer q(4);
  ASSERT_TRUE(q.quantize(img, out, err)) << err;

  std::set<int> seen;
  double sum = 0.0;
  for (uint8_t v : img.data)
  {
    seen.insert(v);
    sum += v;
  }
  EXPECT_EQ(seen, (std::set<int>{85, 170}));
  // each truncating store loses less than one unit, at most four stores per pixel
  EXPECT_NEAR(sum / static_cast<double>(img.pixel_count()), 128.0, 4.0);
}

TEST(ErrorDiffusionQuantizer, ProducesTwoBitGrayscale)
{
  GrayImage img = test::make_gradient(64, 16);
  IndexedImage out;
  std::string err;
  ASSERT_TRUE(ErrorDiffusionQuantizer(4).quantize(img, out, err)) << err;
  EXPECT_EQ(out.width, 64u);
  EXPECT_EQ(out.height, 16u);
  EXPECT_EQ(out.bit_depth, 2);
  EXPECT_FALSE(out.has_palette());
  ASSERT_EQ(out.samples.size(), img.pixel_count());
  for (size_t i = 0; i < out.samples.size(); ++i)
  {
    ASSERT_LE(out.samples[i], 3);
    EXPECT_EQ(img.data[i], out.samples[i] * 85);
  }
}

TEST(ErrorDiffusionQuantizer, NonPowerOfTwoLevelsUsePalette)
{
  GrayImage img = test::make_gradient(20, 20);
  IndexedImage out;
  std::string err;
  ASSERT_TRUE(ErrorDiffusionQuantizer(3).quantize(img, out, err)) << err;
  EXPECT_EQ(out.bit_depth, 2);
  ASSERT_TRUE(out.has_palette());
  EXPECT_EQ(out.palette[0], 0);
  EXPECT_EQ(out.palette[1], 127);
  EXPECT_EQ(out.palette[2], 255);
  for (uint8_t s : out.samples)
    EXPECT_LE(s, 2);
}

TEST(ErrorDiffusionQuantizer, IsDeterministic)
{
  GrayImage a = test::make_gradient(41, 17);
  GrayImage b = a;
  IndexedImage qa, qb;
  std::string err;
  ErrorDiffusionQuantizer q(4);
  ASSERT_TRUE(q.quantize(a, qa, err));
  ASSERT_TRUE(q.quantize(b, qb, err));
  EXPECT_EQ(qa.samples, qb.samples);
  EXPECT_EQ(a.data, b.data);
}

TEST(ErrorDiffusionQuantizer, RejectsEmptyImage)
{
  GrayImage img;
  IndexedImage out;
  std::string err;
  EXPECT_FALSE(ErrorDiffusionQuantizer(4).quantize(img, out, err));
  EXPECT_FALSE(err.empty());
}

TEST(MedianCut, SplitsIntoRequestedBoxes)
{
  std::vector<uint64_t> histogram(256, 0);
  for (int v = 0; v < 256; ++v)
    histogram[static_cast<size_t>(v)] = 10;
  const std::vector<IntensityBox> boxes = median_cut(histogram, 16);
  ASSERT_EQ(boxes.size(), 16u);
  uint64_t total = 0;
  for (size_t i = 0; i < boxes.size(); ++i)
  {
    total += boxes[i].count;
    EXPECT_LE(boxes[i].lo, boxes[i].hi);
    if (i > 0)
      EXPECT_GT(boxes[i].lo, boxes[i - 1].hi);
  }
  EXPECT_EQ(total, 2560u);
}

TEST(MedianCut, FewDistinctValuesGiveFewerBoxes)
{
  std::vector<uint64_t> histogram(256, 0);
  histogram[10] = 5;
  histogram[200] = 7;
  histogram[250] = 1;
  const std::vector<IntensityBox> boxes = median_cut(histogram, 16);
  ASSERT_EQ(boxes.size(), 3u);
  EXPECT_EQ(boxes[0].mean, 10);
  EXPECT_EQ(boxes[1].mean, 200);
  EXPECT_EQ(boxes[2].mean, 250);

  EXPECT_TRUE(median_cut(std::vector<uint64_t>(256, 0), 16).empty());
}

TEST(MedianCutQuantizer, PaletteIsEvenRamp)
{
  GrayImage img = test::make_gradient(128, 8);
  IndexedImage out;
  std::string err;
  ASSERT_TRUE(MedianCutQuantizer(16).quantize(img, out, err)) << err;
  EXPECT_EQ(out.bit_depth, 4);
  ASSERT_EQ(out.palette.size(), 256u);
  for (int i = 0; i < 16; ++i)
    EXPECT_EQ(out.palette[static_cast<size_t>(i)], i * 17);
  for (size_t i = 16; i < out.palette.size(); ++i)
    EXPECT_EQ(out.palette[i], 0);
  for (size_t i = 0; i < out.samples.size(); ++i)
  {
    ASSERT_LT(out.samples[i], 16);
    EXPECT_EQ(img.data[i], out.palette[out.samples[i]]);
  }
}

TEST(MedianCutQuantizer, KeepsToneOrder)
{
  GrayImage img;
  img.width = 256;
  img.height = 1;
  for (int v = 0; v < 256; ++v)
    img.data.push_back(static_cast<uint8_t>(v));
  IndexedImage out;
  std::string err;
  ASSERT_TRUE(MedianCutQuantizer(16).quantize(img, out, err)) << err;
  for (size_t i = 1; i < out.samples.size(); ++i)
    EXPECT_LE(out.samples[i - 1], out.samples[i]);
  EXPECT_EQ(out.samples.front(), 0);
  EXPECT_EQ(out.samples.back(), 15);
}

TEST(MedianCutQuantizer, LowContrastImageKeepsEveryCluster)
{
  // 16 distinct tones 100..115 stay 16 distinct palette indices
  GrayImage img;
  img.width = 16;
  img.height = 16;
  for (int y = 0; y < 16; ++y)
  {
    for (int x = 0; x < 16; ++x)
      img.data.push_back(static_cast<uint8_t>(100 + x));
  }
  IndexedImage out;
  std::string err;
  ASSERT_TRUE(MedianCutQuantizer(16).quantize(img, out, err)) << err;
  std::set<int> slots(out.samples.begin(), out.samples.end());
  EXPECT_EQ(slots.size(), 16u);
  for (int x = 0; x < 16; ++x)
  {
    EXPECT_EQ(out.samples[static_cast<size_t>(x)], x);
    EXPECT_EQ(img.data[static_cast<size_t>(x)], x * 17);
  }
}

TEST(MedianCutQuantizer, SingleClusterUsesFirstRampEntry)
{
  // the ramp replaces the clustered value regardless of content
  GrayImage img = test::make_uniform(10, 10, 255);
  IndexedImage out;
  std::string err;
  ASSERT_TRUE(MedianCutQuantizer(16).quantize(img, out, err)) << err;
  for (uint8_t s : out.samples)
    EXPECT_EQ(s, 0);
  for (uint8_t v : img.data)
    EXPECT_EQ(v, 0);
}

TEST(MakeQuantizer, ValidatesOptions)
{
  std::string err;
  QuantizeOptions opt;
  std::unique_ptr<Quantizer> q = make_quantizer(opt, err);
  ASSERT_TRUE(q);
  EXPECT_STREQ(q->name(), "error-diffusion");

  opt.mode = QuantizeMode::Palette;
  q = make_quantizer(opt, err);
  ASSERT_TRUE(q);
  EXPECT_STREQ(q->name(), "median-cut");

  opt.palette_colors = 1;
  EXPECT_FALSE(make_quantizer(opt, err));
  EXPECT_FALSE(err.empty());

  opt.mode = QuantizeMode::ErrorDiffusion;
  opt.levels = 300;
  EXPECT_FALSE(make_quantizer(opt, err));
}
