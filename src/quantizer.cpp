#include "quantizer.h"

#include <algorithm>
#include <cmath>

namespace epubgs
{
  namespace
  {
    constexpr double kWeightRight = 7.0 / 16.0;
    constexpr double kWeightBelowLeft = 3.0 / 16.0;
    constexpr double kWeightBelow = 5.0 / 16.0;
    constexpr double kWeightBelowRight = 1.0 / 16.0;

    // Clamps to [0,255] and truncates, every store into the 8-bit raster
    // goes through here.
    inline uint8_t to_intensity(double v)
    {
      return static_cast<uint8_t>(std::min(255.0, std::max(0.0, v)));
    }

    bool check_image(const GrayImage &img, std::string &err)
    {
      if (img.width == 0 || img.height == 0)
      {
        err = "empty image";
        return false;
      }
      if (img.data.size() < img.pixel_count())
      {
        err = "pixel buffer too small";
        return false;
      }
      return true;
    }

    int trim_low(const std::vector<uint64_t> &histogram, int lo, int hi)
    {
      while (lo < hi && histogram[static_cast<size_t>(lo)] == 0)
        ++lo;
      return lo;
    }

    int trim_high(const std::vector<uint64_t> &histogram, int lo, int hi)
    {
      while (hi > lo && histogram[static_cast<size_t>(hi)] == 0)
        --hi;
      return hi;
    }

    IntensityBox make_box(const std::vector<uint64_t> &histogram, int lo, int hi)
    {
      IntensityBox box;
      box.lo = trim_low(histogram, lo, hi);
      box.hi = trim_high(histogram, box.lo, hi);
      uint64_t weighted = 0;
      for (int v = box.lo; v <= box.hi; ++v)
      {
        box.count += histogram[static_cast<size_t>(v)];
        weighted += histogram[static_cast<size_t>(v)] * static_cast<uint64_t>(v);
      }
      if (box.count != 0)
        box.mean = static_cast<int>((weighted + box.count / 2) / box.count);
      return box;
    }
  } // namespace

  int bit_depth_for_levels(int levels)
  {
    if (levels <= 2)
      return 1;
    if (levels <= 4)
      return 2;
    if (levels <= 16)
      return 4;
    return 8;
  }

  double diffuse_pixel(std::vector<uint8_t> &plane, uint32_t width, uint32_t height, uint32_t x, uint32_t y, double step)
  {
    uint8_t &px = plane[static_cast<size_t>(y) * width + x];
    const double old_value = px;
    // nearbyint: 既定の丸めモードで偶数丸め
    const double new_value = std::nearbyint(old_value / step) * step;
    const double error = old_value - new_value;
    px = to_intensity(new_value);

    auto spread = [&](int64_t nx, int64_t ny, double weight)
    {
      if (nx < 0 || ny < 0 || nx >= static_cast<int64_t>(width) || ny >= static_cast<int64_t>(height))
        return;
      uint8_t &n = plane[static_cast<size_t>(ny) * width + static_cast<size_t>(nx)];
      n = to_intensity(n + error * weight);
    };

    const int64_t ix = x;
    const int64_t iy = y;
    spread(ix + 1, iy, kWeightRight);
    spread(ix - 1, iy + 1, kWeightBelowLeft);
    spread(ix, iy + 1, kWeightBelow);
    spread(ix + 1, iy + 1, kWeightBelowRight);
    return error;
  }

  void diffuse_error(std::vector<uint8_t> &plane, uint32_t width, uint32_t height, int levels)
  {
    const double step = quantization_step(levels);
    // 走査順は行優先で固定。後続画素は拡散済みの誤差を参照する。
    for (uint32_t y = 0; y < height; ++y)
    {
      for (uint32_t x = 0; x < width; ++x)
        diffuse_pixel(plane, width, height, x, y, step);
    }
  }

  std::vector<IntensityBox> median_cut(const std::vector<uint64_t> &histogram, int max_boxes)
  {
    std::vector<IntensityBox> boxes;
    if (histogram.size() < 256 || max_boxes < 1)
      return boxes;

    IntensityBox root = make_box(histogram, 0, 255);
    if (root.count == 0)
      return boxes;
    boxes.push_back(root);

    while (static_cast<int>(boxes.size()) < max_boxes)
    {
      // 分割可能な箱のうち画素数最大のもの (同数なら低輝度側) を選ぶ
      int target = -1;
      for (size_t i = 0; i < boxes.size(); ++i)
      {
        const IntensityBox &b = boxes[i];
        if (b.lo >= b.hi)
          continue;
        if (target < 0 || b.count > boxes[static_cast<size_t>(target)].count)
          target = static_cast<int>(i);
      }
      if (target < 0)
        break;

      const IntensityBox box = boxes[static_cast<size_t>(target)];
      const uint64_t half = (box.count + 1) / 2;
      uint64_t cumulative = 0;
      int split = box.hi - 1;
      for (int v = box.lo; v < box.hi; ++v)
      {
        cumulative += histogram[static_cast<size_t>(v)];
        if (cumulative >= half)
        {
          split = v;
          break;
        }
      }

      boxes[static_cast<size_t>(target)] = make_box(histogram, box.lo, split);
      boxes.push_back(make_box(histogram, split + 1, box.hi));
    }

    std::sort(boxes.begin(), boxes.end(), [](const IntensityBox &a, const IntensityBox &b)
              { return a.lo < b.lo; });
    return boxes;
  }

  ErrorDiffusionQuantizer::ErrorDiffusionQuantizer(int levels)
      : levels_(levels)
  {
  }

  const char *ErrorDiffusionQuantizer::name() const
  {
    return "error-diffusion";
  }

  bool ErrorDiffusionQuantizer::quantize(GrayImage &img, IndexedImage &out, std::string &err) const
  {
    err.clear();
    if (levels_ < 2 || levels_ > 256)
    {
      err = "levels must be in 2..256";
      return false;
    }
    if (!check_image(img, err))
      return false;

    const size_t pixels = img.pixel_count();
    diffuse_error(img.data, img.width, img.height, levels_);

    const double step = quantization_step(levels_);
    out.width = img.width;
    out.height = img.height;
    out.bit_depth = bit_depth_for_levels(levels_);
    out.samples.resize(pixels);
    for (size_t i = 0; i < pixels; ++i)
    {
      const long k = std::lround(img.data[i] / step);
      out.samples[i] = static_cast<uint8_t>(std::min<long>(std::max<long>(k, 0), levels_ - 1));
    }

    // 2^bit_depth 段でなければグレースケール PNG では表せないのでパレットにする
    out.palette.clear();
    if (levels_ != (1 << out.bit_depth))
    {
      out.palette.assign(256, 0);
      for (int k = 0; k < levels_; ++k)
        out.palette[static_cast<size_t>(k)] = to_intensity(k * step);
    }
    return true;
  }

  MedianCutQuantizer::MedianCutQuantizer(int colors)
      : colors_(colors)
  {
  }

  const char *MedianCutQuantizer::name() const
  {
    return "median-cut";
  }

  bool MedianCutQuantizer::quantize(GrayImage &img, IndexedImage &out, std::string &err) const
  {
    err.clear();
    if (colors_ < 2 || colors_ > 256)
    {
      err = "palette colors must be in 2..256";
      return false;
    }
    if (!check_image(img, err))
      return false;

    const size_t pixels = img.pixel_count();
    std::vector<uint64_t> histogram(256, 0);
    for (size_t i = 0; i < pixels; ++i)
      ++histogram[img.data[i]];

    const std::vector<IntensityBox> boxes = median_cut(histogram, colors_);

    // Box k becomes palette index k; the clustered gray values are replaced
    // by the evenly spaced ramp whatever the image content.
    std::vector<uint8_t> lut(256, 0);
    for (size_t k = 0; k < boxes.size(); ++k)
    {
      for (int v = boxes[k].lo; v <= boxes[k].hi; ++v)
        lut[static_cast<size_t>(v)] = static_cast<uint8_t>(k);
    }

    out.width = img.width;
    out.height = img.height;
    out.bit_depth = bit_depth_for_levels(colors_);
    out.palette.assign(256, 0);
    for (int i = 0; i < colors_; ++i)
      out.palette[static_cast<size_t>(i)] = static_cast<uint8_t>(i * 255 / (colors_ - 1));

    out.samples.resize(pixels);
    for (size_t i = 0; i < pixels; ++i)
    {
      out.samples[i] = lut[img.data[i]];
      img.data[i] = out.palette[out.samples[i]];
    }
    return true;
  }

  std::unique_ptr<Quantizer> make_quantizer(const QuantizeOptions &opt, std::string &err)
  {
    err.clear();
    switch (opt.mode)
    {
    case QuantizeMode::ErrorDiffusion:
      if (opt.levels < 2 || opt.levels > 256)
      {
        err = "levels must be in 2..256";
        return nullptr;
      }
      return std::make_unique<ErrorDiffusionQuantizer>(opt.levels);
    case QuantizeMode::Palette:
      if (opt.palette_colors < 2 || opt.palette_colors > 256)
      {
        err = "palette colors must be in 2..256";
        return nullptr;
      }
      return std::make_unique<MedianCutQuantizer>(opt.palette_colors);
    }
    err = "unknown quantize mode";
    return nullptr;
  }
} // namespace epubgs
