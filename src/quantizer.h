#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "image_io.h"

namespace epubgs
{
  enum class QuantizeMode
  {
    ErrorDiffusion, // Floyd-Steinberg to N gray levels
    Palette         // median cut, box k shown as ramp entry k
  };

  struct QuantizeOptions
  {
    QuantizeMode mode = QuantizeMode::ErrorDiffusion;
    int levels = 4;          // ErrorDiffusion: 2..256
    int palette_colors = 16; // Palette: 2..256
  };

  class Quantizer
  {
  public:
    virtual ~Quantizer() = default;

    virtual const char *name() const = 0;

    // Reduces img to the strategy's levels. img may be modified in place.
    virtual bool quantize(GrayImage &img, IndexedImage &out, std::string &err) const = 0;
  };

  class ErrorDiffusionQuantizer : public Quantizer
  {
  public:
    explicit ErrorDiffusionQuantizer(int levels);

    const char *name() const override;
    bool quantize(GrayImage &img, IndexedImage &out, std::string &err) const override;

  private:
    int levels_;
  };

  class MedianCutQuantizer : public Quantizer
  {
  public:
    explicit MedianCutQuantizer(int colors = 16);

    const char *name() const override;
    bool quantize(GrayImage &img, IndexedImage &out, std::string &err) const override;

  private:
    int colors_;
  };

  std::unique_ptr<Quantizer> make_quantizer(const QuantizeOptions &opt, std::string &err);

  // 量子化ステップ幅 255 / (levels - 1)
  inline double quantization_step(int levels)
  {
    return 255.0 / static_cast<double>(levels - 1);
  }

  // Smallest PNG bit depth that can index the given number of levels.
  int bit_depth_for_levels(int levels);

  // Quantizes plane[y * width + x] in place and spreads its rounding error to
  // the unvisited neighbors. Every value written back is clamped to [0,255]
  // and truncated to an integer. Returns the error.
  double diffuse_pixel(std::vector<uint8_t> &plane, uint32_t width, uint32_t height, uint32_t x, uint32_t y, double step);

  // Floyd-Steinberg over the whole raster in row-major order. Afterwards every
  // value is one of int(k * step).
  void diffuse_error(std::vector<uint8_t> &plane, uint32_t width, uint32_t height, int levels);

  // Contiguous intensity range produced by median cut.
  struct IntensityBox
  {
    int lo = 0;          // inclusive
    int hi = 0;          // inclusive
    uint64_t count = 0;  // pixels inside
    int mean = 0;        // pixel weighted mean intensity
  };

  // Splits the 256-bin histogram into at most max_boxes boxes, ordered by
  // intensity.
  std::vector<IntensityBox> median_cut(const std::vector<uint64_t> &histogram, int max_boxes);
} // namespace epubgs
