// Grayscale image I/O for epubgs
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace epubgs
{
  enum class SourceFormat
  {
    Unknown,
    Png,
    Jpeg
  };

  // 8-bit single channel raster
  struct GrayImage
  {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> data; // row-major, tightly packed

    size_t pixel_count() const
    {
      return static_cast<size_t>(width) * height;
    }
  };

  // Quantized raster ready for PNG encoding.
  struct IndexedImage
  {
    uint32_t width = 0;
    uint32_t height = 0;
    int bit_depth = 8;              // 1, 2, 4 or 8
    std::vector<uint8_t> samples;   // one per pixel, < (1 << bit_depth)
    // 256 gray entries when the image is palette based, empty for plain
    // grayscale where a sample s means s * 255 / ((1 << bit_depth) - 1)
    std::vector<uint8_t> palette;

    bool has_palette() const
    {
      return !palette.empty();
    }
  };

  // Header information gathered while decoding, used for verbose reports.
  struct SourceInfo
  {
    SourceFormat format = SourceFormat::Unknown;
    uint32_t width = 0;
    uint32_t height = 0;
    int channels = 0;
    int bit_depth = 0;
    bool progressive = false; // JPEG progressive / PNG interlaced
  };

  // Decoders refuse larger rasters before allocating them (8192 x 8192).
  constexpr uint64_t kMaxImagePixels = uint64_t(1) << 26;

  const char *format_name(SourceFormat fmt);

  // Dispatch by extension helpers
  bool has_ext(const std::string &path, const char *extLowerNoDot);
  SourceFormat format_from_path(const std::string &path);

  // PNG I/O (system libpng). Any color type is reduced to 8-bit gray.
  bool load_png_gray(const std::string &path, GrayImage &out, SourceInfo *info, std::string &err);
  bool save_png_indexed(const std::string &path, const IndexedImage &src, int compression_level, std::string &err);

  // JPEG decode (system libjpeg), luma only
  bool load_jpeg_gray(const std::string &path, GrayImage &out, SourceInfo *info, std::string &err);

  // Decodes PNG or JPEG depending on the extension.
  bool load_gray(const std::string &path, GrayImage &out, SourceInfo *info, std::string &err);
} // namespace epubgs
