#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "image_io.h"

namespace epubgs::test
{
  struct ZipFixtureEntry
  {
    std::string name;
    std::string data;
    bool store = false;
  };

  bool write_file(const std::string &path, const std::string &content);
  std::string read_file(const std::string &path);

  // rows of width pixels, value = f(x, y)
  GrayImage make_gradient(uint32_t width, uint32_t height);
  GrayImage make_uniform(uint32_t width, uint32_t height, uint8_t value);

  bool write_gray_png(const std::string &path, const GrayImage &img);
  // components 1 (gray) or 3 (RGB, each pixel r = g = b = gray value)
  bool write_jpeg(const std::string &path, const GrayImage &img, int components, int quality = 95);
  std::string jpeg_bytes(const GrayImage &img, int components);
  std::string png_bytes(const GrayImage &img);

  bool write_zip(const std::string &path, const std::vector<ZipFixtureEntry> &entries);
  bool read_zip(const std::string &path, std::map<std::string, std::string> &out);

  // Valid signature, IHDR (8-bit gray) declaring width x height, one tiny
  // IDAT and IEND. Only the header is meaningful.
  std::string png_header_only(uint32_t width, uint32_t height);

  // chunk type names in file order
  std::vector<std::string> png_chunk_types(const std::string &bytes);
} // namespace epubgs::test
