// PNG I/O using system libpng
#include "image_io.h"
#include <png.h>
#include <cstdio>
#include <new>
#include <vector>

namespace
{
  void png_read_fn(png_structp png_ptr, png_bytep data, png_size_t length)
  {
    FILE *fp = static_cast<FILE *>(png_get_io_ptr(png_ptr));
    if (fread(data, 1, length, fp) != length)
      png_error(png_ptr, "read error");
  }

  void png_write_fn(png_structp png_ptr, png_bytep data, png_size_t length)
  {
    FILE *fp = static_cast<FILE *>(png_get_io_ptr(png_ptr));
    if (fwrite(data, 1, length, fp) != length)
      png_error(png_ptr, "write error");
  }

  void png_flush_fn(png_structp png_ptr)
  {
    FILE *fp = static_cast<FILE *>(png_get_io_ptr(png_ptr));
    fflush(fp);
  }

  // libpng の致命的エラーを err に記録してから setjmp 地点へ戻る。
  void png_error_fn(png_structp png_ptr, png_const_charp msg)
  {
    auto *err = static_cast<std::string *>(png_get_error_ptr(png_ptr));
    if (err && err->empty())
      *err = msg ? msg : "libpng error";
    png_longjmp(png_ptr, 1);
  }

  bool is_valid_bit_depth(int bit_depth)
  {
    return bit_depth == 1 || bit_depth == 2 || bit_depth == 4 || bit_depth == 8;
  }

  // Packs one row of samples MSB first, as required for sub-byte depths.
  void pack_row(const uint8_t *samples, uint32_t width, int bit_depth, uint8_t *dst)
  {
    if (bit_depth == 8)
    {
      for (uint32_t x = 0; x < width; ++x)
        dst[x] = samples[x];
      return;
    }
    const int per_byte = 8 / bit_depth;
    const uint32_t row_bytes = (width * static_cast<uint32_t>(bit_depth) + 7) / 8;
    for (uint32_t i = 0; i < row_bytes; ++i)
      dst[i] = 0;
    for (uint32_t x = 0; x < width; ++x)
    {
      const int shift = 8 - bit_depth * (static_cast<int>(x % per_byte) + 1);
      dst[x / per_byte] |= static_cast<uint8_t>(samples[x] << shift);
    }
  }
} // namespace

namespace epubgs
{
  bool load_png_gray(const std::string &path, GrayImage &out, SourceInfo *info, std::string &err)
  {
    err.clear();
    FILE *fp = fopen(path.c_str(), "rb");
    if (!fp)
    {
      err = "cannot open file";
      return false;
    }

    png_byte signature[8];
    if (fread(signature, 1, sizeof(signature), fp) != sizeof(signature) || png_sig_cmp(signature, 0, sizeof(signature)) != 0)
    {
      fclose(fp);
      err = "not a PNG file";
      return false;
    }

    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, &err, png_error_fn, nullptr);
    if (!png_ptr)
    {
      fclose(fp);
      err = "png_create_read_struct failed";
      return false;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr)
    {
      png_destroy_read_struct(&png_ptr, nullptr, nullptr);
      fclose(fp);
      err = "png_create_info_struct failed";
      return false;
    }

    std::vector<uint8_t> buffer;
    std::vector<png_bytep> rows;
    if (setjmp(png_jmpbuf(png_ptr)))
    {
      png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
      fclose(fp);
      if (err.empty())
        err = "libpng error";
      return false;
    }

    png_set_read_fn(png_ptr, fp, png_read_fn);
    png_set_sig_bytes(png_ptr, sizeof(signature));
    png_read_info(png_ptr, info_ptr);

    png_uint_32 w, h;
    int bit_depth, color_type, interlace;
    png_get_IHDR(png_ptr, info_ptr, &w, &h, &bit_depth, &color_type, &interlace, nullptr, nullptr);

    if (info)
    {
      info->format = SourceFormat::Png;
      info->width = w;
      info->height = h;
      info->channels = png_get_channels(png_ptr, info_ptr);
      info->bit_depth = bit_depth;
      info->progressive = interlace != PNG_INTERLACE_NONE;
    }

    if (static_cast<uint64_t>(w) * h > kMaxImagePixels)
      png_error(png_ptr, "image too large");

    // Transforms to 8-bit gray, alpha dropped
    if (bit_depth == 16)
      png_set_strip_16(png_ptr);
    if (color_type == PNG_COLOR_TYPE_PALETTE)
      png_set_palette_to_rgb(png_ptr);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8)
      png_set_expand_gray_1_2_4_to_8(png_ptr);
    if ((color_type & PNG_COLOR_MASK_ALPHA) || png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS))
      png_set_strip_alpha(png_ptr);
    if (color_type & PNG_COLOR_MASK_COLOR)
    {
      // BT.601 weights (R 0.299, G 0.587, remainder B)
      png_set_rgb_to_gray_fixed(png_ptr, 1, 29900, 58700);
    }
    png_set_interlace_handling(png_ptr);
    png_read_update_info(png_ptr, info_ptr);

    if (png_get_channels(png_ptr, info_ptr) != 1 || png_get_bit_depth(png_ptr, info_ptr) != 8)
      png_error(png_ptr, "unsupported pixel format");

    const png_size_t rowbytes = png_get_rowbytes(png_ptr, info_ptr);
    bool allocated = true;
    try
    {
      rows.resize(h);
      buffer.resize(rowbytes * h);
      out.data.reserve(static_cast<size_t>(w) * h);
    }
    catch (const std::bad_alloc &)
    {
      allocated = false;
    }
    if (!allocated)
      png_error(png_ptr, "out of memory");
    for (png_uint_32 y = 0; y < h; ++y)
      rows[y] = buffer.data() + y * rowbytes;
    png_read_image(png_ptr, rows.data());
    png_read_end(png_ptr, nullptr);

    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    fclose(fp);

    out.width = w;
    out.height = h;
    out.data.resize(out.pixel_count());
    for (png_uint_32 y = 0; y < h; ++y)
    {
      const uint8_t *s = rows[y];
      uint8_t *d = out.data.data() + static_cast<size_t>(y) * w;
      for (png_uint_32 x = 0; x < w; ++x)
        d[x] = s[x];
    }
    return true;
  }

  bool save_png_indexed(const std::string &path, const IndexedImage &src, int compression_level, std::string &err)
  {
    err.clear();
    if (!is_valid_bit_depth(src.bit_depth))
    {
      err = "unsupported bit depth";
      return false;
    }
    if (src.width == 0 || src.height == 0)
    {
      err = "empty image";
      return false;
    }
    const size_t pixels = static_cast<size_t>(src.width) * src.height;
    if (src.samples.size() < pixels)
    {
      err = "sample buffer too small";
      return false;
    }
    const int max_sample = (1 << src.bit_depth) - 1;
    for (size_t i = 0; i < pixels; ++i)
    {
      if (src.samples[i] > max_sample)
      {
        err = "sample out of range for bit depth";
        return false;
      }
    }
    const int palette_entries = 1 << src.bit_depth;
    if (src.has_palette() && src.palette.size() < static_cast<size_t>(palette_entries))
    {
      err = "palette too small";
      return false;
    }

    FILE *fp = fopen(path.c_str(), "wb");
    if (!fp)
    {
      err = "cannot open file";
      return false;
    }

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, &err, png_error_fn, nullptr);
    if (!png_ptr)
    {
      fclose(fp);
      err = "png_create_write_struct failed";
      return false;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr)
    {
      png_destroy_write_struct(&png_ptr, nullptr);
      fclose(fp);
      err = "png_create_info_struct failed";
      return false;
    }

    const uint32_t row_bytes = (src.width * static_cast<uint32_t>(src.bit_depth) + 7) / 8;
    std::vector<uint8_t> buffer(static_cast<size_t>(row_bytes) * src.height);
    std::vector<png_bytep> rows(src.height);
    std::vector<png_color> plte;
    if (setjmp(png_jmpbuf(png_ptr)))
    {
      png_destroy_write_struct(&png_ptr, &info_ptr);
      fclose(fp);
      if (err.empty())
        err = "libpng error";
      return false;
    }

    png_set_write_fn(png_ptr, fp, png_write_fn, png_flush_fn);
    png_set_compression_level(png_ptr, compression_level);

    // IHDR / PLTE / IDAT / IEND only: no gAMA, sRGB, iCCP or text chunks
    const int color_type = src.has_palette() ? PNG_COLOR_TYPE_PALETTE : PNG_COLOR_TYPE_GRAY;
    png_set_IHDR(png_ptr, info_ptr, src.width, src.height, src.bit_depth, color_type, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    if (src.has_palette())
    {
      plte.resize(static_cast<size_t>(palette_entries));
      for (int i = 0; i < palette_entries; ++i)
      {
        const uint8_t g = src.palette[static_cast<size_t>(i)];
        plte[static_cast<size_t>(i)].red = g;
        plte[static_cast<size_t>(i)].green = g;
        plte[static_cast<size_t>(i)].blue = g;
      }
      png_set_PLTE(png_ptr, info_ptr, plte.data(), palette_entries);
    }
    png_write_info(png_ptr, info_ptr);

    for (uint32_t y = 0; y < src.height; ++y)
    {
      rows[y] = buffer.data() + static_cast<size_t>(y) * row_bytes;
      pack_row(src.samples.data() + static_cast<size_t>(y) * src.width, src.width, src.bit_depth, rows[y]);
    }

    png_write_image(png_ptr, rows.data());
    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);
    if (fclose(fp) != 0)
    {
      err = "write error";
      return false;
    }
    return true;
  }
} // namespace epubgs
