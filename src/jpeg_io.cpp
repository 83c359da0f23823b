// JPEG decoding using system libjpeg
#include "image_io.h"

#include <csetjmp>
#include <cstdio>
#include <new>
#include <vector>

#include <jpeglib.h>

namespace
{
  // libjpeg の既定エラーハンドラは exit() するため、setjmp で呼び出し元へ戻す。
  struct JpegErrorManager
  {
    jpeg_error_mgr pub;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
  };

  void jpeg_error_exit(j_common_ptr cinfo)
  {
    auto *mgr = reinterpret_cast<JpegErrorManager *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, mgr->message);
    std::longjmp(mgr->jump, 1);
  }

  void jpeg_silent_output(j_common_ptr)
  {
  }
} // namespace

namespace epubgs
{
  bool load_jpeg_gray(const std::string &path, GrayImage &out, SourceInfo *info, std::string &err)
  {
    err.clear();
    FILE *fp = std::fopen(path.c_str(), "rb");
    if (!fp)
    {
      err = "cannot open file";
      return false;
    }

    jpeg_decompress_struct cinfo;
    JpegErrorManager jerr;
    jerr.message[0] = '\0';
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.output_message = jpeg_silent_output;

    std::vector<uint8_t> buffer;
    if (setjmp(jerr.jump))
    {
      jpeg_destroy_decompress(&cinfo);
      std::fclose(fp);
      err = jerr.message[0] ? jerr.message : "libjpeg error";
      return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, fp);
    jpeg_read_header(&cinfo, TRUE);

    if (info)
    {
      info->format = SourceFormat::Jpeg;
      info->width = cinfo.image_width;
      info->height = cinfo.image_height;
      info->channels = cinfo.num_components;
      info->bit_depth = cinfo.data_precision;
      info->progressive = cinfo.progressive_mode != 0;
    }

    if (static_cast<uint64_t>(cinfo.image_width) * cinfo.image_height > kMaxImagePixels)
    {
      jpeg_destroy_decompress(&cinfo);
      std::fclose(fp);
      err = "image too large";
      return false;
    }

    // libjpeg converts only gray and YCbCr sources to luma
    if (cinfo.jpeg_color_space == JCS_CMYK || cinfo.jpeg_color_space == JCS_YCCK)
    {
      jpeg_destroy_decompress(&cinfo);
      std::fclose(fp);
      err = "unsupported pixel format (CMYK JPEG)";
      return false;
    }
    cinfo.out_color_space = JCS_GRAYSCALE;

    jpeg_start_decompress(&cinfo);
    if (cinfo.output_components != 1)
    {
      jpeg_destroy_decompress(&cinfo);
      std::fclose(fp);
      err = "unsupported pixel format";
      return false;
    }

    const uint32_t w = cinfo.output_width;
    const uint32_t h = cinfo.output_height;
    bool allocated = true;
    try
    {
      buffer.resize(static_cast<size_t>(w) * h);
    }
    catch (const std::bad_alloc &)
    {
      allocated = false;
    }
    if (!allocated)
    {
      jpeg_destroy_decompress(&cinfo);
      std::fclose(fp);
      err = "out of memory";
      return false;
    }
    while (cinfo.output_scanline < cinfo.output_height)
    {
      JSAMPROW row = buffer.data() + static_cast<size_t>(cinfo.output_scanline) * w;
      jpeg_read_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    std::fclose(fp);

    out.width = w;
    out.height = h;
    out.data.swap(buffer);
    return true;
  }
} // namespace epubgs
