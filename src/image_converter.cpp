#include "image_converter.h"
#include "path_mapping.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace epubgs
{
  ImageConverter::ImageConverter(const Quantizer &quantizer, int compression_level)
      : quantizer_(quantizer), compression_level_(compression_level)
  {
  }

  std::string ImageConverter::output_path_for(const std::string &relative_path)
  {
    const std::string dir = dirname_of(relative_path);
    const std::string name = stem_of(relative_path) + ".png";
    return dir.empty() ? name : dir + "/" + name;
  }

  bool ImageConverter::is_convertible(const std::string &path)
  {
    return format_from_path(path) != SourceFormat::Unknown;
  }

  bool ImageConverter::convert(const std::string &root, const std::string &relative_path, ConvertResult &out,
                               ErrorKind &kind, std::string &err) const
  {
    err.clear();
    kind = ErrorKind::None;
    out = ConvertResult();
    out.old_path = relative_path;
    out.new_path = output_path_for(relative_path);

    const fs::path src = fs::path(root) / relative_path;
    const fs::path dst = fs::path(root) / out.new_path;
    const bool renamed = out.new_path != relative_path;

    std::error_code ec;
    out.old_size = fs::file_size(src, ec);
    if (ec)
    {
      kind = ErrorKind::ImageDecode;
      err = "cannot stat source: " + ec.message();
      return false;
    }
    // cover.jpg と cover.png が並存する場合、既存の PNG を上書きしない
    if (renamed && fs::exists(dst, ec))
    {
      kind = ErrorKind::ImageEncode;
      err = "destination already exists: " + out.new_path;
      return false;
    }

    GrayImage gray;
    if (!load_gray(src.string(), gray, &out.source, err))
    {
      kind = ErrorKind::ImageDecode;
      return false;
    }

    IndexedImage quantized;
    if (!quantizer_.quantize(gray, quantized, err))
    {
      kind = ErrorKind::ImageEncode;
      return false;
    }
    out.bit_depth = quantized.bit_depth;
    out.palette = quantized.has_palette();

    // 一時ファイルへ書いてから置き換え、失敗時に元画像を残す
    const fs::path tmp = dst.string() + ".tmp";
    if (!save_png_indexed(tmp.string(), quantized, compression_level_, err))
    {
      fs::remove(tmp, ec);
      kind = ErrorKind::ImageEncode;
      return false;
    }
    fs::rename(tmp, dst, ec);
    if (ec)
    {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      kind = ErrorKind::ImageEncode;
      err = "cannot move output into place: " + ec.message();
      return false;
    }

    if (renamed)
    {
      fs::remove(src, ec);
      if (ec)
      {
        std::error_code ignored;
        fs::remove(dst, ignored);
        kind = ErrorKind::ImageEncode;
        err = "cannot remove source: " + ec.message();
        return false;
      }
    }

    out.new_size = fs::file_size(dst, ec);
    if (ec)
      out.new_size = 0;
    return true;
  }
} // namespace epubgs
