#include "image_io.h"
#include "path_mapping.h"

#include <string>

namespace epubgs
{
  const char *format_name(SourceFormat fmt)
  {
    switch (fmt)
    {
    case SourceFormat::Png:
      return "PNG";
    case SourceFormat::Jpeg:
      return "JPEG";
    default:
      return "unknown";
    }
  }

  bool has_ext(const std::string &path, const char *extLowerNoDot)
  {
    const std::string name = basename_of(path);
    auto pos = name.find_last_of('.');
    if (pos == std::string::npos)
      return false;
    return to_lower(name.substr(pos + 1)) == extLowerNoDot;
  }

  SourceFormat format_from_path(const std::string &path)
  {
    if (has_ext(path, "png"))
      return SourceFormat::Png;
    if (has_ext(path, "jpg") || has_ext(path, "jpeg"))
      return SourceFormat::Jpeg;
    return SourceFormat::Unknown;
  }

  bool load_gray(const std::string &path, GrayImage &out, SourceInfo *info, std::string &err)
  {
    switch (format_from_path(path))
    {
    case SourceFormat::Png:
      return load_png_gray(path, out, info, err);
    case SourceFormat::Jpeg:
      return load_jpeg_gray(path, out, info, err);
    default:
      err = "unsupported image extension";
      return false;
    }
  }
} // namespace epubgs
