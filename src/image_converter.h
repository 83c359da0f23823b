#pragma once

#include <cstdint>
#include <string>

#include "error_kind.h"
#include "image_io.h"
#include "quantizer.h"

namespace epubgs
{
  struct ConvertResult
  {
    std::string old_path; // relative to the extraction root
    std::string new_path; // relative to the extraction root
    SourceInfo source;
    uint64_t old_size = 0;
    uint64_t new_size = 0;
    int bit_depth = 0;
    bool palette = false;
  };

  // decode -> gray -> quantize -> PNG, next to the source
  class ImageConverter
  {
  public:
    ImageConverter(const Quantizer &quantizer, int compression_level);

    // relative_path is resolved under root. On failure kind is ImageDecode or
    // ImageEncode and the source file is left as it was.
    bool convert(const std::string &root, const std::string &relative_path, ConvertResult &out,
                 ErrorKind &kind, std::string &err) const;

    // "images/cover.JPG" -> "images/cover.png"
    static std::string output_path_for(const std::string &relative_path);

    static bool is_convertible(const std::string &path);

  private:
    const Quantizer &quantizer_;
    int compression_level_;
  };
} // namespace epubgs
