#pragma once

#include <string>

#include "quantizer.h"
#include "reference_rewriter.h"
#include "zip_io.h"

namespace epubgs
{
  struct Options
  {
    QuantizeOptions quantize;
    MatchMode match = MatchMode::Basename;
    RepackOptions repack; // reserved entry, deflate / zlib level
    std::string output_dir = "output";
    bool verbose = false;
  };

  // Whole-string decimal int; false on trailing text or overflow.
  bool parse_int(const std::string &text, int &out);
  bool parse_quantize_mode(const std::string &text, QuantizeMode &out);
  bool parse_match_mode(const std::string &text, MatchMode &out);
  const char *quantize_mode_name(QuantizeMode mode);
  const char *match_mode_name(MatchMode mode);

  // JSON object with the keys mode, levels, palette_colors, match,
  // reserved_entry, compression_level, output_dir, verbose. Keys that are
  // absent keep their current value.
  bool apply_options_json(const std::string &text, Options &opt, std::string &err);
  bool load_options_file(const std::string &path, Options &opt, std::string &err);

  bool validate_options(const Options &opt, std::string &err);
} // namespace epubgs
