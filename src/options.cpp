#include "options.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace epubgs
{
  namespace
  {
    bool read_int(const json &value, const char *key, int &out, std::string &err)
    {
      if (!value.is_number_integer())
      {
        err = std::string(key) + " must be an integer";
        return false;
      }
      // 符号なしで表された大きな値は int64_t に収まらないことがある
      const bool in_range = value.is_number_unsigned()
                                ? value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
                                : value.get<int64_t>() >= std::numeric_limits<int>::min() &&
                                      value.get<int64_t>() <= std::numeric_limits<int>::max();
      if (!in_range)
      {
        err = std::string(key) + " is out of range";
        return false;
      }
      out = static_cast<int>(value.get<int64_t>());
      return true;
    }

    bool read_string(const json &value, const char *key, std::string &out, std::string &err)
    {
      if (!value.is_string())
      {
        err = std::string(key) + " must be a string";
        return false;
      }
      out = value.get<std::string>();
      return true;
    }
  } // namespace

  bool parse_int(const std::string &text, int &out)
  {
    if (text.empty())
      return false;
    char *endptr = nullptr;
    errno = 0;
    const long v = std::strtol(text.c_str(), &endptr, 10);
    if (errno == ERANGE || *endptr != '\0')
      return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
      return false;
    out = static_cast<int>(v);
    return true;
  }

  bool parse_quantize_mode(const std::string &text, QuantizeMode &out)
  {
    const std::string t = to_lower(text);
    if (t == "dither" || t == "error-diffusion" || t == "2bit")
      out = QuantizeMode::ErrorDiffusion;
    else if (t == "palette" || t == "median-cut" || t == "4bit")
      out = QuantizeMode::Palette;
    else
      return false;
    return true;
  }

  bool parse_match_mode(const std::string &text, MatchMode &out)
  {
    const std::string t = to_lower(text);
    if (t == "basename")
      out = MatchMode::Basename;
    else if (t == "fullpath" || t == "full-path")
      out = MatchMode::FullPath;
    else
      return false;
    return true;
  }

  const char *quantize_mode_name(QuantizeMode mode)
  {
    return mode == QuantizeMode::Palette ? "palette" : "dither";
  }

  const char *match_mode_name(MatchMode mode)
  {
    return mode == MatchMode::FullPath ? "fullpath" : "basename";
  }

  bool apply_options_json(const std::string &text, Options &opt, std::string &err)
  {
    err.clear();
    json root;
    try
    {
      root = json::parse(text);
    }
    catch (const json::parse_error &e)
    {
      err = std::string("invalid JSON: ") + e.what();
      return false;
    }
    if (!root.is_object())
    {
      err = "configuration must be a JSON object";
      return false;
    }

    Options next = opt;
    for (auto it = root.begin(); it != root.end(); ++it)
    {
      const std::string &key = it.key();
      const json &value = it.value();
      std::string text_value;
      if (key == "mode")
      {
        if (!read_string(value, "mode", text_value, err))
          return false;
        if (!parse_quantize_mode(text_value, next.quantize.mode))
        {
          err = "unknown mode: " + text_value;
          return false;
        }
      }
      else if (key == "levels")
      {
        if (!read_int(value, "levels", next.quantize.levels, err))
          return false;
      }
      else if (key == "palette_colors")
      {
        if (!read_int(value, "palette_colors", next.quantize.palette_colors, err))
          return false;
      }
      else if (key == "match")
      {
        if (!read_string(value, "match", text_value, err))
          return false;
        if (!parse_match_mode(text_value, next.match))
        {
          err = "unknown match mode: " + text_value;
          return false;
        }
      }
      else if (key == "reserved_entry")
      {
        if (!read_string(value, "reserved_entry", next.repack.reserved_entry, err))
          return false;
      }
      else if (key == "compression_level")
      {
        if (!read_int(value, "compression_level", next.repack.compression_level, err))
          return false;
      }
      else if (key == "output_dir")
      {
        if (!read_string(value, "output_dir", next.output_dir, err))
          return false;
      }
      else if (key == "verbose")
      {
        if (!value.is_boolean())
        {
          err = "verbose must be a boolean";
          return false;
        }
        next.verbose = value.get<bool>();
      }
      else
      {
        err = "unknown configuration key: " + key;
        return false;
      }
    }

    if (!validate_options(next, err))
      return false;
    opt = next;
    return true;
  }

  bool load_options_file(const std::string &path, Options &opt, std::string &err)
  {
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
      err = "cannot open configuration file: " + path;
      return false;
    }
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!apply_options_json(text, opt, err))
    {
      err = path + ": " + err;
      return false;
    }
    return true;
  }

  bool validate_options(const Options &opt, std::string &err)
  {
    if (opt.quantize.levels < 2 || opt.quantize.levels > 256)
    {
      err = "levels must be in 2..256";
      return false;
    }
    if (opt.quantize.palette_colors < 2 || opt.quantize.palette_colors > 256)
    {
      err = "palette_colors must be in 2..256";
      return false;
    }
    if (opt.repack.compression_level < 1 || opt.repack.compression_level > 9)
    {
      err = "compression_level must be in 1..9";
      return false;
    }
    if (!opt.repack.reserved_entry.empty() && !is_safe_entry_name(opt.repack.reserved_entry))
    {
      err = "reserved_entry must be a relative archive path";
      return false;
    }
    if (opt.output_dir.empty())
    {
      err = "output_dir must not be empty";
      return false;
    }
    return true;
  }
} // namespace epubgs
