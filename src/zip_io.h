#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace epubgs
{
  struct ZipEntryInfo
  {
    std::string name;
    uint64_t size = 0;
    uint64_t compressed_size = 0;
    bool stored = false; // compression method STORE
  };

  struct RepackOptions
  {
    // written first and uncompressed when present
    std::string reserved_entry = "mimetype";
    int compression_level = 9; // deflate level 1..9
  };

  // Entry names that are absolute or climb out of the root through ".." are
  // rejected. On success extracted holds the relative paths of written files.
  bool extract_archive(const std::string &archive_path, const std::string &dest_dir,
                       std::vector<std::string> *extracted, std::string &err);

  // files: paths relative to source_dir, written in the given order after the
  // reserved entry.
  bool write_archive(const std::string &source_dir, const std::string &archive_path,
                     const std::vector<std::string> &files, const RepackOptions &opt, std::string &err);

  // Central directory order.
  bool list_archive(const std::string &archive_path, std::vector<ZipEntryInfo> &out, std::string &err);

  bool is_safe_entry_name(const std::string &name);
} // namespace epubgs
