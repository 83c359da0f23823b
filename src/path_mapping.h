#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace epubgs
{
  // '/' separated path helpers. Archive-relative paths never use '\\'.
  std::string to_lower(std::string s);
  std::string basename_of(const std::string &path);
  std::string dirname_of(const std::string &path);
  std::string stem_of(const std::string &filename);

  // "a/./b/../c" -> "a/c". Leading ".." segments that climb above the root are kept.
  std::string normalize_relative(const std::string &path);
  std::string join_relative(const std::string &base_dir, const std::string &ref);

  // old relative path -> new relative path, insertion ordered, unique keys
  class PathMapping
  {
  public:
    using Entry = std::pair<std::string, std::string>;

    // false when old_path is already mapped
    bool add(const std::string &old_path, const std::string &new_path);
    const std::string *find(const std::string &old_path) const;

    bool empty() const noexcept
    {
      return entries_.empty();
    }

    std::size_t size() const noexcept
    {
      return entries_.size();
    }

    const std::vector<Entry> &entries() const noexcept
    {
      return entries_;
    }

    // Filenames shared by more than one key. Filename based matching cannot
    // tell those entries apart.
    std::vector<std::string> ambiguous_filenames() const;

  private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
  };
} // namespace epubgs
