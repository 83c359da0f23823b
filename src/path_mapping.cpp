#include "path_mapping.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace epubgs
{
  std::string to_lower(std::string s)
  {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                   { return (char)std::tolower(c); });
    return s;
  }

  std::string basename_of(const std::string &path)
  {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos)
      return path;
    return path.substr(pos + 1);
  }

  std::string dirname_of(const std::string &path)
  {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos)
      return std::string();
    return path.substr(0, pos);
  }

  std::string stem_of(const std::string &filename)
  {
    const std::string name = basename_of(filename);
    const auto pos = name.find_last_of('.');
    if (pos == std::string::npos || pos == 0)
      return name;
    return name.substr(0, pos);
  }

  std::string normalize_relative(const std::string &path)
  {
    std::vector<std::string> parts;
    std::size_t begin = 0;
    while (begin <= path.size())
    {
      std::size_t end = path.find('/', begin);
      if (end == std::string::npos)
        end = path.size();
      const std::string seg = path.substr(begin, end - begin);
      if (seg == "..")
      {
        if (!parts.empty() && parts.back() != "..")
          parts.pop_back();
        else
          parts.push_back(seg);
      }
      else if (!seg.empty() && seg != ".")
      {
        parts.push_back(seg);
      }
      begin = end + 1;
    }

    std::string out;
    for (const auto &seg : parts)
    {
      if (!out.empty())
        out += '/';
      out += seg;
    }
    return out;
  }

  std::string join_relative(const std::string &base_dir, const std::string &ref)
  {
    if (base_dir.empty())
      return normalize_relative(ref);
    return normalize_relative(base_dir + "/" + ref);
  }

  bool PathMapping::add(const std::string &old_path, const std::string &new_path)
  {
    if (index_.count(old_path) != 0)
      return false;
    index_.emplace(old_path, entries_.size());
    entries_.emplace_back(old_path, new_path);
    return true;
  }

  const std::string *PathMapping::find(const std::string &old_path) const
  {
    const auto it = index_.find(old_path);
    if (it == index_.end())
      return nullptr;
    return &entries_[it->second].second;
  }

  std::vector<std::string> PathMapping::ambiguous_filenames() const
  {
    std::map<std::string, int> counts;
    for (const auto &e : entries_)
      ++counts[basename_of(e.first)];

    std::vector<std::string> result;
    for (const auto &c : counts)
    {
      if (c.second > 1)
        result.push_back(c.first);
    }
    return result;
  }
} // namespace epubgs
