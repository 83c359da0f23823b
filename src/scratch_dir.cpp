#include "scratch_dir.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace epubgs
{
  ScratchDir::ScratchDir(ErrorCallback on_cleanup_error)
      : on_cleanup_error_(std::move(on_cleanup_error))
  {
  }

  ScratchDir::~ScratchDir()
  {
    std::string err;
    if (!remove(err) && on_cleanup_error_)
      on_cleanup_error_(err);
  }

  bool ScratchDir::create(const std::string &prefix, std::string &err)
  {
    err.clear();
    if (active())
    {
      err = "scratch directory already created";
      return false;
    }

    std::error_code ec;
    const fs::path base = fs::temp_directory_path(ec);
    if (ec)
    {
      err = "no temp directory: " + ec.message();
      return false;
    }

    std::string templ = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data()))
    {
      err = std::string("mkdtemp failed: ") + std::strerror(errno);
      return false;
    }
    path_ = buf.data();
    return true;
  }

  bool ScratchDir::remove(std::string &err)
  {
    err.clear();
    if (!active())
      return true;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
    {
      err = "cannot remove " + path_ + ": " + ec.message();
      path_.clear();
      return false;
    }
    path_.clear();
    return true;
  }
} // namespace epubgs
