#pragma once

#include <functional>
#include <string>

namespace epubgs
{
  // Uniquely named directory under the system temp directory, removed with
  // its contents when the owner goes away.
  class ScratchDir
  {
  public:
    using ErrorCallback = std::function<void(const std::string &)>;

    ScratchDir() = default;
    explicit ScratchDir(ErrorCallback on_cleanup_error);
    ~ScratchDir();

    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    bool create(const std::string &prefix, std::string &err);
    bool remove(std::string &err);

    const std::string &path() const noexcept
    {
      return path_;
    }

    bool active() const noexcept
    {
      return !path_.empty();
    }

  private:
    std::string path_;
    ErrorCallback on_cleanup_error_;
  };
} // namespace epubgs
