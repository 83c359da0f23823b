// Zip container I/O using system libzip
#include "zip_io.h"
#include "path_mapping.h"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <system_error>

#include <zip.h>

namespace fs = std::filesystem;

namespace
{
  struct ZipDiscard
  {
    void operator()(zip_t *za) const
    {
      if (za)
        zip_discard(za);
    }
  };
  using ZipHandle = std::unique_ptr<zip_t, ZipDiscard>;

  std::string open_error_message(int code)
  {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string msg = zip_error_strerror(&error);
    zip_error_fini(&error);
    return msg;
  }

  ZipHandle open_for_read(const std::string &archive_path, std::string &err)
  {
    int code = 0;
    zip_t *za = zip_open(archive_path.c_str(), ZIP_RDONLY, &code);
    if (!za)
      err = "cannot open archive: " + open_error_message(code);
    return ZipHandle(za);
  }

  bool copy_entry(zip_t *za, zip_uint64_t index, const std::string &dest, std::string &err)
  {
    zip_file_t *zf = zip_fopen_index(za, index, 0);
    if (!zf)
    {
      err = std::string("cannot open entry: ") + zip_strerror(za);
      return false;
    }
    FILE *fp = std::fopen(dest.c_str(), "wb");
    if (!fp)
    {
      zip_fclose(zf);
      err = "cannot create " + dest;
      return false;
    }

    char buf[64 * 1024];
    bool ok = true;
    for (;;)
    {
      const zip_int64_t n = zip_fread(zf, buf, sizeof(buf));
      if (n < 0)
      {
        err = std::string("read error: ") + zip_file_strerror(zf);
        ok = false;
        break;
      }
      if (n == 0)
        break;
      if (std::fwrite(buf, 1, static_cast<size_t>(n), fp) != static_cast<size_t>(n))
      {
        err = "write error: " + dest;
        ok = false;
        break;
      }
    }
    zip_fclose(zf);
    if (std::fclose(fp) != 0 && ok)
    {
      err = "write error: " + dest;
      ok = false;
    }
    return ok;
  }

  bool add_file(zip_t *za, const std::string &full_path, const std::string &name, bool store, int level, std::string &err)
  {
    zip_source_t *src = zip_source_file(za, full_path.c_str(), 0, 0);
    if (!src)
    {
      err = "cannot read " + name + ": " + zip_strerror(za);
      return false;
    }
    const zip_int64_t index = zip_file_add(za, name.c_str(), src, ZIP_FL_ENC_UTF_8);
    if (index < 0)
    {
      zip_source_free(src);
      err = "cannot add " + name + ": " + zip_strerror(za);
      return false;
    }
    const zip_int32_t method = store ? ZIP_CM_STORE : ZIP_CM_DEFLATE;
    const zip_uint32_t flags = store ? 0u : static_cast<zip_uint32_t>(level);
    if (zip_set_file_compression(za, static_cast<zip_uint64_t>(index), method, flags) != 0)
    {
      err = "cannot set compression for " + name + ": " + zip_strerror(za);
      return false;
    }
    return true;
  }
} // namespace

namespace epubgs
{
  bool is_safe_entry_name(const std::string &name)
  {
    if (name.empty() || name[0] == '/' || name.find('\\') != std::string::npos)
      return false;
    if (name.size() > 1 && name[1] == ':')
      return false;
    const std::string normalized = normalize_relative(name);
    return !normalized.empty() && normalized != ".." && normalized.compare(0, 3, "../") != 0;
  }

  bool extract_archive(const std::string &archive_path, const std::string &dest_dir,
                       std::vector<std::string> *extracted, std::string &err)
  {
    err.clear();
    ZipHandle za = open_for_read(archive_path, err);
    if (!za)
      return false;

    const zip_int64_t count = zip_get_num_entries(za.get(), 0);
    if (count < 0)
    {
      err = "cannot read central directory";
      return false;
    }

    for (zip_int64_t i = 0; i < count; ++i)
    {
      const zip_uint64_t index = static_cast<zip_uint64_t>(i);
      const char *raw_name = zip_get_name(za.get(), index, ZIP_FL_ENC_GUESS);
      if (!raw_name)
      {
        err = std::string("cannot read entry name: ") + zip_strerror(za.get());
        return false;
      }
      const std::string name = raw_name;
      if (!is_safe_entry_name(name))
      {
        err = "unsafe entry name: " + name;
        return false;
      }

      const std::string relative = normalize_relative(name);
      const fs::path target = fs::path(dest_dir) / relative;
      std::error_code ec;
      if (name.back() == '/')
      {
        fs::create_directories(target, ec);
        if (ec)
        {
          err = "cannot create directory " + relative + ": " + ec.message();
          return false;
        }
        continue;
      }

      fs::create_directories(target.parent_path(), ec);
      if (ec)
      {
        err = "cannot create directory for " + relative + ": " + ec.message();
        return false;
      }
      if (!copy_entry(za.get(), index, target.string(), err))
        return false;
      if (extracted)
        extracted->push_back(relative);
    }
    return true;
  }

  bool write_archive(const std::string &source_dir, const std::string &archive_path,
                     const std::vector<std::string> &files, const RepackOptions &opt, std::string &err)
  {
    err.clear();
    if (opt.compression_level < 1 || opt.compression_level > 9)
    {
      err = "compression level must be in 1..9";
      return false;
    }

    int code = 0;
    ZipHandle za(zip_open(archive_path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &code));
    if (!za)
    {
      err = "cannot create archive: " + open_error_message(code);
      return false;
    }

    // 予約エントリは先頭・無圧縮
    if (!opt.reserved_entry.empty())
    {
      const fs::path reserved = fs::path(source_dir) / opt.reserved_entry;
      std::error_code ec;
      if (fs::is_regular_file(reserved, ec))
      {
        if (!add_file(za.get(), reserved.string(), opt.reserved_entry, true, 0, err))
          return false;
      }
    }

    for (const std::string &rel : files)
    {
      if (rel == opt.reserved_entry)
        continue;
      const fs::path full = fs::path(source_dir) / rel;
      if (!add_file(za.get(), full.string(), rel, false, opt.compression_level, err))
        return false;
    }

    if (zip_close(za.get()) != 0)
    {
      err = std::string("cannot write archive: ") + zip_strerror(za.get());
      return false;
    }
    za.release();
    return true;
  }

  bool list_archive(const std::string &archive_path, std::vector<ZipEntryInfo> &out, std::string &err)
  {
    err.clear();
    out.clear();
    ZipHandle za = open_for_read(archive_path, err);
    if (!za)
      return false;

    const zip_int64_t count = zip_get_num_entries(za.get(), 0);
    for (zip_int64_t i = 0; i < count; ++i)
    {
      zip_stat_t st;
      zip_stat_init(&st);
      if (zip_stat_index(za.get(), static_cast<zip_uint64_t>(i), 0, &st) != 0)
      {
        err = std::string("cannot stat entry: ") + zip_strerror(za.get());
        return false;
      }
      ZipEntryInfo info;
      info.name = st.name ? st.name : "";
      info.size = st.size;
      info.compressed_size = st.comp_size;
      info.stored = st.comp_method == ZIP_CM_STORE;
      out.push_back(info);
    }
    return true;
  }
} // namespace epubgs
