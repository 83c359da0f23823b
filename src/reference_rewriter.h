#pragma once

#include <string>

#include "error_kind.h"
#include "path_mapping.h"

namespace epubgs
{
  enum class Dialect
  {
    None,
    Markup,  // .htm .html .xhtml
    Style,   // .css
    Manifest // .opf
  };

  enum class MatchMode
  {
    Basename, // compare the last path segment only
    FullPath  // resolve against the referencing file and compare the whole path
  };

  struct RewriteOptions
  {
    MatchMode match = MatchMode::Basename;
    // Directory of the referencing file, relative to the extraction root.
    // Only used by MatchMode::FullPath.
    std::string base_dir;
    std::string jpeg_media_type = "image/jpeg";
    std::string png_media_type = "image/png";
  };

  struct RewriteResult
  {
    std::string content;
    bool changed = false;
    int replacements = 0;
  };

  Dialect dialect_for_path(const std::string &path);
  const char *dialect_name(Dialect dialect);

  // src / href / xlink:href attribute values. The quote character and every
  // part of the value except the filename are kept.
  RewriteResult rewrite_markup(const std::string &content, const PathMapping &mapping, const RewriteOptions &opt);

  // url(...) references, emitted as url("...").
  RewriteResult rewrite_css(const std::string &content, const PathMapping &mapping, const RewriteOptions &opt);

  // <manifest><item href media-type/></manifest>. Returns false with err set
  // when the document cannot be parsed or has no manifest.
  bool rewrite_manifest(const std::string &content, const PathMapping &mapping, const RewriteOptions &opt,
                        RewriteResult &out, std::string &err);

  // Reads path, applies the dialect and writes the file back only when it
  // changed. On failure kind is ReferenceRewriteIO or ManifestParse.
  bool rewrite_file(const std::string &path, Dialect dialect, const PathMapping &mapping, const RewriteOptions &opt,
                    RewriteResult &out, ErrorKind &kind, std::string &err);
} // namespace epubgs
