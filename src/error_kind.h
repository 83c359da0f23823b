#pragma once

namespace epubgs
{
  enum class ErrorKind
  {
    None,
    ArchiveRead,        // fatal for the archive
    ArchiveWrite,       // fatal for the archive
    ImageDecode,        // image left unconverted
    ImageEncode,        // image left unconverted
    ManifestParse,      // manifest left unrewritten
    ReferenceRewriteIO, // file left unrewritten
    Config
  };

  inline const char *error_kind_name(ErrorKind kind)
  {
    switch (kind)
    {
    case ErrorKind::None:
      return "none";
    case ErrorKind::ArchiveRead:
      return "archive read error";
    case ErrorKind::ArchiveWrite:
      return "archive write error";
    case ErrorKind::ImageDecode:
      return "image decode error";
    case ErrorKind::ImageEncode:
      return "image encode error";
    case ErrorKind::ManifestParse:
      return "manifest parse error";
    case ErrorKind::ReferenceRewriteIO:
      return "reference rewrite I/O error";
    case ErrorKind::Config:
      return "configuration error";
    }
    return "unknown error";
  }
} // namespace epubgs
