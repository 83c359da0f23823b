#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "error_kind.h"
#include "image_converter.h"
#include "options.h"

namespace epubgs
{
  enum class Stage
  {
    Open,
    Extracted,
    ImagesConverted,
    ReferencesRewritten,
    Repackaged,
    Done,
    Failed
  };

  const char *stage_name(Stage stage);

  enum class EventKind
  {
    StageEntered,
    ImageConverted,
    ImageSkipped,
    FileRewritten,
    FileSkipped,
    NoImages,
    Warning,
    Finished
  };

  struct ProgressEvent
  {
    EventKind kind = EventKind::StageEntered;
    Stage stage = Stage::Open;
    std::string archive;  // input file name
    std::string subject;  // relative path of the image / file concerned
    std::string detail;   // human readable message
    ErrorKind error = ErrorKind::None;
    uint64_t bytes_before = 0;
    uint64_t bytes_after = 0;
    const ConvertResult *image = nullptr; // ImageConverted only
  };

  class ProgressSink
  {
  public:
    virtual ~ProgressSink() = default;
    virtual void on_event(const ProgressEvent &event) = 0;
  };

  struct SizeDelta
  {
    bool reduction = false; // new size < original size
    uint64_t bytes = 0;     // absolute difference
    int64_t percent = 0;    // of the original size, truncated toward zero, never negative
  };

  SizeDelta compute_size_delta(uint64_t original_size, uint64_t new_size);

  struct ProcessResult
  {
    bool success = false;
    uint64_t original_size = 0;
    uint64_t new_size = 0;
    std::string output_path;
    Stage reached = Stage::Open;
    ErrorKind error = ErrorKind::None;
    std::string message;
    int images_converted = 0;
    int images_skipped = 0;
    int files_rewritten = 0;
    int files_skipped = 0;
  };

  // One archive per call: extract, convert, rewrite, repack. Never prints;
  // everything observable goes through the sink.
  class ArchivePipeline
  {
  public:
    explicit ArchivePipeline(const Options &opt, ProgressSink *sink = nullptr);

    ProcessResult process_archive(const std::string &input_path, const std::string &output_dir);

  private:
    struct Run;

    bool convert_images(Run &run, const Quantizer &quantizer);
    void rewrite_references(Run &run);
    bool repackage(Run &run);

    void emit(const Run &run, EventKind kind, const std::string &subject, const std::string &detail,
              ErrorKind error = ErrorKind::None) const;
    void enter(Run &run, Stage stage) const;
    ProcessResult fail(Run &run, ErrorKind error, const std::string &message) const;

    Options opt_;
    ProgressSink *sink_;
  };

  struct BatchResult
  {
    int successful = 0;
    int failed = 0;
    std::vector<ProcessResult> results; // one per input, in order
  };

  // Processes every input in order; a failed archive never stops the batch.
  BatchResult run_batch(ArchivePipeline &pipeline, const std::vector<std::string> &inputs,
                        const std::string &output_dir);

  // Regular files under root as sorted '/' separated relative paths.
  bool list_files(const std::string &root, std::vector<std::string> &out, std::string &err);
} // namespace epubgs
