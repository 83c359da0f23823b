#include "archive_pipeline.h"
#include "path_mapping.h"
#include "reference_rewriter.h"
#include "scratch_dir.h"
#include "zip_io.h"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace epubgs
{
  struct ArchivePipeline::Run
  {
    std::string archive;
    std::string root; // extraction root inside the scratch directory
    Stage stage = Stage::Open;
    PathMapping mapping;
    ProcessResult result;
  };

  const char *stage_name(Stage stage)
  {
    switch (stage)
    {
    case Stage::Open:
      return "open";
    case Stage::Extracted:
      return "extracted";
    case Stage::ImagesConverted:
      return "images converted";
    case Stage::ReferencesRewritten:
      return "references rewritten";
    case Stage::Repackaged:
      return "repackaged";
    case Stage::Done:
      return "done";
    case Stage::Failed:
      return "failed";
    }
    return "unknown";
  }

  SizeDelta compute_size_delta(uint64_t original_size, uint64_t new_size)
  {
    SizeDelta d;
    const int64_t diff = static_cast<int64_t>(original_size) - static_cast<int64_t>(new_size);
    d.reduction = new_size < original_size;
    d.bytes = static_cast<uint64_t>(diff < 0 ? -diff : diff);
    // 整数除算なので 0 方向へ切り捨て
    const int64_t percent = original_size > 0 ? diff * 100 / static_cast<int64_t>(original_size) : 0;
    d.percent = percent < 0 ? -percent : percent;
    return d;
  }

  bool list_files(const std::string &root, std::vector<std::string> &out, std::string &err)
  {
    out.clear();
    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec);
    const fs::recursive_directory_iterator end;
    if (ec)
    {
      err = "cannot list " + root + ": " + ec.message();
      return false;
    }
    for (; it != end; it.increment(ec))
    {
      if (ec)
      {
        err = "cannot list " + root + ": " + ec.message();
        return false;
      }
      if (it->is_regular_file(ec))
        out.push_back(it->path().lexically_relative(root).generic_string());
    }
    if (ec)
    {
      err = "cannot list " + root + ": " + ec.message();
      return false;
    }
    std::sort(out.begin(), out.end());
    return true;
  }

  ArchivePipeline::ArchivePipeline(const Options &opt, ProgressSink *sink)
      : opt_(opt), sink_(sink)
  {
  }

  void ArchivePipeline::emit(const Run &run, EventKind kind, const std::string &subject, const std::string &detail,
                             ErrorKind error) const
  {
    if (!sink_)
      return;
    ProgressEvent ev;
    ev.kind = kind;
    ev.stage = run.stage;
    ev.archive = run.archive;
    ev.subject = subject;
    ev.detail = detail;
    ev.error = error;
    sink_->on_event(ev);
  }

  void ArchivePipeline::enter(Run &run, Stage stage) const
  {
    run.stage = stage;
    run.result.reached = stage;
    emit(run, EventKind::StageEntered, std::string(), stage_name(stage));
  }

  ProcessResult ArchivePipeline::fail(Run &run, ErrorKind error, const std::string &message) const
  {
    run.result.success = false;
    run.result.error = error;
    run.result.message = message;
    run.stage = Stage::Failed;
    emit(run, EventKind::Finished, std::string(), message, error);
    return run.result;
  }

  ProcessResult ArchivePipeline::process_archive(const std::string &input_path, const std::string &output_dir)
  {
    Run run;
    run.archive = fs::path(input_path).filename().string();
    enter(run, Stage::Open);

    std::string err;
    if (!validate_options(opt_, err))
      return fail(run, ErrorKind::Config, err);
    const std::unique_ptr<Quantizer> quantizer = make_quantizer(opt_.quantize, err);
    if (!quantizer)
      return fail(run, ErrorKind::Config, err);

    std::error_code ec;
    if (!fs::is_regular_file(input_path, ec))
      return fail(run, ErrorKind::ArchiveRead, "file not found: " + input_path);
    run.result.original_size = fs::file_size(input_path, ec);
    if (ec)
      return fail(run, ErrorKind::ArchiveRead, "cannot stat " + input_path + ": " + ec.message());

    fs::create_directories(output_dir, ec);
    if (ec)
      return fail(run, ErrorKind::ArchiveWrite, "cannot create " + output_dir + ": " + ec.message());
    run.result.output_path = (fs::path(output_dir) / (fs::path(input_path).stem().string() + ".epub")).string();

    ScratchDir scratch([this, &run](const std::string &msg)
                       { emit(run, EventKind::Warning, std::string(), msg); });
    if (!scratch.create("epubgs-", err))
      return fail(run, ErrorKind::ArchiveWrite, err);
    run.root = (fs::path(scratch.path()) / "extracted").string();
    fs::create_directory(run.root, ec);
    if (ec)
      return fail(run, ErrorKind::ArchiveWrite, "cannot create " + run.root + ": " + ec.message());

    if (!extract_archive(input_path, run.root, nullptr, err))
      return fail(run, ErrorKind::ArchiveRead, err);
    enter(run, Stage::Extracted);

    // 1st phase: convert every image and complete the mapping
    if (!convert_images(run, *quantizer))
      return run.result;
    enter(run, Stage::ImagesConverted);

    // 2nd phase: apply the mapping to every referencing file
    if (run.mapping.empty())
      emit(run, EventKind::NoImages, std::string(), "no images found");
    else
      rewrite_references(run);
    enter(run, Stage::ReferencesRewritten);

    if (!repackage(run))
      return run.result;
    enter(run, Stage::Repackaged);

    run.result.new_size = fs::file_size(run.result.output_path, ec);
    if (ec)
      return fail(run, ErrorKind::ArchiveWrite, "cannot stat " + run.result.output_path + ": " + ec.message());

    run.result.success = true;
    run.stage = Stage::Done;
    run.result.reached = Stage::Done;
    if (sink_)
    {
      ProgressEvent ev;
      ev.kind = EventKind::Finished;
      ev.stage = Stage::Done;
      ev.archive = run.archive;
      ev.subject = run.result.output_path;
      ev.bytes_before = run.result.original_size;
      ev.bytes_after = run.result.new_size;
      sink_->on_event(ev);
    }
    return run.result;
  }

  BatchResult run_batch(ArchivePipeline &pipeline, const std::vector<std::string> &inputs,
                        const std::string &output_dir)
  {
    BatchResult batch;
    for (const std::string &input : inputs)
    {
      batch.results.push_back(pipeline.process_archive(input, output_dir));
      if (batch.results.back().success)
        ++batch.successful;
      else
        ++batch.failed;
    }
    return batch;
  }

  bool ArchivePipeline::convert_images(Run &run, const Quantizer &quantizer)
  {
    std::vector<std::string> files;
    std::string err;
    if (!list_files(run.root, files, err))
    {
      fail(run, ErrorKind::ArchiveRead, err);
      return false;
    }

    const ImageConverter converter(quantizer, opt_.repack.compression_level);
    for (const std::string &rel : files)
    {
      if (!ImageConverter::is_convertible(rel))
        continue;

      ConvertResult converted;
      ErrorKind kind = ErrorKind::None;
      if (!converter.convert(run.root, rel, converted, kind, err))
      {
        ++run.result.images_skipped;
        emit(run, EventKind::ImageSkipped, rel, err, kind);
        continue;
      }
      if (!run.mapping.add(converted.old_path, converted.new_path))
        emit(run, EventKind::Warning, rel, "image mapped twice", ErrorKind::None);
      ++run.result.images_converted;

      if (sink_)
      {
        ProgressEvent ev;
        ev.kind = EventKind::ImageConverted;
        ev.stage = run.stage;
        ev.archive = run.archive;
        ev.subject = rel;
        ev.detail = converted.new_path;
        ev.bytes_before = converted.old_size;
        ev.bytes_after = converted.new_size;
        ev.image = &converted;
        sink_->on_event(ev);
      }
    }

    if (opt_.match == MatchMode::Basename)
    {
      for (const std::string &name : run.mapping.ambiguous_filenames())
        emit(run, EventKind::Warning, name, "several converted images share this filename; references to it are ambiguous");
    }
    return true;
  }

  void ArchivePipeline::rewrite_references(Run &run)
  {
    std::vector<std::string> files;
    std::string err;
    if (!list_files(run.root, files, err))
    {
      ++run.result.files_skipped;
      emit(run, EventKind::FileSkipped, run.root, err, ErrorKind::ReferenceRewriteIO);
      return;
    }

    for (const std::string &rel : files)
    {
      const Dialect dialect = dialect_for_path(rel);
      if (dialect == Dialect::None)
        continue;

      RewriteOptions ropt;
      ropt.match = opt_.match;
      ropt.base_dir = dirname_of(rel);
      RewriteResult rewritten;
      ErrorKind kind = ErrorKind::None;
      const std::string full = (fs::path(run.root) / rel).string();
      if (!rewrite_file(full, dialect, run.mapping, ropt, rewritten, kind, err))
      {
        ++run.result.files_skipped;
        emit(run, EventKind::FileSkipped, rel, err, kind);
        continue;
      }
      if (rewritten.changed)
      {
        ++run.result.files_rewritten;
        emit(run, EventKind::FileRewritten, rel,
             std::string(dialect_name(dialect)) + ", " + std::to_string(rewritten.replacements) + " reference(s)");
      }
    }
  }

  bool ArchivePipeline::repackage(Run &run)
  {
    std::vector<std::string> files;
    std::string err;
    if (!list_files(run.root, files, err))
    {
      fail(run, ErrorKind::ArchiveWrite, err);
      return false;
    }
    if (!write_archive(run.root, run.result.output_path, files, opt_.repack, err))
    {
      fail(run, ErrorKind::ArchiveWrite, err);
      return false;
    }
    return true;
  }
} // namespace epubgs
