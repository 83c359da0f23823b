#include "archive_pipeline.h"
#include "options.h"

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace
{
  using namespace epubgs;

  void print_usage()
  {
    std::cerr << "Usage: epubgs [options] <book.epub> [<book.epub> ...]"
              << " [-o <dir>|--output=<dir>] [-v|--verbose]"
              << " [--mode=dither|palette] [--levels=N] [--palette-colors=N]"
              << " [--match=basename|fullpath] [--compression-level=1..9]"
              << " [--config=<file.json>]\n";
  }

  std::string mib(uint64_t bytes)
  {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MiB";
    return oss.str();
  }

  std::string kib(uint64_t bytes)
  {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1024.0 << " KB";
    return oss.str();
  }

  // 進捗イベントを標準出力・標準エラーへ書き出す。
  class ConsoleReporter : public ProgressSink
  {
  public:
    explicit ConsoleReporter(bool verbose)
        : verbose_(verbose)
    {
    }

    void on_event(const ProgressEvent &ev) override
    {
      switch (ev.kind)
      {
      case EventKind::StageEntered:
        if (ev.stage == Stage::Open)
        {
          std::cout << std::string(50, '=') << "\n";
          std::cout << "Processing: " << ev.archive << "\n";
        }
        else if (ev.stage == Stage::Extracted)
          std::cout << "Processing images...\n";
        else if (ev.stage == Stage::ImagesConverted)
          std::cout << "Updating file references...\n";
        else if (ev.stage == Stage::ReferencesRewritten)
          std::cout << "Repackaging epub...\n";
        break;
      case EventKind::ImageConverted:
        print_image(ev);
        break;
      case EventKind::ImageSkipped:
        std::cerr << "  Skipped " << ev.subject << " (" << error_kind_name(ev.error) << "): " << ev.detail << "\n";
        break;
      case EventKind::FileRewritten:
        if (verbose_)
          std::cout << "  Updated " << ev.subject << " (" << ev.detail << ")\n";
        break;
      case EventKind::FileSkipped:
        std::cerr << "  Not updated " << ev.subject << " (" << error_kind_name(ev.error) << "): " << ev.detail << "\n";
        break;
      case EventKind::NoImages:
        std::cout << "  No images found to process\n";
        break;
      case EventKind::Warning:
        std::cerr << "  Warning: " << (ev.subject.empty() ? "" : ev.subject + ": ") << ev.detail << "\n";
        break;
      case EventKind::Finished:
        if (ev.stage == Stage::Failed)
          std::cerr << "Error processing " << ev.archive << " (" << error_kind_name(ev.error) << "): " << ev.detail << "\n";
        else
          print_summary(ev);
        break;
      }
    }

  private:
    void print_image(const ProgressEvent &ev) const
    {
      if (!verbose_ || !ev.image)
      {
        std::cout << "  Converted " << ev.subject << " -> " << ev.detail << "\n";
        return;
      }
      const ConvertResult &r = *ev.image;
      std::cout << "  Processing " << r.old_path << ":\n";
      std::cout << "    Original: " << format_name(r.source.format) << " " << r.source.width << "x" << r.source.height
                << " " << r.source.channels << "ch " << r.source.bit_depth << "-bit"
                << (r.source.progressive ? " progressive" : "") << " (" << kib(r.old_size) << ")\n";
      std::cout << "    Converted: " << r.bit_depth << "-bit " << (r.palette ? "palette" : "grayscale") << " PNG "
                << r.new_path << " (" << kib(r.new_size) << ")\n";
    }

    void print_summary(const ProgressEvent &ev) const
    {
      const SizeDelta d = compute_size_delta(ev.bytes_before, ev.bytes_after);
      std::cout << "Created: " << ev.subject << "\n";
      std::cout << "Original size: " << mib(ev.bytes_before) << "\n";
      std::cout << "New size: " << mib(ev.bytes_after) << "\n";
      std::cout << (d.reduction ? "Size reduction: " : "Size increase: ") << mib(d.bytes) << " (" << d.percent << "%)\n";
    }

    bool verbose_;
  };
} // namespace

int main(int argc, char **argv)
{
  if (argc < 2)
  {
    print_usage();
    return 2;
  }

  Options opt;
  std::vector<std::string> inputs;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    std::string err;
    if (arg == "-h" || arg == "--help")
    {
      print_usage();
      return 0;
    }
    else if (arg == "-v" || arg == "--verbose")
    {
      opt.verbose = true;
    }
    else if (arg == "-o")
    {
      if (i + 1 >= argc)
      {
        std::cerr << "-o requires a directory\n";
        return 2;
      }
      opt.output_dir = argv[++i];
    }
    else if (arg.rfind("--output=", 0) == 0)
    {
      opt.output_dir = arg.substr(9);
    }
    else if (arg.rfind("--config=", 0) == 0)
    {
      if (!load_options_file(arg.substr(9), opt, err))
      {
        std::cerr << err << "\n";
        return 2;
      }
    }
    else if (arg.rfind("--mode=", 0) == 0)
    {
      const std::string v = arg.substr(7);
      if (!parse_quantize_mode(v, opt.quantize.mode))
      {
        std::cerr << "Invalid --mode: " << v << "\n";
        return 2;
      }
    }
    else if (arg.rfind("--levels=", 0) == 0)
    {
      const std::string v = arg.substr(9);
      if (!parse_int(v, opt.quantize.levels))
      {
        std::cerr << "Invalid --levels: " << v << "\n";
        return 2;
      }
    }
    else if (arg.rfind("--palette-colors=", 0) == 0)
    {
      const std::string v = arg.substr(17);
      if (!parse_int(v, opt.quantize.palette_colors))
      {
        std::cerr << "Invalid --palette-colors: " << v << "\n";
        return 2;
      }
    }
    else if (arg.rfind("--match=", 0) == 0)
    {
      const std::string v = arg.substr(8);
      if (!parse_match_mode(v, opt.match))
      {
        std::cerr << "Invalid --match: " << v << "\n";
        return 2;
      }
    }
    else if (arg.rfind("--compression-level=", 0) == 0)
    {
      const std::string v = arg.substr(20);
      if (!parse_int(v, opt.repack.compression_level))
      {
        std::cerr << "Invalid --compression-level: " << v << "\n";
        return 2;
      }
    }
    else if (arg.size() > 1 && arg[0] == '-')
    {
      std::cerr << "Unknown option: " << arg << "\n";
      return 2;
    }
    else
    {
      inputs.push_back(arg);
    }
  }

  std::string err;
  if (!validate_options(opt, err))
  {
    std::cerr << err << "\n";
    return 2;
  }
  if (inputs.empty())
  {
    print_usage();
    return 2;
  }

  if (opt.verbose)
  {
    std::cout << "Mode: " << quantize_mode_name(opt.quantize.mode) << " ("
              << (opt.quantize.mode == QuantizeMode::Palette ? opt.quantize.palette_colors : opt.quantize.levels)
              << " levels), match: " << match_mode_name(opt.match)
              << ", compression level: " << opt.repack.compression_level << "\n";
  }

  ConsoleReporter reporter(opt.verbose);
  ArchivePipeline pipeline(opt, &reporter);

  const BatchResult batch = run_batch(pipeline, inputs, opt.output_dir);

  if (inputs.size() > 1)
  {
    std::cout << std::string(50, '=') << "\n";
    std::cout << "SUMMARY:\n";
    std::cout << "Successfully processed: " << batch.successful << "\n";
    std::cout << "Failed: " << batch.failed << "\n";
  }
  return batch.failed == 0 ? 0 : 1;
}
