#include "splitcpp/errors.hpp"
#include "splitcpp/joiner.hpp"
#include "splitcpp/manifest.hpp"
#include "splitcpp/splitter.hpp"

#include "console_log.hpp"
#include "progress_printer.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

constexpr int kExitUsage = 2;

struct CommandLine {
  std::string command;
  std::vector<std::string> positional;
  std::optional<std::filesystem::path> output_dir;
  std::optional<std::string> chunk_size;
  std::optional<std::string> block_size;
  bool quiet = false;
  bool help = false;
};

class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
         "  splitcpp split <file> [-o|--output DIR] [-s|--chunk-size SIZE] [--block-size SIZE] [-q]\n"
         "  splitcpp join <manifest.json> [-o|--output DIR] [--block-size SIZE] [-q]\n"
         "  splitcpp verify <manifest.json> [-q]\n"
         "  splitcpp            (interactive)\n"
         "\n"
         "SIZE is a byte count or a number with a K, M or G suffix (1024-based), e.g. 500M or 1.5G.\n"
         "split writes parts and <file>.manifest.json to DIR (default: <file>_split next to the file).\n"
         "join writes the reconstructed file to DIR (default: the manifest's directory).\n"
         "Set SPLITCPP_LOG=1 for verbose logging.\n";
}

int ExitCodeFor(splitcpp::ErrorCode code) {
  switch (code) {
    case splitcpp::ErrorCode::kInvalidArgument:
      return 3;
    case splitcpp::ErrorCode::kNotFound:
      return 4;
    case splitcpp::ErrorCode::kFormatError:
      return 5;
    case splitcpp::ErrorCode::kChecksumMismatch:
      return 6;
    case splitcpp::ErrorCode::kIOError:
      return 7;
  }
  return EXIT_FAILURE;
}

std::string TakeValue(int argc, char* argv[], int& i, std::string_view flag) {
  const std::string_view arg = argv[i];
  const auto eq = arg.find('=');
  if (eq != std::string_view::npos) {
    return std::string(arg.substr(eq + 1));
  }
  if (i + 1 >= argc) {
    throw UsageError("missing value for " + std::string(flag));
  }
  ++i;
  return argv[i];
}

bool MatchesFlag(std::string_view arg, std::string_view short_flag, std::string_view long_flag) {
  if (!short_flag.empty() && arg == short_flag) {
    return true;
  }
  return arg == long_flag || (arg.size() > long_flag.size() && arg.substr(0, long_flag.size()) == long_flag &&
                              arg[long_flag.size()] == '=');
}

CommandLine ParseCommandLine(int argc, char* argv[]) {
  CommandLine cmd{};
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      cmd.help = true;
    } else if (arg == "-q" || arg == "--quiet") {
      cmd.quiet = true;
    } else if (MatchesFlag(arg, "-o", "--output")) {
      cmd.output_dir = std::filesystem::path(TakeValue(argc, argv, i, "--output"));
    } else if (MatchesFlag(arg, "-s", "--chunk-size")) {
      cmd.chunk_size = TakeValue(argc, argv, i, "--chunk-size");
    } else if (MatchesFlag(arg, "", "--block-size")) {
      cmd.block_size = TakeValue(argc, argv, i, "--block-size");
    } else if (arg.size() > 1 && arg.front() == '-') {
      throw UsageError("unknown option " + std::string(arg));
    } else if (cmd.command.empty()) {
      cmd.command = std::string(arg);
    } else {
      cmd.positional.emplace_back(arg);
    }
  }
  return cmd;
}

std::size_t ParseBlockSize(const std::optional<std::string>& text, std::size_t fallback) {
  if (!text.has_value()) {
    return fallback;
  }
  const auto parsed = splitcpp::ParseChunkSize(*text);
  if (parsed > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
    throw splitcpp::Error(splitcpp::ErrorCode::kInvalidArgument, "block size too large: " + *text);
  }
  return static_cast<std::size_t>(parsed);
}

std::filesystem::path RunSplit(const std::filesystem::path& source,
                               const std::optional<std::filesystem::path>& output_dir,
                               std::uint64_t chunk_size,
                               std::size_t block_size,
                               bool quiet) {
  splitcpp::cli::LogKV("source", source.string());
  splitcpp::cli::LogKV("chunk_size", chunk_size);
  splitcpp::cli::LogKV("block_size", static_cast<std::uint64_t>(block_size));

  splitcpp::SplitOptions options{};
  options.chunk_size = chunk_size;
  options.output_dir = output_dir;
  options.block_size = block_size;
  if (!quiet) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(source, ec);
    if (!ec) {
      std::cout << "\nSplitting '" << source.filename().string() << "' (" << splitcpp::cli::FormatBytes(size)
                << ")...\n\n";
    }
    options.on_progress = splitcpp::cli::ProgressPrinter(std::cerr, "Overall progress", "Wrote");
  }

  const auto result = splitcpp::Split(source, options);
  splitcpp::cli::LogKV("total_parts", result.manifest.total_parts());
  if (!quiet) {
    std::cout << "\nSplit complete!\nParts and manifest saved in:\n" << result.output_dir.string() << "\n\n";
  }
  return result.manifest_path;
}

std::filesystem::path RunJoin(const std::filesystem::path& manifest_path,
                              const std::optional<std::filesystem::path>& output_dir,
                              std::size_t block_size,
                              bool quiet) {
  splitcpp::cli::LogKV("manifest", manifest_path.string());
  splitcpp::cli::LogKV("block_size", static_cast<std::uint64_t>(block_size));

  splitcpp::JoinOptions options{};
  options.output_dir = output_dir;
  options.block_size = block_size;
  if (!quiet) {
    const auto manifest = splitcpp::ReadManifest(manifest_path);
    std::cout << "\nReassembling '" << manifest.original_filename << "' from " << manifest.total_parts()
              << " parts...\n\n";
    options.on_progress = splitcpp::cli::ProgressPrinter(std::cerr, "Merging", "Merged");
  }

  const auto result = splitcpp::Join(manifest_path, options);
  splitcpp::cli::LogKV("bytes_written", result.bytes_written);
  if (!quiet) {
    std::cout << "\nMerge complete! File saved to:\n" << result.output_path.string() << "\n";
  }
  return result.output_path;
}

int RunVerify(const std::filesystem::path& manifest_path, bool quiet) {
  splitcpp::VerifyOptions options{};
  if (!quiet) {
    options.on_progress = splitcpp::cli::ProgressPrinter(std::cerr, "Verifying", "Checked");
  }
  const auto report = splitcpp::VerifyParts(manifest_path, options);
  for (const auto& part : report.parts) {
    std::cout << part.record.filename << ": " << splitcpp::PartStatusName(part.status);
    if (part.status == splitcpp::PartStatus::kSizeMismatch) {
      std::cout << " (expected " << part.record.size << " bytes, found " << part.actual_size << ")";
    } else if (part.status == splitcpp::PartStatus::kChecksumMismatch) {
      std::cout << " (expected " << part.record.md5 << ", got " << part.actual_md5 << ")";
    }
    std::cout << "\n";
  }
  if (report.ok()) {
    std::cout << "All " << report.parts.size() << " parts verified.\n";
    return EXIT_SUCCESS;
  }
  return ExitCodeFor(splitcpp::ErrorCode::kChecksumMismatch);
}

std::string StripQuotes(std::string text) {
  while (!text.empty() && (text.back() == '\r' || text.back() == ' ')) {
    text.pop_back();
  }
  while (!text.empty() && text.front() == ' ') {
    text.erase(text.begin());
  }
  if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
    text = text.substr(1, text.size() - 2);
  }
  return text;
}

std::optional<std::string> Prompt(const std::string& question) {
  std::cout << question << "\n> " << std::flush;
  std::string line;
  if (!std::getline(std::cin, line)) {
    return std::nullopt;
  }
  return StripQuotes(line);
}

// Prompts until the answer names an existing regular file; nullopt on end of input.
std::optional<std::filesystem::path> PromptForFile(const std::string& question,
                                                   const std::string& not_found,
                                                   std::string_view required_extension = {}) {
  while (true) {
    const auto answer = Prompt(question);
    if (!answer.has_value()) {
      return std::nullopt;
    }
    const std::filesystem::path path(*answer);
    std::error_code ec;
    auto extension = path.extension().string();
    for (char& ch : extension) {
      ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    const bool extension_ok = required_extension.empty() || extension == required_extension;
    if (!answer->empty() && std::filesystem::is_regular_file(path, ec) && extension_ok) {
      return path;
    }
    std::cout << not_found << "\n\n";
  }
}

int RunInteractive() {
  std::cout << "--------------------------------------------\n"
               "           FILE SPLITTER / JOINER\n"
               "--------------------------------------------\n\n";
  std::optional<std::string> mode;
  while (true) {
    mode = Prompt("Split a file or join parts? [split/join]");
    if (!mode.has_value()) {
      return kExitUsage;
    }
    if (*mode == "split" || *mode == "join") {
      break;
    }
    std::cout << "Please answer 'split' or 'join'.\n\n";
  }

  try {
    if (*mode == "split") {
      const auto source = PromptForFile("Enter the full path to the file you want to split:",
                                        "File not found. Please try again.");
      if (!source.has_value()) {
        return kExitUsage;
      }
      const auto chunk_text = Prompt("\nEnter desired chunk size (default 1G, e.g. 500M, 2G):");
      std::uint64_t chunk_size = splitcpp::kDefaultChunkSize;
      if (chunk_text.has_value() && !chunk_text->empty()) {
        try {
          chunk_size = splitcpp::ParseChunkSize(*chunk_text);
        } catch (const splitcpp::Error& ex) {
          splitcpp::cli::Log(ex.what());
          std::cout << "Invalid size format. Using default 1 GB.\n";
        }
      }
      RunSplit(*source, std::nullopt, chunk_size, splitcpp::kDefaultSplitBlockSize, false);
    } else {
      const auto manifest = PromptForFile("Enter the full path to the manifest (.json) file:",
                                          "Manifest file not found. Please try again.", ".json");
      if (!manifest.has_value()) {
        return kExitUsage;
      }
      RunJoin(*manifest, std::nullopt, splitcpp::kDefaultJoinBlockSize, false);
    }
  } catch (const splitcpp::Error& ex) {
    std::cout << "\nAn error occurred: " << ex.what() << "\n";
    Prompt("\nPress Enter to exit...");
    return ExitCodeFor(ex.code());
  }
  Prompt("\nPress Enter to exit...");
  return EXIT_SUCCESS;
}

int Run(int argc, char* argv[]) {
  if (argc <= 1) {
    return RunInteractive();
  }
  const auto cmd = ParseCommandLine(argc, argv);
  if (cmd.help) {
    PrintUsage(std::cout);
    return EXIT_SUCCESS;
  }
  if (cmd.positional.size() != 1) {
    throw UsageError(cmd.command.empty() ? "missing command" : "expected exactly one path after '" + cmd.command + "'");
  }
  const std::filesystem::path target(cmd.positional.front());

  if (cmd.command == "split") {
    const auto chunk_size = cmd.chunk_size.has_value() ? splitcpp::ParseChunkSize(*cmd.chunk_size)
                                                       : splitcpp::kDefaultChunkSize;
    const auto block_size = ParseBlockSize(cmd.block_size, splitcpp::kDefaultSplitBlockSize);
    std::cout << RunSplit(target, cmd.output_dir, chunk_size, block_size, cmd.quiet).string() << "\n";
    return EXIT_SUCCESS;
  }
  if (cmd.chunk_size.has_value()) {
    throw UsageError("--chunk-size only applies to split");
  }
  if (cmd.command == "join") {
    const auto block_size = ParseBlockSize(cmd.block_size, splitcpp::kDefaultJoinBlockSize);
    std::cout << RunJoin(target, cmd.output_dir, block_size, cmd.quiet).string() << "\n";
    return EXIT_SUCCESS;
  }
  if (cmd.command == "verify") {
    if (cmd.output_dir.has_value() || cmd.block_size.has_value()) {
      throw UsageError("verify takes no --output or --block-size");
    }
    return RunVerify(target, cmd.quiet);
  }
  throw UsageError("unknown command '" + cmd.command + "'");
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    return Run(argc, argv);
  } catch (const UsageError& ex) {
    splitcpp::cli::LogError(ex.what());
    PrintUsage(std::cerr);
    return kExitUsage;
  } catch (const splitcpp::Error& ex) {
    splitcpp::cli::LogError(std::string(splitcpp::ErrorCodeName(ex.code())) + ": " + ex.what());
    return ExitCodeFor(ex.code());
  } catch (const std::exception& ex) {
    splitcpp::cli::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
