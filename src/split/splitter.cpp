#include "splitcpp/splitter.hpp"

#include "splitcpp/errors.hpp"
#include "splitcpp/manifest.hpp"

#include "../core/file_io.hpp"
#include "../core/md5.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <ctime>
#include <limits>
#include <span>
#include <system_error>
#include <vector>

namespace splitcpp {
namespace {

Error SplitterError(ErrorCode code, const std::string& message, const std::filesystem::path& path = {}) {
  return Error(code, "splitter: " + message, path);
}

void Notify(const SplitOptions& options, ProgressEvent event) {
  if (options.on_progress) {
    options.on_progress(event);
  }
}

std::string LocalTimestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
#if defined(_MSC_VER)
  localtime_s(&local, &now);
#else
  localtime_r(&now, &local);
#endif
  char buffer[32] = {};
  const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
  return std::string(buffer, written);
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

// Writes one part of exactly part_size bytes from the source stream.
PartRecord WritePart(std::istream& in,
                     const std::filesystem::path& part_path,
                     std::uint64_t part_size,
                     std::vector<std::byte>& block,
                     const std::filesystem::path& source,
                     const std::function<void(std::uint64_t)>& on_bytes) {
  auto out = core::OpenForWrite(part_path);
  core::Md5 hasher;
  std::uint64_t remaining = part_size;
  while (remaining > 0) {
    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, block.size()));
    const auto got = core::ReadBlock(in, std::span<std::byte>(block.data(), want));
    if (got != want) {
      throw SplitterError(ErrorCode::kIOError, "short read from " + source.string() + " (file changed during split?)",
                          source);
    }
    const std::span<const std::byte> bytes(block.data(), got);
    core::WriteBlock(out, bytes, part_path);
    hasher.Update(bytes);
    remaining -= got;
    on_bytes(got);
  }
  core::CloseOutput(out, part_path);

  PartRecord record{};
  record.filename = part_path.filename().string();
  record.size = part_size;
  record.md5 = core::Md5Hex(hasher.Finalize());
  return record;
}

}  // namespace

std::uint64_t ParseChunkSize(std::string_view text) {
  const auto trimmed = Trim(text);
  if (trimmed.empty()) {
    throw SplitterError(ErrorCode::kInvalidArgument, "chunk size is empty");
  }

  std::uint64_t multiplier = 1;
  std::string_view number = trimmed;
  switch (std::toupper(static_cast<unsigned char>(trimmed.back()))) {
    case 'K':
      multiplier = 1024ULL;
      break;
    case 'M':
      multiplier = 1024ULL * 1024ULL;
      break;
    case 'G':
      multiplier = 1024ULL * 1024ULL * 1024ULL;
      break;
    default:
      break;
  }
  if (multiplier != 1) {
    number = Trim(trimmed.substr(0, trimmed.size() - 1));
  }
  const std::string original(trimmed);
  if (number.empty() || number.front() == '-' || number.front() == '+') {
    throw SplitterError(ErrorCode::kInvalidArgument, "invalid chunk size '" + original + "'");
  }

  const auto* begin = number.data();
  const auto* end = number.data() + number.size();
  std::uint64_t bytes = 0;
  if (number.find('.') == std::string_view::npos) {
    std::uint64_t whole = 0;
    const auto [ptr, ec] = std::from_chars(begin, end, whole);
    if (ec == std::errc::result_out_of_range) {
      throw SplitterError(ErrorCode::kInvalidArgument, "chunk size '" + original + "' is too large");
    }
    if (ec != std::errc{} || ptr != end) {
      throw SplitterError(ErrorCode::kInvalidArgument, "invalid chunk size '" + original + "'");
    }
    if (whole > std::numeric_limits<std::uint64_t>::max() / multiplier) {
      throw SplitterError(ErrorCode::kInvalidArgument, "chunk size '" + original + "' is too large");
    }
    bytes = whole * multiplier;
  } else {
    double fractional = 0.0;
    const auto [ptr, ec] = std::from_chars(begin, end, fractional, std::chars_format::fixed);
    if (ec != std::errc{} || ptr != end || !std::isfinite(fractional)) {
      throw SplitterError(ErrorCode::kInvalidArgument, "invalid chunk size '" + original + "'");
    }
    const double scaled = std::floor(fractional * static_cast<double>(multiplier));
    if (scaled >= 18446744073709551616.0) {
      throw SplitterError(ErrorCode::kInvalidArgument, "chunk size '" + original + "' is too large");
    }
    bytes = static_cast<std::uint64_t>(scaled);
  }

  if (bytes == 0) {
    throw SplitterError(ErrorCode::kInvalidArgument, "chunk size must be positive, got '" + original + "'");
  }
  return bytes;
}

std::string SanitizeDirectoryName(std::string_view name) {
  std::string out(name);
  for (char& ch : out) {
    const auto uch = static_cast<unsigned char>(ch);
    const bool ascii_alnum = uch < 0x80 && std::isalnum(uch) != 0;
    if (!ascii_alnum && ch != '.' && ch != '_' && ch != '-') {
      ch = '_';
    }
  }
  return out;
}

std::filesystem::path DefaultOutputDirectory(const std::filesystem::path& source) {
  const auto base_name = source.filename().string();
  return source.parent_path() / SanitizeDirectoryName(base_name + "_split");
}

std::string PartFileName(std::string_view base_name, std::uint64_t index) {
  std::string digits = std::to_string(index);
  if (digits.size() < static_cast<std::size_t>(kMinPartIndexDigits)) {
    digits.insert(0, static_cast<std::size_t>(kMinPartIndexDigits) - digits.size(), '0');
  }
  return std::string(base_name) + ".part" + digits;
}

SplitResult Split(const std::filesystem::path& source, const SplitOptions& options) {
  if (options.chunk_size == 0) {
    throw SplitterError(ErrorCode::kInvalidArgument, "chunk size must be positive");
  }
  if (options.block_size == 0) {
    throw SplitterError(ErrorCode::kInvalidArgument, "block size must be positive");
  }

  std::error_code ec;
  const auto status = std::filesystem::status(source, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    throw SplitterError(ErrorCode::kNotFound, "source file not found: " + source.string(), source);
  }
  if (ec) {
    throw SplitterError(ErrorCode::kIOError, "failed to stat " + source.string() + ": " + ec.message(), source);
  }
  if (!std::filesystem::is_regular_file(status)) {
    throw SplitterError(ErrorCode::kInvalidArgument, "source is not a regular file: " + source.string(), source);
  }

  const auto base_name = source.filename().string();
  if (!IsValidUtf8(base_name)) {
    throw SplitterError(ErrorCode::kInvalidArgument,
                        "source file name is not valid UTF-8 and cannot be recorded in the manifest: " +
                            source.string(),
                        source);
  }
  const auto output_dir = options.output_dir.value_or(DefaultOutputDirectory(source));
  core::EnsureDirectory(output_dir);

  const std::uint64_t total_size = core::FileSize(source);
  auto in = core::OpenForRead(source);

  Manifest manifest{};
  manifest.original_filename = base_name;
  manifest.chunk_size_bytes = options.chunk_size;

  ProgressEvent started{};
  started.kind = ProgressKind::kStarted;
  started.bytes_total = total_size;
  Notify(options, started);

  // The block never needs to be larger than a chunk or the file itself.
  const auto block_len = static_cast<std::size_t>(
      std::max<std::uint64_t>(1, std::min<std::uint64_t>({options.block_size, options.chunk_size, total_size})));
  std::vector<std::byte> block(total_size > 0 ? block_len : 0);

  std::uint64_t bytes_done = 0;
  const auto on_bytes = [&](std::uint64_t count) {
    bytes_done += count;
    ProgressEvent event{};
    event.kind = ProgressKind::kBytes;
    event.bytes_done = bytes_done;
    event.bytes_total = total_size;
    event.part_index = manifest.parts.size() + 1;
    Notify(options, event);
  };

  std::uint64_t index = 1;
  while (bytes_done < total_size) {
    const auto part_size = std::min<std::uint64_t>(options.chunk_size, total_size - bytes_done);
    const auto part_path = output_dir / PartFileName(base_name, index);
    manifest.parts.push_back(WritePart(in, part_path, part_size, block, source, on_bytes));

    ProgressEvent completed{};
    completed.kind = ProgressKind::kPartCompleted;
    completed.bytes_done = bytes_done;
    completed.bytes_total = total_size;
    completed.part_index = index;
    completed.part_filename = manifest.parts.back().filename;
    completed.part_size = part_size;
    Notify(options, completed);
    ++index;
  }

  manifest.timestamp = LocalTimestamp();
  const auto manifest_path = output_dir / ManifestFileName(base_name);
  WriteManifest(manifest_path, manifest);

  ProgressEvent finished{};
  finished.kind = ProgressKind::kFinished;
  finished.bytes_done = bytes_done;
  finished.bytes_total = total_size;
  Notify(options, finished);

  return SplitResult{
      .manifest_path = manifest_path,
      .output_dir = output_dir,
      .manifest = std::move(manifest),
  };
}

}  // namespace splitcpp
