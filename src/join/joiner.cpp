#include "splitcpp/joiner.hpp"

#include "splitcpp/errors.hpp"
#include "splitcpp/manifest.hpp"

#include "../core/file_io.hpp"
#include "../core/md5.hpp"

#include <algorithm>
#include <span>
#include <system_error>
#include <vector>

namespace splitcpp {
namespace {

Error JoinerError(ErrorCode code, const std::string& message, const std::filesystem::path& path = {}) {
  return Error(code, "joiner: " + message, path);
}

void Notify(const ProgressCallback& callback, ProgressEvent event) {
  if (callback) {
    callback(event);
  }
}

std::filesystem::path ManifestDirectory(const std::filesystem::path& manifest_path) {
  auto dir = manifest_path.parent_path();
  if (dir.empty()) {
    dir = ".";
  }
  return dir;
}

std::filesystem::path RequirePart(const std::filesystem::path& base_dir, const PartRecord& part) {
  const auto part_path = base_dir / part.filename;
  std::error_code ec;
  const auto status = std::filesystem::status(part_path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    throw JoinerError(ErrorCode::kNotFound, "missing part: " + part.filename, part_path);
  }
  if (ec) {
    throw JoinerError(ErrorCode::kIOError, "failed to stat part " + part.filename + ": " + ec.message(), part_path);
  }
  if (!std::filesystem::is_regular_file(status)) {
    throw JoinerError(ErrorCode::kIOError, "part is not a regular file: " + part.filename, part_path);
  }
  return part_path;
}

// Digest is taken over the whole current file, so a truncated or extended part
// is reported as a checksum mismatch as well.
void VerifyChecksum(const std::filesystem::path& part_path, const PartRecord& part, std::size_t block_size) {
  const auto actual = core::Md5Hex(core::Md5File(part_path, block_size));
  if (actual != part.md5) {
    throw ChecksumMismatchError("joiner: ", part.filename, part.md5, actual, part_path);
  }
}

void AppendPart(std::ofstream& out,
                const std::filesystem::path& output_path,
                const std::filesystem::path& part_path,
                std::vector<std::byte>& block,
                const std::function<void(std::uint64_t)>& on_bytes) {
  auto in = core::OpenForRead(part_path);
  while (true) {
    const auto got = core::ReadBlock(in, block);
    if (got == 0) {
      break;
    }
    core::WriteBlock(out, std::span<const std::byte>(block.data(), got), output_path);
    on_bytes(got);
  }
  if (in.bad()) {
    throw JoinerError(ErrorCode::kIOError, "failed to read part " + part_path.string(), part_path);
  }
}

// Opening the output truncates it, so it must not be one of the inputs.
void RejectOutputOverlap(const std::filesystem::path& output_path,
                         const std::filesystem::path& manifest_path,
                         const std::filesystem::path& base_dir,
                         const Manifest& manifest) {
  std::error_code ec;
  const auto target = std::filesystem::weakly_canonical(output_path, ec);
  if (ec) {
    throw JoinerError(ErrorCode::kIOError,
                      "failed to resolve output path " + output_path.string() + ": " + ec.message(), output_path);
  }
  const auto same_as = [&](const std::filesystem::path& input) {
    std::error_code input_ec;
    const auto canonical = std::filesystem::weakly_canonical(input, input_ec);
    return !input_ec && canonical == target;
  };
  if (same_as(manifest_path)) {
    throw JoinerError(ErrorCode::kIOError, "output path would overwrite the manifest: " + output_path.string(),
                      output_path);
  }
  for (const auto& part : manifest.parts) {
    if (same_as(base_dir / part.filename)) {
      throw JoinerError(ErrorCode::kIOError, "output path would overwrite part " + part.filename, output_path);
    }
  }
}

}  // namespace

std::string_view PartStatusName(PartStatus status) {
  switch (status) {
    case PartStatus::kOk:
      return "ok";
    case PartStatus::kMissing:
      return "missing";
    case PartStatus::kSizeMismatch:
      return "size mismatch";
    case PartStatus::kChecksumMismatch:
      return "checksum mismatch";
  }
  return "unknown";
}

bool VerifyReport::ok() const {
  return std::all_of(parts.begin(), parts.end(),
                     [](const PartVerification& part) { return part.status == PartStatus::kOk; });
}

JoinResult Join(const std::filesystem::path& manifest_path, const JoinOptions& options) {
  if (options.block_size == 0) {
    throw JoinerError(ErrorCode::kInvalidArgument, "block size must be positive");
  }

  const Manifest manifest = ReadManifest(manifest_path);
  const auto base_dir = ManifestDirectory(manifest_path);
  const auto output_dir = options.output_dir.value_or(base_dir);
  core::EnsureDirectory(output_dir);
  const auto output_path = output_dir / manifest.original_filename;

  RejectOutputOverlap(output_path, manifest_path, base_dir, manifest);

  const std::uint64_t total_size = manifest.total_size();
  auto out = core::OpenForWrite(output_path);

  ProgressEvent started{};
  started.kind = ProgressKind::kStarted;
  started.bytes_total = total_size;
  Notify(options.on_progress, started);

  std::vector<std::byte> block(options.block_size);
  std::uint64_t bytes_done = 0;
  std::uint64_t index = 0;
  const auto on_bytes = [&](std::uint64_t count) {
    bytes_done += count;
    ProgressEvent event{};
    event.kind = ProgressKind::kBytes;
    event.bytes_done = bytes_done;
    event.bytes_total = total_size;
    event.part_index = index;
    Notify(options.on_progress, event);
  };

  for (const auto& part : manifest.parts) {
    ++index;
    const auto part_path = RequirePart(base_dir, part);
    VerifyChecksum(part_path, part, options.block_size);
    AppendPart(out, output_path, part_path, block, on_bytes);

    ProgressEvent merged{};
    merged.kind = ProgressKind::kPartCompleted;
    merged.bytes_done = bytes_done;
    merged.bytes_total = total_size;
    merged.part_index = index;
    merged.part_filename = part.filename;
    merged.part_size = part.size;
    Notify(options.on_progress, merged);
  }
  core::CloseOutput(out, output_path);

  ProgressEvent finished{};
  finished.kind = ProgressKind::kFinished;
  finished.bytes_done = bytes_done;
  finished.bytes_total = total_size;
  Notify(options.on_progress, finished);

  return JoinResult{
      .output_path = output_path,
      .bytes_written = bytes_done,
      .parts_joined = index,
  };
}

VerifyReport VerifyParts(const std::filesystem::path& manifest_path, const VerifyOptions& options) {
  if (options.block_size == 0) {
    throw JoinerError(ErrorCode::kInvalidArgument, "block size must be positive");
  }

  VerifyReport report{};
  report.manifest_path = manifest_path;
  report.manifest = ReadManifest(manifest_path);
  const auto base_dir = ManifestDirectory(manifest_path);
  const std::uint64_t total_size = report.manifest.total_size();

  ProgressEvent started{};
  started.kind = ProgressKind::kStarted;
  started.bytes_total = total_size;
  Notify(options.on_progress, started);

  std::uint64_t bytes_done = 0;
  std::uint64_t index = 0;
  for (const auto& part : report.manifest.parts) {
    ++index;
    PartVerification check{};
    check.record = part;
    const auto part_path = base_dir / part.filename;

    std::error_code ec;
    const auto status = std::filesystem::status(part_path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
      check.status = PartStatus::kMissing;
    } else if (ec || !std::filesystem::is_regular_file(status)) {
      throw JoinerError(ErrorCode::kIOError, "part is unreadable or not a regular file: " + part.filename,
                        part_path);
    } else {
      check.actual_size = core::FileSize(part_path);
      check.actual_md5 = core::Md5Hex(core::Md5File(part_path, options.block_size));
      if (check.actual_size != part.size) {
        check.status = PartStatus::kSizeMismatch;
      } else if (check.actual_md5 != part.md5) {
        check.status = PartStatus::kChecksumMismatch;
      }
    }
    bytes_done += part.size;

    ProgressEvent checked{};
    checked.kind = ProgressKind::kPartCompleted;
    checked.bytes_done = bytes_done;
    checked.bytes_total = total_size;
    checked.part_index = index;
    checked.part_filename = part.filename;
    checked.part_size = part.size;
    Notify(options.on_progress, checked);

    report.parts.push_back(std::move(check));
  }

  ProgressEvent finished{};
  finished.kind = ProgressKind::kFinished;
  finished.bytes_done = bytes_done;
  finished.bytes_total = total_size;
  Notify(options.on_progress, finished);
  return report;
}

}  // namespace splitcpp
