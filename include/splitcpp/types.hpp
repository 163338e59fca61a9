#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace splitcpp {

inline constexpr std::uint64_t kDefaultChunkSize = 1024ULL * 1024ULL * 1024ULL;
inline constexpr std::size_t kDefaultSplitBlockSize = 8U * 1024U * 1024U;
inline constexpr std::size_t kDefaultJoinBlockSize = 1024U * 1024U;
inline constexpr int kMinPartIndexDigits = 3;

struct PartRecord {
  std::string filename;
  std::uint64_t size = 0;
  std::string md5;
};

struct Manifest {
  std::string original_filename;
  std::uint64_t chunk_size_bytes = 0;
  std::string timestamp;
  std::vector<PartRecord> parts;

  [[nodiscard]] std::uint64_t total_parts() const { return parts.size(); }
  [[nodiscard]] std::uint64_t total_size() const;
};

enum class ProgressKind {
  kStarted,
  kBytes,
  kPartCompleted,
  kFinished,
};

struct ProgressEvent {
  ProgressKind kind = ProgressKind::kBytes;
  std::uint64_t bytes_done = 0;
  std::uint64_t bytes_total = 0;
  // 1-based; zero for kStarted and kFinished.
  std::uint64_t part_index = 0;
  std::string part_filename;
  std::uint64_t part_size = 0;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

struct SplitOptions {
  std::uint64_t chunk_size = kDefaultChunkSize;
  std::optional<std::filesystem::path> output_dir;
  std::size_t block_size = kDefaultSplitBlockSize;
  ProgressCallback on_progress{};
};

struct SplitResult {
  std::filesystem::path manifest_path;
  std::filesystem::path output_dir;
  Manifest manifest;
};

struct JoinOptions {
  std::optional<std::filesystem::path> output_dir;
  std::size_t block_size = kDefaultJoinBlockSize;
  ProgressCallback on_progress{};
};

struct JoinResult {
  std::filesystem::path output_path;
  std::uint64_t bytes_written = 0;
  std::uint64_t parts_joined = 0;
};

enum class PartStatus {
  kOk,
  kMissing,
  kSizeMismatch,
  kChecksumMismatch,
};

struct PartVerification {
  PartRecord record;
  PartStatus status = PartStatus::kOk;
  std::uint64_t actual_size = 0;
  std::string actual_md5;
};

struct VerifyOptions {
  std::size_t block_size = kDefaultJoinBlockSize;
  ProgressCallback on_progress{};
};

struct VerifyReport {
  std::filesystem::path manifest_path;
  Manifest manifest;
  std::vector<PartVerification> parts;

  [[nodiscard]] bool ok() const;
};

}  // namespace splitcpp
