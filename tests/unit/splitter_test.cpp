#include "splitcpp/errors.hpp"
#include "splitcpp/manifest.hpp"
#include "splitcpp/splitter.hpp"

#include "../../src/core/md5.hpp"
#include "../test_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;

std::filesystem::path UniqueDir() {
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         ("splitcpp_splitter_test_" + std::to_string(static_cast<long long>(now)));
}

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::vector<std::byte> PatternBytes(std::uint64_t size, std::uint32_t seed) {
  std::vector<std::byte> out(static_cast<std::size_t>(size));
  std::uint32_t state = seed * 2654435761U + 1U;
  for (auto& value : out) {
    state = state * 1664525U + 1013904223U;
    value = static_cast<std::byte>(state >> 24U);
  }
  return out;
}

void WriteFile(const std::filesystem::path& path, const std::vector<std::byte>& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to create " + path.string());
  }
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    throw std::runtime_error("failed to write " + path.string());
  }
}

std::vector<std::byte> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open " + path.string());
  }
  std::vector<std::byte> out(static_cast<std::size_t>(std::filesystem::file_size(path)));
  in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  return out;
}

template <typename Fn>
splitcpp::ErrorCode ExpectError(Fn&& fn, const std::string& what) {
  try {
    fn();
  } catch (const splitcpp::Error& ex) {
    splitcpp::tests::LogKV("expected_error", ex.what());
    return ex.code();
  }
  throw std::runtime_error(what + ": expected splitcpp::Error");
}

void RunScenarioTenMiBInFourMiBChunks(const std::filesystem::path& dir) {
  splitcpp::tests::Log("scenario: 10 MiB split into 4 MiB chunks");
  const auto source = dir / "ten.bin";
  const auto data = PatternBytes(10 * kMiB, 10);
  WriteFile(source, data);

  splitcpp::SplitOptions options{};
  options.chunk_size = 4 * kMiB;
  options.block_size = 1 * kMiB;
  const auto result = splitcpp::Split(source, options);

  Require(result.output_dir == dir / "ten.bin_split", "default output dir must be <name>_split");
  Require(result.manifest_path == dir / "ten.bin_split" / "ten.bin.manifest.json", "manifest path mismatch");
  Require(std::filesystem::exists(result.manifest_path), "manifest must exist");

  const auto& manifest = result.manifest;
  Require(manifest.original_filename == "ten.bin", "original_filename mismatch");
  Require(manifest.total_parts() == 3, "expected 3 parts");
  Require(manifest.chunk_size_bytes == 4 * kMiB, "chunk_size_bytes mismatch");
  Require(!manifest.timestamp.empty(), "timestamp must be set");
  const std::uint64_t expected_sizes[] = {4 * kMiB, 4 * kMiB, 2 * kMiB};
  for (std::size_t i = 0; i < 3; ++i) {
    const auto& part = manifest.parts[i];
    Require(part.filename == splitcpp::PartFileName("ten.bin", i + 1), "part filename mismatch");
    Require(part.size == expected_sizes[i], "part size mismatch at " + std::to_string(i));
    const auto part_path = result.output_dir / part.filename;
    Require(std::filesystem::file_size(part_path) == part.size, "on-disk part size mismatch");
    Require(splitcpp::core::Md5Hex(splitcpp::core::Md5File(part_path, 64 * 1024)) == part.md5,
            "recorded md5 must match on-disk part");

    const auto part_bytes = ReadFile(part_path);
    const auto offset = static_cast<std::ptrdiff_t>(i * 4 * kMiB);
    Require(std::equal(part_bytes.begin(), part_bytes.end(), data.begin() + offset),
            "part content must be the exact slice of the source");
  }

  const auto reread = splitcpp::ReadManifest(result.manifest_path);
  Require(reread.total_parts() == 3 && reread.total_size() == 10 * kMiB, "written manifest mismatch");
  Require(ReadFile(source) == data, "source must not be modified");
}

void RunScenarioChunkingGrid(const std::filesystem::path& dir) {
  splitcpp::tests::Log("scenario: chunking correctness");
  struct Case {
    std::uint64_t size;
    std::uint64_t chunk;
    std::size_t block;
  };
  const Case cases[] = {
      {1, 1, 8},      {1, 100, 8},   {100, 1, 8},   {100, 10, 3},   {100, 33, 7},
      {100, 100, 8},  {101, 100, 8}, {99, 100, 64}, {4096, 1000, 4096}, {5000, 1024, 1},
  };
  int case_index = 0;
  for (const auto& c : cases) {
    const auto case_dir = dir / ("grid_" + std::to_string(case_index++));
    std::filesystem::create_directories(case_dir);
    const auto source = case_dir / "data.bin";
    WriteFile(source, PatternBytes(c.size, static_cast<std::uint32_t>(c.size + c.chunk)));

    splitcpp::SplitOptions options{};
    options.chunk_size = c.chunk;
    options.block_size = c.block;
    options.output_dir = case_dir / "out";
    const auto result = splitcpp::Split(source, options);

    const auto expected_parts = (c.size + c.chunk - 1) / c.chunk;
    const std::string label = "size=" + std::to_string(c.size) + " chunk=" + std::to_string(c.chunk);
    Require(result.manifest.total_parts() == expected_parts, label + ": part count must be ceil(S / C)");
    Require(result.manifest.total_size() == c.size, label + ": part sizes must sum to the source size");
    for (std::size_t i = 0; i < result.manifest.parts.size(); ++i) {
      const bool last = i + 1 == result.manifest.parts.size();
      const auto expected = last ? c.size - c.chunk * (expected_parts - 1) : c.chunk;
      Require(result.manifest.parts[i].size == expected, label + ": part size mismatch");
    }
  }
}

void RunScenarioDeterminism(const std::filesystem::path& dir) {
  splitcpp::tests::Log("scenario: determinism");
  const auto source = dir / "same.bin";
  WriteFile(source, PatternBytes(70'000, 3));

  splitcpp::SplitOptions first{};
  first.chunk_size = 16'384;
  first.block_size = 1000;
  first.output_dir = dir / "same_a";
  splitcpp::SplitOptions second = first;
  second.block_size = 65'536;
  second.output_dir = dir / "same_b";

  const auto a = splitcpp::Split(source, first);
  const auto b = splitcpp::Split(source, second);
  Require(a.manifest.parts.size() == b.manifest.parts.size(), "part count must be deterministic");
  for (std::size_t i = 0; i < a.manifest.parts.size(); ++i) {
    Require(a.manifest.parts[i].filename == b.manifest.parts[i].filename, "part names must be deterministic");
    Require(a.manifest.parts[i].size == b.manifest.parts[i].size, "part sizes must be deterministic");
    Require(a.manifest.parts[i].md5 == b.manifest.parts[i].md5, "checksums must not depend on block size");
  }
}

void RunScenarioEmptySource(const std::filesystem::path& dir) {
  splitcpp::tests::Log("scenario: zero-byte source");
  const auto source = dir / "empty.dat";
  WriteFile(source, {});

  splitcpp::SplitOptions options{};
  options.chunk_size = 1024;
  const auto result = splitcpp::Split(source, options);
  Require(result.manifest.total_parts() == 0, "zero-byte source must yield zero parts");
  Require(result.manifest.chunk_size_bytes == 1024, "chunk size must still be recorded");

  const auto reread = splitcpp::ReadManifest(result.manifest_path);
  Require(reread.parts.empty(), "written manifest must list no parts");
  std::size_t entries = 0;
  for (const auto& entry : std::filesystem::directory_iterator(result.output_dir)) {
    (void)entry;
    ++entries;
  }
  Require(entries == 1, "only the manifest may be written for an empty source");
}

void RunScenarioProgressEvents(const std::filesystem::path& dir) {
  splitcpp::tests::Log("scenario: progress events");
  const auto source = dir / "progress.bin";
  WriteFile(source, PatternBytes(2500, 9));

  std::vector<splitcpp::ProgressEvent> events;
  splitcpp::SplitOptions options{};
  options.chunk_size = 1000;
  options.block_size = 300;
  options.output_dir = dir / "progress_out";
  options.on_progress = [&events](const splitcpp::ProgressEvent& event) { events.push_back(event); };
  (void)splitcpp::Split(source, options);

  Require(!events.empty() && events.front().kind == splitcpp::ProgressKind::kStarted, "first event must be kStarted");
  Require(events.back().kind == splitcpp::ProgressKind::kFinished, "last event must be kFinished");
  Require(events.back().bytes_done == 2500 && events.back().bytes_total == 2500, "final progress mismatch");

  std::vector<std::string> completed;
  std::uint64_t last_done = 0;
  for (const auto& event : events) {
    Require(event.bytes_done >= last_done, "progress must be monotonic");
    last_done = event.bytes_done;
    if (event.kind == splitcpp::ProgressKind::kPartCompleted) {
      completed.push_back(event.part_filename);
    }
  }
  Require(completed.size() == 3, "one completion per part expected");
  Require(completed[0] == "progress.bin.part001" && completed[2] == "progress.bin.part003",
          "completions must follow part order");
}

void RunScenarioErrors(const std::filesystem::path& dir) {
  splitcpp::tests::Log("scenario: errors");
  const auto missing = dir / "does_not_exist.bin";
  Require(ExpectError([&] { (void)splitcpp::Split(missing); }, "missing source") == splitcpp::ErrorCode::kNotFound,
          "missing source must fail with NotFound");

  const auto source = dir / "err.bin";
  WriteFile(source, PatternBytes(10, 1));

  splitcpp::SplitOptions zero_chunk{};
  zero_chunk.chunk_size = 0;
  zero_chunk.output_dir = dir / "zero_chunk_out";
  Require(ExpectError([&] { (void)splitcpp::Split(source, zero_chunk); }, "zero chunk") ==
              splitcpp::ErrorCode::kInvalidArgument,
          "zero chunk size must fail with InvalidArgument");
  Require(!std::filesystem::exists(dir / "zero_chunk_out"), "invalid arguments must be rejected before any I/O");

  splitcpp::SplitOptions zero_block{};
  zero_block.block_size = 0;
  Require(ExpectError([&] { (void)splitcpp::Split(source, zero_block); }, "zero block") ==
              splitcpp::ErrorCode::kInvalidArgument,
          "zero block size must fail with InvalidArgument");

  Require(ExpectError([&] { (void)splitcpp::Split(dir); }, "directory source") ==
              splitcpp::ErrorCode::kInvalidArgument,
          "directory source must fail with InvalidArgument");

  const auto collision = dir / "not_a_dir";
  WriteFile(collision, PatternBytes(1, 2));
  splitcpp::SplitOptions colliding{};
  colliding.chunk_size = 4;
  colliding.output_dir = collision;
  Require(ExpectError([&] { (void)splitcpp::Split(source, colliding); }, "output collision") ==
              splitcpp::ErrorCode::kIOError,
          "output path collision must fail with IOError");
  std::error_code ec;
  Require(!std::filesystem::exists(collision / "err.bin.manifest.json", ec), "no manifest may be written on failure");
}

void RunScenarioNonUtf8SourceName(const std::filesystem::path& dir) {
  splitcpp::tests::Log("scenario: source name that is not UTF-8");
  const auto source = dir / std::string("caf\xe9.bin");
  WriteFile(source, PatternBytes(10, 4));

  splitcpp::SplitOptions options{};
  options.chunk_size = 4;
  Require(ExpectError([&] { (void)splitcpp::Split(source, options); }, "non-UTF-8 name") ==
              splitcpp::ErrorCode::kInvalidArgument,
          "a name that cannot be written to the manifest must fail with InvalidArgument");
  std::error_code ec;
  Require(!std::filesystem::exists(splitcpp::DefaultOutputDirectory(source), ec),
          "the name must be rejected before any part is written");
}

}  // namespace

int main() {
  const auto dir = UniqueDir();
  try {
    splitcpp::tests::Log("splitter_test: start");
    splitcpp::tests::LogKV("splitter_test_dir", dir.string());
    std::filesystem::create_directories(dir);

    RunScenarioTenMiBInFourMiBChunks(dir);
    RunScenarioChunkingGrid(dir);
    RunScenarioDeterminism(dir);
    RunScenarioEmptySource(dir);
    RunScenarioProgressEvents(dir);
    RunScenarioErrors(dir);
    RunScenarioNonUtf8SourceName(dir);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    splitcpp::tests::Log("splitter_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    splitcpp::tests::LogError(ex.what());
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return EXIT_FAILURE;
  }
}
