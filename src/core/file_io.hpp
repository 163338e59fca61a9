#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <span>

namespace splitcpp::core {

// Failures surface as splitcpp::Error: kNotFound for a missing input, kIOError
// for everything the filesystem refuses.

[[nodiscard]] std::uint64_t FileSize(const std::filesystem::path& path);

[[nodiscard]] std::ifstream OpenForRead(const std::filesystem::path& path);
[[nodiscard]] std::ofstream OpenForWrite(const std::filesystem::path& path);

// Creates path and any missing ancestors. An existing non-directory is an error.
void EnsureDirectory(const std::filesystem::path& path);

// Reads up to block.size() bytes; returns the count read, zero at end of stream.
std::size_t ReadBlock(std::istream& in, std::span<std::byte> block);

void WriteBlock(std::ostream& out, std::span<const std::byte> bytes, const std::filesystem::path& path);

// Flushes and closes, reporting a failed flush as an I/O error.
void CloseOutput(std::ofstream& out, const std::filesystem::path& path);

}  // namespace splitcpp::core
