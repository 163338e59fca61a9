#include "file_io.hpp"

#include "splitcpp/errors.hpp"

#include <string>
#include <system_error>

namespace splitcpp::core {
namespace {

Error IoError(const std::string& message, const std::filesystem::path& path) {
  return Error(ErrorCode::kIOError, "io: " + message, path);
}

}  // namespace

std::uint64_t FileSize(const std::filesystem::path& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      throw Error(ErrorCode::kNotFound, "io: file not found: " + path.string(), path);
    }
    throw IoError("failed to read file size of " + path.string() + ": " + ec.message(), path);
  }
  return size;
}

std::ifstream OpenForRead(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec && ec != std::errc::no_such_file_or_directory) {
      throw IoError("failed to stat " + path.string() + ": " + ec.message(), path);
    }
    throw Error(ErrorCode::kNotFound, "io: file not found: " + path.string(), path);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IoError("failed to open file for read: " + path.string(), path);
  }
  return in;
}

std::ofstream OpenForWrite(const std::filesystem::path& path) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw IoError("failed to open file for write: " + path.string(), path);
  }
  return out;
}

void EnsureDirectory(const std::filesystem::path& path) {
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (!ec && std::filesystem::exists(status)) {
    if (!std::filesystem::is_directory(status)) {
      throw IoError("path exists and is not a directory: " + path.string(), path);
    }
    return;
  }
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw IoError("failed to create directory " + path.string() + ": " + ec.message(), path);
  }
}

std::size_t ReadBlock(std::istream& in, std::span<std::byte> block) {
  if (block.empty() || !in) {
    return 0;
  }
  in.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(block.size()));
  return static_cast<std::size_t>(in.gcount());
}

void WriteBlock(std::ostream& out, std::span<const std::byte> bytes, const std::filesystem::path& path) {
  if (bytes.empty()) {
    return;
  }
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    throw IoError("failed to write bytes to " + path.string(), path);
  }
}

void CloseOutput(std::ofstream& out, const std::filesystem::path& path) {
  out.flush();
  if (!out) {
    throw IoError("failed to flush " + path.string(), path);
  }
  out.close();
  if (out.fail()) {
    throw IoError("failed to close " + path.string(), path);
  }
}

}  // namespace splitcpp::core
