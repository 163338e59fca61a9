#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace splitcpp {

enum class ErrorCode {
  kInvalidArgument,
  kNotFound,
  kFormatError,
  kChecksumMismatch,
  kIOError,
};

[[nodiscard]] std::string_view ErrorCodeName(ErrorCode code);

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message, std::filesystem::path path = {});

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  ErrorCode code_;
  std::filesystem::path path_;
};

// Raised by Join when a part's on-disk digest differs from its manifest record.
class ChecksumMismatchError : public Error {
 public:
  ChecksumMismatchError(const std::string& prefix,
                        std::string part_filename,
                        std::string expected,
                        std::string actual,
                        std::filesystem::path path);

  [[nodiscard]] const std::string& part_filename() const noexcept { return part_filename_; }
  [[nodiscard]] const std::string& expected() const noexcept { return expected_; }
  [[nodiscard]] const std::string& actual() const noexcept { return actual_; }

 private:
  std::string part_filename_;
  std::string expected_;
  std::string actual_;
};

}  // namespace splitcpp
