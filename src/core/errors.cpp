#include "splitcpp/errors.hpp"

#include <utility>

namespace splitcpp {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kFormatError:
      return "FormatError";
    case ErrorCode::kChecksumMismatch:
      return "ChecksumMismatch";
    case ErrorCode::kIOError:
      return "IOError";
  }
  return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message, std::filesystem::path path)
    : std::runtime_error(message), code_(code), path_(std::move(path)) {}

ChecksumMismatchError::ChecksumMismatchError(const std::string& prefix,
                                             std::string part_filename,
                                             std::string expected,
                                             std::string actual,
                                             std::filesystem::path path)
    : Error(ErrorCode::kChecksumMismatch,
            prefix + "checksum mismatch in " + part_filename + " (expected " + expected + ", got " + actual + ")",
            std::move(path)),
      part_filename_(std::move(part_filename)),
      expected_(std::move(expected)),
      actual_(std::move(actual)) {}

}  // namespace splitcpp
