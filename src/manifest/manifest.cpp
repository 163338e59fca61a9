#include "splitcpp/manifest.hpp"

#include "splitcpp/errors.hpp"

#include "../core/file_io.hpp"
#include "../core/md5.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <system_error>

namespace splitcpp {
namespace {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

constexpr const char* kOriginalFilenameKey = "original_filename";
constexpr const char* kTotalPartsKey = "total_parts";
constexpr const char* kChunkSizeKey = "chunk_size_bytes";
constexpr const char* kTimestampKey = "timestamp";
constexpr const char* kPartsKey = "parts";
constexpr const char* kPartFilenameKey = "filename";
constexpr const char* kPartSizeKey = "size";
constexpr const char* kPartMd5Key = "md5";

Error FormatError(const std::string& message, const std::filesystem::path& path = {}) {
  return Error(ErrorCode::kFormatError, "manifest: " + message, path);
}

Error IoError(const std::string& message, const std::filesystem::path& path) {
  return Error(ErrorCode::kIOError, "manifest: " + message, path);
}

const json& RequireField(const json& object, const char* key, const std::string& where) {
  const auto it = object.find(key);
  if (it == object.end()) {
    throw FormatError(where + " missing required field '" + key + "'");
  }
  return *it;
}

std::string RequireString(const json& object, const char* key, const std::string& where) {
  const auto& value = RequireField(object, key, where);
  if (!value.is_string()) {
    throw FormatError(where + " field '" + key + "' must be a string");
  }
  return value.get<std::string>();
}

std::uint64_t RequireUnsigned(const json& object, const char* key, const std::string& where) {
  const auto& value = RequireField(object, key, where);
  if (!value.is_number_integer()) {
    throw FormatError(where + " field '" + key + "' must be an integer");
  }
  if (!value.is_number_unsigned()) {
    throw FormatError(where + " field '" + key + "' must not be negative");
  }
  return value.get<std::uint64_t>();
}

// Parts and the reconstructed file live beside the manifest; anything that
// could address another directory is rejected.
bool IsBareFileName(const std::string& name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return std::none_of(name.begin(), name.end(), [](char ch) { return ch == '/' || ch == '\\' || ch == '\0'; });
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value;
}

PartRecord DecodePart(const json& entry, std::size_t index) {
  const std::string where = "parts[" + std::to_string(index) + "]";
  if (!entry.is_object()) {
    throw FormatError(where + " must be an object");
  }
  PartRecord part{};
  part.filename = RequireString(entry, kPartFilenameKey, where);
  part.size = RequireUnsigned(entry, kPartSizeKey, where);
  part.md5 = ToLower(RequireString(entry, kPartMd5Key, where));
  if (!IsBareFileName(part.filename)) {
    throw FormatError(where + " filename is not a bare file name: '" + part.filename + "'");
  }
  if (!core::IsMd5Hex(part.md5)) {
    throw FormatError(where + " md5 is not a 32-character hex digest: '" + part.md5 + "'");
  }
  return part;
}

void ValidateChunking(const Manifest& manifest) {
  const auto count = manifest.parts.size();
  for (std::size_t i = 0; i < count; ++i) {
    const auto& part = manifest.parts[i];
    const bool last = i + 1 == count;
    if (!last && part.size != manifest.chunk_size_bytes) {
      throw FormatError("part " + part.filename + " has size " + std::to_string(part.size) +
                        " but every part before the last must be " + std::to_string(manifest.chunk_size_bytes) +
                        " bytes");
    }
    if (last && part.size > manifest.chunk_size_bytes) {
      throw FormatError("last part " + part.filename + " exceeds chunk_size_bytes");
    }
  }
}

}  // namespace

std::uint64_t Manifest::total_size() const {
  std::uint64_t total = 0;
  for (const auto& part : parts) {
    if (part.size > std::numeric_limits<std::uint64_t>::max() - total) {
      throw FormatError("total size overflows 64 bits");
    }
    total += part.size;
  }
  return total;
}

bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    std::uint32_t min_code = 0;
    std::uint32_t code = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0U) == 0xC0U) {
      extra = 1;
      min_code = 0x80;
      code = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
      extra = 2;
      min_code = 0x800;
      code = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
      extra = 3;
      min_code = 0x10000;
      code = lead & 0x07U;
    } else {
      return false;
    }
    if (extra >= text.size() - i) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0U) != 0x80U) {
        return false;
      }
      code = (code << 6U) | (next & 0x3FU);
    }
    // Overlong forms, UTF-16 surrogates and values past U+10FFFF.
    if (code < min_code || (code >= 0xD800 && code <= 0xDFFF) || code > 0x10FFFF) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

std::string ManifestFileName(std::string_view original_filename) {
  return std::string(original_filename) + ".manifest.json";
}

std::string EncodeManifestJson(const Manifest& manifest) {
  ordered_json doc;
  doc[kOriginalFilenameKey] = manifest.original_filename;
  doc[kTotalPartsKey] = manifest.total_parts();
  doc[kChunkSizeKey] = manifest.chunk_size_bytes;
  doc[kTimestampKey] = manifest.timestamp;
  doc[kPartsKey] = ordered_json::array();
  for (const auto& part : manifest.parts) {
    ordered_json entry;
    entry[kPartFilenameKey] = part.filename;
    entry[kPartSizeKey] = part.size;
    entry[kPartMd5Key] = part.md5;
    doc[kPartsKey].push_back(std::move(entry));
  }
  try {
    return doc.dump(2) + "\n";
  } catch (const json::type_error& ex) {
    throw Error(ErrorCode::kInvalidArgument, std::string("manifest: cannot encode as JSON: ") + ex.what());
  }
}

Manifest DecodeManifestJson(std::string_view json_text) {
  json doc;
  try {
    doc = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error& ex) {
    throw FormatError(std::string("invalid JSON: ") + ex.what());
  }
  if (!doc.is_object()) {
    throw FormatError("top-level value must be an object");
  }

  const std::string where = "manifest";
  Manifest manifest{};
  manifest.original_filename = RequireString(doc, kOriginalFilenameKey, where);
  const auto total_parts = RequireUnsigned(doc, kTotalPartsKey, where);
  manifest.chunk_size_bytes = RequireUnsigned(doc, kChunkSizeKey, where);
  manifest.timestamp = RequireString(doc, kTimestampKey, where);

  const auto& parts = RequireField(doc, kPartsKey, where);
  if (!parts.is_array()) {
    throw FormatError("field 'parts' must be an array");
  }
  if (!IsBareFileName(manifest.original_filename)) {
    throw FormatError("original_filename is not a bare file name: '" + manifest.original_filename + "'");
  }
  if (manifest.chunk_size_bytes == 0) {
    throw FormatError("chunk_size_bytes must be positive");
  }
  if (total_parts != parts.size()) {
    throw FormatError("total_parts is " + std::to_string(total_parts) + " but parts lists " +
                      std::to_string(parts.size()) + " entries");
  }

  manifest.parts.reserve(parts.size());
  for (std::size_t i = 0; i < parts.size(); ++i) {
    manifest.parts.push_back(DecodePart(parts[i], i));
  }
  ValidateChunking(manifest);
  // Rejects part sizes whose sum overflows.
  (void)manifest.total_size();
  return manifest;
}

Manifest ReadManifest(const std::filesystem::path& path) {
  auto in = core::OpenForRead(path);
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw IoError("failed to read " + path.string(), path);
  }
  try {
    return DecodeManifestJson(text);
  } catch (const Error& ex) {
    throw Error(ex.code(), std::string(ex.what()) + " [" + path.string() + "]", path);
  }
}

void WriteManifest(const std::filesystem::path& path, const Manifest& manifest) {
  const std::string text = EncodeManifestJson(manifest);
  auto temp_path = path;
  temp_path += ".tmp";

  try {
    auto out = core::OpenForWrite(temp_path);
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out) {
      throw IoError("failed to write " + temp_path.string(), temp_path);
    }
    core::CloseOutput(out, temp_path);
  } catch (const Error&) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw;
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw IoError("failed to move manifest into place at " + path.string() + ": " + ec.message(), path);
  }
}

}  // namespace splitcpp
