#pragma once

#include "splitcpp/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace splitcpp {

// "<original_filename>.manifest.json"
[[nodiscard]] std::string ManifestFileName(std::string_view original_filename);

// Manifest JSON is UTF-8; names that are not valid UTF-8 cannot be recorded.
[[nodiscard]] bool IsValidUtf8(std::string_view text);

[[nodiscard]] std::string EncodeManifestJson(const Manifest& manifest);
[[nodiscard]] Manifest DecodeManifestJson(std::string_view json_text);

[[nodiscard]] Manifest ReadManifest(const std::filesystem::path& path);

// Writes through a sibling temporary file renamed into place, so the manifest
// only ever appears complete.
void WriteManifest(const std::filesystem::path& path, const Manifest& manifest);

}  // namespace splitcpp
