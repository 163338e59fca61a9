#pragma once

#include "splitcpp/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace splitcpp {

[[nodiscard]] SplitResult Split(const std::filesystem::path& source, const SplitOptions& options = {});

// Accepts byte counts and K/M/G binary suffixes ("4096", "500M", "1.5G").
[[nodiscard]] std::uint64_t ParseChunkSize(std::string_view text);

// Replaces every character outside [A-Za-z0-9._-] with '_'.
[[nodiscard]] std::string SanitizeDirectoryName(std::string_view name);

[[nodiscard]] std::filesystem::path DefaultOutputDirectory(const std::filesystem::path& source);

// "<base_name>.part001", "<base_name>.part002", ...
[[nodiscard]] std::string PartFileName(std::string_view base_name, std::uint64_t index);

}  // namespace splitcpp
