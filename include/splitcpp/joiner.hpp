#pragma once

#include "splitcpp/types.hpp"

#include <filesystem>
#include <string_view>

namespace splitcpp {

[[nodiscard]] JoinResult Join(const std::filesystem::path& manifest_path, const JoinOptions& options = {});

// Checks every part without writing output. Does not stop at the first bad part.
[[nodiscard]] VerifyReport VerifyParts(const std::filesystem::path& manifest_path, const VerifyOptions& options = {});

[[nodiscard]] std::string_view PartStatusName(PartStatus status);

}  // namespace splitcpp
