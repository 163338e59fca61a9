#pragma once

#include "splitcpp/types.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace splitcpp::cli {

[[nodiscard]] std::string FormatBytes(std::uint64_t bytes);

// Renders progress events as a single-line bar plus one line per finished part.
class ProgressPrinter {
 public:
  ProgressPrinter(std::ostream& out, std::string label, std::string part_verb);

  void operator()(const ProgressEvent& event);

 private:
  void DrawBar(std::uint64_t done, std::uint64_t total);

  std::ostream& out_;
  std::string label_;
  std::string part_verb_;
  int last_permille_ = -1;
  bool bar_visible_ = false;
};

}  // namespace splitcpp::cli
