#include "progress_printer.hpp"

#include <cstdio>
#include <iterator>
#include <utility>

namespace splitcpp::cli {
namespace {

constexpr int kBarWidth = 30;

}  // namespace

std::string FormatBytes(std::uint64_t bytes) {
  static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
    value /= 1024.0;
    ++unit;
  }
  char buffer[32] = {};
  if (unit == 0) {
    std::snprintf(buffer, sizeof(buffer), "%llu %s", static_cast<unsigned long long>(bytes), kUnits[unit]);
  } else {
    std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, kUnits[unit]);
  }
  return buffer;
}

ProgressPrinter::ProgressPrinter(std::ostream& out, std::string label, std::string part_verb)
    : out_(out), label_(std::move(label)), part_verb_(std::move(part_verb)) {}

void ProgressPrinter::operator()(const ProgressEvent& event) {
  switch (event.kind) {
    case ProgressKind::kStarted:
      last_permille_ = -1;
      DrawBar(0, event.bytes_total);
      break;
    case ProgressKind::kBytes:
      DrawBar(event.bytes_done, event.bytes_total);
      break;
    case ProgressKind::kPartCompleted:
      if (bar_visible_) {
        out_ << "\r\033[K";
        bar_visible_ = false;
      }
      out_ << part_verb_ << " " << event.part_filename << " (" << FormatBytes(event.part_size) << ")\n";
      last_permille_ = -1;
      DrawBar(event.bytes_done, event.bytes_total);
      break;
    case ProgressKind::kFinished:
      last_permille_ = -1;
      DrawBar(event.bytes_done, event.bytes_total);
      out_ << "\n";
      bar_visible_ = false;
      break;
  }
  out_.flush();
}

void ProgressPrinter::DrawBar(std::uint64_t done, std::uint64_t total) {
  const double fraction = total == 0 ? 1.0 : static_cast<double>(done) / static_cast<double>(total);
  const int permille = static_cast<int>(fraction * 1000.0);
  if (permille == last_permille_) {
    return;
  }
  last_permille_ = permille;

  const int filled = static_cast<int>(fraction * kBarWidth);
  std::string bar(static_cast<std::size_t>(kBarWidth), ' ');
  for (int i = 0; i < filled && i < kBarWidth; ++i) {
    bar[static_cast<std::size_t>(i)] = '#';
  }
  char percent[16] = {};
  std::snprintf(percent, sizeof(percent), "%5.1f%%", fraction * 100.0);
  out_ << "\r" << label_ << " [" << bar << "] " << percent << " " << FormatBytes(done) << " / "
       << FormatBytes(total);
  bar_visible_ = true;
}

}  // namespace splitcpp::cli
