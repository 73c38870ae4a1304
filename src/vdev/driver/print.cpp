#include "print.hpp"

#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "vdev/common/diagnostic.hpp"

namespace vdev::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

void PrintLine(
    const char* label, fmt::text_style label_style, const std::string& message,
    fmt::text_style message_style) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("vdev", kToolStyle),
      fmt::styled(label, label_style), fmt::styled(message, message_style));
}

}  // namespace

void PrintError(const std::string& message) {
  PrintLine(
      "error:", fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold,
      message, fmt::emphasis::bold);
}

void PrintWarning(const std::string& message) {
  PrintLine(
      "warning:",
      fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold,
      message, fmt::emphasis::bold);
}

void PrintNote(const std::string& message) {
  PrintLine(
      "note:", fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold,
      message, fmt::text_style{});
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintError(diag.message);
  for (const auto& note : diag.notes) {
    if (!note.empty()) {
      PrintNote(note);
    }
  }
}

}  // namespace vdev::driver
