#include "print.hpp"

#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "devready/common/diagnostic.hpp"

namespace devready::driver {

namespace {

bool color_enabled = true;

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto Style(fmt::text_style style) -> fmt::text_style {
  return color_enabled ? style : fmt::text_style{};
}

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

void PrintDiagItem(const DiagItem& item, bool is_primary) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("devready", Style(kToolStyle)),
      fmt::styled(
          DiagKindToString(item.kind), Style(DiagKindToStyle(item.kind))),
      fmt::styled(
          item.message,
          is_primary ? Style(fmt::emphasis::bold) : fmt::text_style{}));
}

}  // namespace

void SetColorEnabled(bool enabled) {
  color_enabled = enabled;
}

void PrintError(const std::string& message) {
  PrintDiagItem(DiagItem{.kind = DiagKind::kHostError, .message = message},
                true);
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, false);
  }
}

}  // namespace devready::driver
